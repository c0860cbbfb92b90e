#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace signalrelay::relay {

// Fixed one-second window per peer id. Not thread-safe; the owning room
// serializes access.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kWindowLength{1000};
    static constexpr unsigned kDefaultLimit = 10;

    explicit RateLimiter(unsigned limit_per_window = kDefaultLimit);

    bool allow(const std::string& peer_id, Clock::time_point now);
    void forget(const std::string& peer_id);

    unsigned limit() const noexcept { return limit_; }
    std::size_t tracked() const noexcept { return windows_.size(); }

private:
    struct Window {
        unsigned count = 0;
        Clock::time_point start{};
    };

    unsigned limit_;
    std::unordered_map<std::string, Window> windows_;
};

} // namespace signalrelay::relay
