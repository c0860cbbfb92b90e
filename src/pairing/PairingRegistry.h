#pragma once

#include "lifecycle/LifecycleScheduler.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/json/value.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace signalrelay::pairing {

// Pairing code -> connection info, each entry with its own expiry.
// Expired entries are invisible to lookups and removed either on read or by
// the sweep that the registry schedules for itself.
class PairingRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    static constexpr double kDefaultTtlSeconds = 300.0;
    static constexpr std::chrono::milliseconds kSweepGrace{1000};
    // Longer lifetimes, including infinity, are cut down to this.
    static constexpr double kMaxTtlSeconds = 365.0 * 24 * 60 * 60;

    struct LookupResult {
        enum class Status { Found, NotFound, Expired };

        Status status = Status::NotFound;
        boost::json::value info;

        bool found() const noexcept { return status == Status::Found; }
    };

    PairingRegistry(boost::asio::any_io_executor executor,
                    double default_ttl_seconds = kDefaultTtlSeconds,
                    NowFn now = &Clock::now);

    PairingRegistry(const PairingRegistry&) = delete;
    PairingRegistry& operator=(const PairingRegistry&) = delete;

    // `ttl_seconds <= 0` selects the default TTL; anything above
    // kMaxTtlSeconds is capped. Overwrites any entry already stored under `code`.
    void register_code(const std::string& code, boost::json::value info, double ttl_seconds = 0);

    LookupResult lookup(const std::string& code);

    // Removes every expired entry; returns how many went.
    std::size_t sweep();

    std::size_t stored_count() const;
    bool holds(const std::string& code) const;
    std::optional<Clock::time_point> next_sweep() const;
    double default_ttl_seconds() const noexcept { return default_ttl_seconds_; }

private:
    struct Entry {
        boost::json::value info;
        Clock::time_point expires_at;
    };

    void on_sweep_deadline_();
    std::size_t sweep_locked_(Clock::time_point now);

    const double default_ttl_seconds_;
    NowFn now_;

    mutable std::mutex mu_;
    std::map<std::string, Entry> entries_;
    lifecycle::LifecycleScheduler sweep_timer_;
};

} // namespace signalrelay::pairing
