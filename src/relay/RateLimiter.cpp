#include "relay/RateLimiter.h"

#include <stdexcept>

namespace signalrelay::relay {

RateLimiter::RateLimiter(unsigned limit_per_window) : limit_(limit_per_window) {
    if (limit_ == 0) throw std::invalid_argument("rate limit must be positive");
}

bool RateLimiter::allow(const std::string& peer_id, Clock::time_point now) {
    // A missing window (new peer, or state dropped) starts fresh at `now`.
    auto [it, inserted] = windows_.try_emplace(peer_id, Window{0, now});
    Window& w = it->second;

    if (!inserted && now - w.start >= kWindowLength) {
        w.count = 0;
        w.start = now;
    }

    ++w.count;
    return w.count <= limit_;
}

void RateLimiter::forget(const std::string& peer_id) {
    windows_.erase(peer_id);
}

} // namespace signalrelay::relay
