#include "pairing/PairingRegistry.h"

#include "util/Log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace signalrelay::pairing {

PairingRegistry::PairingRegistry(boost::asio::any_io_executor executor,
                                 double default_ttl_seconds,
                                 NowFn now)
    : default_ttl_seconds_(std::min(default_ttl_seconds, kMaxTtlSeconds)),
      now_(std::move(now)),
      sweep_timer_(std::move(executor)) {
    if (!(default_ttl_seconds_ > 0)) throw std::invalid_argument("pairing TTL must be positive");
    sweep_timer_.set_callback([this] { on_sweep_deadline_(); });
}

void PairingRegistry::register_code(const std::string& code, boost::json::value info, double ttl_seconds) {
    const double ttl = ttl_seconds > 0 ? std::min(ttl_seconds, kMaxTtlSeconds) : default_ttl_seconds_;
    const auto now = now_();
    const auto expires_at =
        now + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(ttl));

    std::lock_guard<std::mutex> lk(mu_);
    entries_.insert_or_assign(code, Entry{std::move(info), expires_at});
    sweep_timer_.tighten(expires_at + kSweepGrace);
    util::debug("[pairing] registered code " + code);
}

PairingRegistry::LookupResult PairingRegistry::lookup(const std::string& code) {
    LookupResult result;
    const auto now = now_();

    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(code);
    if (it == entries_.end()) {
        result.status = LookupResult::Status::NotFound;
        return result;
    }
    if (now > it->second.expires_at) {
        entries_.erase(it);
        result.status = LookupResult::Status::Expired;
        return result;
    }

    result.status = LookupResult::Status::Found;
    result.info = it->second.info;
    return result;
}

std::size_t PairingRegistry::sweep() {
    const auto now = now_();
    std::lock_guard<std::mutex> lk(mu_);
    return sweep_locked_(now);
}

std::size_t PairingRegistry::stored_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

bool PairingRegistry::holds(const std::string& code) const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.count(code) != 0;
}

std::optional<PairingRegistry::Clock::time_point> PairingRegistry::next_sweep() const {
    return sweep_timer_.deadline();
}

void PairingRegistry::on_sweep_deadline_() {
    const auto now = now_();
    std::lock_guard<std::mutex> lk(mu_);
    const std::size_t removed = sweep_locked_(now);
    if (removed > 0) util::debug("[pairing] sweep removed " + std::to_string(removed) + " expired code(s)");

    // Re-arm for the earliest survivor so it does not wait for the next
    // registration to be collected.
    if (entries_.empty()) return;
    auto earliest = std::min_element(entries_.begin(), entries_.end(),
        [](const auto& a, const auto& b) { return a.second.expires_at < b.second.expires_at; });
    sweep_timer_.tighten(earliest->second.expires_at + kSweepGrace);
}

std::size_t PairingRegistry::sweep_locked_(Clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now > it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace signalrelay::pairing
