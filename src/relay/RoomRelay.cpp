#include "relay/RoomRelay.h"

#include "relay/Messages.h"
#include "util/Log.hpp"

#include <exception>
#include <utility>

namespace signalrelay::relay {

const char* to_string(RelayOutcome outcome) noexcept {
    switch (outcome) {
        case RelayOutcome::Relayed:     return "relayed";
        case RelayOutcome::RateLimited: return "rate-limited";
        case RelayOutcome::InvalidJson: return "invalid-json";
        case RelayOutcome::InvalidType: return "invalid-type";
        case RelayOutcome::UnknownPeer: return "unknown-peer";
    }
    return "unknown";
}

RoomRelay::RoomRelay(std::string room_id,
                     boost::asio::any_io_executor executor,
                     PeerIdGenerator& ids,
                     Options options,
                     NowFn now)
    : room_id_(std::move(room_id)),
      ids_(ids),
      options_(options),
      now_(std::move(now)),
      limiter_(options.rate_limit),
      idle_timer_(std::move(executor)) {}

std::optional<std::string> RoomRelay::join(const std::shared_ptr<PeerLink>& link) {
    std::lock_guard<std::mutex> lk(mu_);
    if (retired_) return std::nullopt;

    std::string peer_id = ids_.next();

    // Snapshot before the newcomer is registered.
    const auto existing = connections_.others(peer_id);
    connections_.add(peer_id, link);

    send_locked_(link, make_frame(messages::join(peer_id, existing)), peer_id);
    broadcast_locked_(make_frame(messages::peer_joined(peer_id)), peer_id);

    touch_locked_();
    util::debug("[room " + room_id_ + "] " + peer_id + " joined (" +
                std::to_string(connections_.size()) + " connected)");
    return peer_id;
}

RelayOutcome RoomRelay::relay(const std::string& peer_id, std::string_view raw) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!connections_.contains(peer_id)) return RelayOutcome::UnknownPeer;

    if (!limiter_.allow(peer_id, now_())) {
        send_to_locked_(peer_id, make_frame(messages::error(messages::kRateLimitExceeded)));
        return RelayOutcome::RateLimited;
    }

    const auto sig = messages::parse_signal(raw);
    switch (sig.status) {
        case messages::Signal::Status::InvalidJson:
            send_to_locked_(peer_id, make_frame(messages::error(messages::kInvalidJson)));
            return RelayOutcome::InvalidJson;
        case messages::Signal::Status::InvalidType:
            send_to_locked_(peer_id, make_frame(messages::error(messages::kInvalidType)));
            return RelayOutcome::InvalidType;
        case messages::Signal::Status::Ok:
            break;
    }

    broadcast_locked_(make_frame(messages::relayed(sig.type, peer_id, sig.data)), peer_id);
    touch_locked_();
    return RelayOutcome::Relayed;
}

bool RoomRelay::leave(const std::string& peer_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!connections_.remove(peer_id)) return false;

    limiter_.forget(peer_id);
    broadcast_locked_(make_frame(messages::peer_left(peer_id)), peer_id);

    // The room is only torn down by the idle deadline, never here.
    touch_locked_();
    util::debug("[room " + room_id_ + "] " + peer_id + " left (" +
                std::to_string(connections_.size()) + " connected)");
    return true;
}

bool RoomRelay::retire_if_idle() {
    std::lock_guard<std::mutex> lk(mu_);
    if (retired_) return true;
    if (!connections_.is_empty()) return false;

    retired_ = true;
    idle_timer_.cancel();
    return true;
}

void RoomRelay::shutdown() {
    std::lock_guard<std::mutex> lk(mu_);
    retired_ = true;
    idle_timer_.cancel();
    idle_timer_.set_callback(nullptr);
    for (const auto& e : connections_.entries()) limiter_.forget(e.peer_id);
    connections_ = ConnectionRegistry{};
}

void RoomRelay::set_idle_handler(std::function<void()> handler) {
    idle_timer_.set_callback(std::move(handler));
}

std::size_t RoomRelay::connection_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.size();
}

bool RoomRelay::is_empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.is_empty();
}

bool RoomRelay::retired() const {
    std::lock_guard<std::mutex> lk(mu_);
    return retired_;
}

std::optional<RoomRelay::Clock::time_point> RoomRelay::ttl_deadline() const {
    return idle_timer_.deadline();
}

void RoomRelay::broadcast_locked_(const Frame& frame, const std::string& exclude) {
    for (const auto& e : connections_.entries()) {
        if (e.peer_id == exclude) continue;
        send_locked_(e.link, frame, e.peer_id);
    }
}

void RoomRelay::send_to_locked_(const std::string& peer_id, const Frame& frame) {
    if (auto link = connections_.find(peer_id)) send_locked_(link, frame, peer_id);
}

// A failed delivery affects that recipient only; its transport reports the
// failure through its own close path, which ends in leave().
void RoomRelay::send_locked_(const std::weak_ptr<PeerLink>& link, const Frame& frame,
                             const std::string& peer_id) {
    auto target = link.lock();
    if (!target) {
        util::debug("[room " + room_id_ + "] " + peer_id + " transport gone, frame dropped");
        return;
    }
    try {
        target->deliver(frame);
    } catch (const std::exception& e) {
        util::log("[room " + room_id_ + "] delivery to " + peer_id + " failed: " + e.what());
    }
}

void RoomRelay::touch_locked_() {
    idle_timer_.reschedule(now_() + options_.idle_ttl);
}

} // namespace signalrelay::relay
