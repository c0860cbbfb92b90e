#pragma once

#include "lifecycle/LifecycleScheduler.h"
#include "relay/ConnectionRegistry.h"
#include "relay/PeerIdGenerator.hpp"
#include "relay/PeerLink.hpp"
#include "relay/RateLimiter.h"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace signalrelay::relay {

enum class RelayOutcome {
    Relayed,
    RateLimited,
    InvalidJson,
    InvalidType,
    UnknownPeer,
};

const char* to_string(RelayOutcome outcome) noexcept;

// One signaling room. Every public operation runs under the room mutex, so
// joins, relays and leaves for the same room never interleave.
class RoomRelay {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Options {
        std::chrono::milliseconds idle_ttl{60'000};
        unsigned rate_limit = RateLimiter::kDefaultLimit;
    };

    RoomRelay(std::string room_id,
              boost::asio::any_io_executor executor,
              PeerIdGenerator& ids,
              Options options,
              NowFn now = &Clock::now);

    RoomRelay(const RoomRelay&) = delete;
    RoomRelay& operator=(const RoomRelay&) = delete;

    // std::nullopt once the room has been retired; the caller must look the
    // room up again.
    std::optional<std::string> join(const std::shared_ptr<PeerLink>& link);

    RelayOutcome relay(const std::string& peer_id, std::string_view raw);

    bool leave(const std::string& peer_id);

    // Idle-deadline handler. Retires the room iff it has no connections.
    bool retire_if_idle();

    // Drop every connection without notifying anyone; used at server shutdown.
    void shutdown();

    // Invoked when the idle deadline passes.
    void set_idle_handler(std::function<void()> handler);

    const std::string& room_id() const noexcept { return room_id_; }
    std::size_t connection_count() const;
    bool is_empty() const;
    bool retired() const;
    std::optional<Clock::time_point> ttl_deadline() const;

private:
    void broadcast_locked_(const Frame& frame, const std::string& exclude);
    void send_locked_(const std::weak_ptr<PeerLink>& link, const Frame& frame,
                      const std::string& peer_id);
    void send_to_locked_(const std::string& peer_id, const Frame& frame);
    void touch_locked_();

    const std::string room_id_;
    PeerIdGenerator& ids_;
    const Options options_;
    NowFn now_;

    mutable std::mutex mu_;
    ConnectionRegistry connections_;
    RateLimiter limiter_;
    lifecycle::LifecycleScheduler idle_timer_;
    bool retired_ = false;
};

} // namespace signalrelay::relay
