#pragma once
#include <chrono>
#include <string>

namespace signalrelay::networking {

// Logical identity of a relay connection, carried by the transport session.
// Everything the relay keeps per connection is keyed by these two strings,
// never by the session object itself.
struct PeerAttachment {
    using Clock = std::chrono::steady_clock;

    std::string room_id;
    std::string peer_id;  // "peer-<ulid>", empty until the room accepted the join

    Clock::time_point connected_at{};

    bool joined() const noexcept { return !peer_id.empty(); }

    std::chrono::seconds age() const {
        return std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - connected_at);
    }
};

} // namespace signalrelay::networking
