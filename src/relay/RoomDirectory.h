#pragma once

#include "relay/PeerIdGenerator.hpp"
#include "relay/PeerLink.hpp"
#include "relay/RoomRelay.h"

#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace signalrelay::relay {

// Process-wide map of room id -> room. Rooms are created on first join and
// dropped once their idle deadline passes with nobody connected.
//
// The directory lock only guards the map; it is released before a room
// does any work, so rooms run independently of each other.
class RoomDirectory {
public:
    struct Joined {
        std::shared_ptr<RoomRelay> room;
        std::string peer_id;
    };

    RoomDirectory(boost::asio::any_io_executor executor,
                  RoomRelay::Options options,
                  RoomRelay::NowFn now = &RoomRelay::Clock::now);
    ~RoomDirectory();

    RoomDirectory(const RoomDirectory&) = delete;
    RoomDirectory& operator=(const RoomDirectory&) = delete;

    Joined join(const std::string& room_id, const std::shared_ptr<PeerLink>& link);

    // Frames and departures name their room by id; the room is looked up
    // again for each call rather than cached by the transport.
    RelayOutcome relay(const std::string& room_id, const std::string& peer_id, std::string_view raw);
    bool leave(const std::string& room_id, const std::string& peer_id);

    std::shared_ptr<RoomRelay> find(const std::string& room_id) const;
    std::size_t room_count() const;

    void shutdown();

private:
    std::shared_ptr<RoomRelay> get_or_create_(const std::string& room_id);
    void on_idle_(const std::weak_ptr<RoomRelay>& weak);

    boost::asio::any_io_executor executor_;
    const RoomRelay::Options options_;
    RoomRelay::NowFn now_;
    PeerIdGenerator ids_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<RoomRelay>> rooms_;
    bool shut_down_ = false;
};

} // namespace signalrelay::relay
