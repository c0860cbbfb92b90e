#include "relay/RoomDirectory.h"

#include "util/Log.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace signalrelay::relay {

RoomDirectory::RoomDirectory(boost::asio::any_io_executor executor,
                             RoomRelay::Options options,
                             RoomRelay::NowFn now)
    : executor_(std::move(executor)),
      options_(options),
      now_(std::move(now)) {}

RoomDirectory::~RoomDirectory() {
    shutdown();
}

RoomDirectory::Joined RoomDirectory::join(const std::string& room_id,
                                          const std::shared_ptr<PeerLink>& link) {
    // A room can be retired between lookup and join; the next lookup then
    // creates a fresh one.
    for (;;) {
        auto room = get_or_create_(room_id);
        if (auto peer_id = room->join(link)) return Joined{std::move(room), std::move(*peer_id)};

        std::lock_guard<std::mutex> lk(mu_);
        auto it = rooms_.find(room_id);
        if (it != rooms_.end() && it->second == room) rooms_.erase(it);
    }
}

RelayOutcome RoomDirectory::relay(const std::string& room_id, const std::string& peer_id,
                                  std::string_view raw) {
    auto room = find(room_id);
    if (!room) return RelayOutcome::UnknownPeer;
    return room->relay(peer_id, raw);
}

bool RoomDirectory::leave(const std::string& room_id, const std::string& peer_id) {
    auto room = find(room_id);
    if (!room) return false;
    return room->leave(peer_id);
}

std::shared_ptr<RoomRelay> RoomDirectory::find(const std::string& room_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) return nullptr;
    return it->second;
}

std::size_t RoomDirectory::room_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.size();
}

void RoomDirectory::shutdown() {
    std::unordered_map<std::string, std::shared_ptr<RoomRelay>> rooms;
    {
        std::lock_guard<std::mutex> lk(mu_);
        shut_down_ = true;
        rooms.swap(rooms_);
    }
    for (auto& [id, room] : rooms) room->shutdown();
}

std::shared_ptr<RoomRelay> RoomDirectory::get_or_create_(const std::string& room_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (shut_down_) throw std::runtime_error("room directory is shut down");

    auto& slot = rooms_[room_id];
    if (!slot) {
        slot = std::make_shared<RoomRelay>(room_id, executor_, ids_, options_, now_);
        std::weak_ptr<RoomRelay> weak = slot;
        slot->set_idle_handler([this, weak] { on_idle_(weak); });
        util::debug("[directory] room " + room_id + " created");
    }
    return slot;
}

void RoomDirectory::on_idle_(const std::weak_ptr<RoomRelay>& weak) {
    // Keeps the room alive until this handler returns.
    auto room = weak.lock();
    if (!room) return;

    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(room->room_id());
    if (it == rooms_.end() || it->second != room) return;
    if (!room->retire_if_idle()) return;

    rooms_.erase(it);
    util::debug("[directory] room " + room->room_id() + " evicted after idle TTL");
}

} // namespace signalrelay::relay
