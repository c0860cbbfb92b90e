#include "relay/ConnectionRegistry.h"

#include <algorithm>
#include <utility>

namespace signalrelay::relay {

void ConnectionRegistry::add(const std::string& peer_id, std::weak_ptr<PeerLink> link) {
    if (contains(peer_id)) throw DuplicatePeerId(peer_id);
    entries_.push_back(Entry{peer_id, std::move(link)});
}

bool ConnectionRegistry::remove(const std::string& peer_id) {
    auto it = find_(peer_id);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

std::vector<std::string> ConnectionRegistry::others(const std::string& excluding) const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        if (e.peer_id != excluding) out.push_back(e.peer_id);
    }
    return out;
}

bool ConnectionRegistry::contains(const std::string& peer_id) const {
    return find_(peer_id) != entries_.end();
}

std::shared_ptr<PeerLink> ConnectionRegistry::find(const std::string& peer_id) const {
    auto it = find_(peer_id);
    return it == entries_.end() ? nullptr : it->link.lock();
}

std::vector<ConnectionRegistry::Entry>::const_iterator
ConnectionRegistry::find_(const std::string& peer_id) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const Entry& e) { return e.peer_id == peer_id; });
}

} // namespace signalrelay::relay
