#pragma once

#include "relay/PeerLink.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace signalrelay::relay {

class DuplicatePeerId : public std::logic_error {
public:
    explicit DuplicatePeerId(const std::string& peer_id)
        : std::logic_error("peer id already registered: " + peer_id) {}
};

// Live connections of one room, in registration order.
// The registry does not own the transports: links are held weakly and a
// link whose transport is gone simply stops receiving.
class ConnectionRegistry {
public:
    struct Entry {
        std::string peer_id;
        std::weak_ptr<PeerLink> link;
    };

    void add(const std::string& peer_id, std::weak_ptr<PeerLink> link);
    bool remove(const std::string& peer_id);

    // Snapshot of every registered peer id except `excluding`.
    std::vector<std::string> others(const std::string& excluding) const;

    bool contains(const std::string& peer_id) const;

    // Null when the peer is not registered or its transport is gone.
    std::shared_ptr<PeerLink> find(const std::string& peer_id) const;

    bool is_empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }

    const std::vector<Entry>& entries() const noexcept { return entries_; }

private:
    std::vector<Entry>::const_iterator find_(const std::string& peer_id) const;

    // Rooms hold a handful of peers; a vector keeps the join order for free.
    std::vector<Entry> entries_;
};

} // namespace signalrelay::relay
