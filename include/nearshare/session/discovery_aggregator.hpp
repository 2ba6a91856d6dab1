#pragma once

#include "nearshare/transport/peer.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nearshare::session {

// Insertion-ordered peer set keyed by identity.
class DiscoveryAggregator {
public:
    // True when the peer is new or any of its attributes changed.
    bool upsert(const transport::Peer& peer);
    void reset();

    const std::vector<transport::Peer>& peers() const { return peers_; }
    std::optional<transport::Peer> find(const std::string& identity) const;
    std::size_t size() const { return peers_.size(); }
    bool empty() const { return peers_.empty(); }

private:
    std::vector<transport::Peer> peers_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace nearshare::session
