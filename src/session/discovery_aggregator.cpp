#include "nearshare/session/discovery_aggregator.hpp"

namespace nearshare::session {

bool DiscoveryAggregator::upsert(const transport::Peer& peer) {
    auto it = index_.find(peer.identity);
    if (it == index_.end()) {
        index_.emplace(peer.identity, peers_.size());
        peers_.push_back(peer);
        return true;
    }

    auto& existing = peers_[it->second];
    if (existing == peer) {
        return false;
    }
    existing = peer;
    return true;
}

void DiscoveryAggregator::reset() {
    peers_.clear();
    index_.clear();
}

std::optional<transport::Peer> DiscoveryAggregator::find(const std::string& identity) const {
    auto it = index_.find(identity);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return peers_[it->second];
}

} // namespace nearshare::session
