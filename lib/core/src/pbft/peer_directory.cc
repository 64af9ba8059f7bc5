#include "core/pbft/peer_directory.hpp"
#include <utility>

namespace Tally::BFT::PBFT {

PeerDirectory PeerDirectory::create(NodeId self_id, int total_nodes)
{
    PeerDirectory dir(self_id);
    for (NodeId id = 1; id <= total_nodes; ++id) {
        dir.peers_.emplace(id, std::nullopt);
    }
    return dir;
}

PeerDirectory PeerDirectory::connect(NodeId peer_id, std::optional<PeerHandle> handle) const
{
    PeerDirectory next = *this;
    next.peers_.insert_or_assign(peer_id, handle);
    return next;
}

std::optional<PeerHandle> PeerDirectory::resolve(NodeId peer_id) const
{
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Envelope> PeerDirectory::route(NodeId peer_id, const PBFTMessage& msg) const
{
    auto handle = resolve(peer_id);
    if (!handle) {
        return std::nullopt;
    }
    return Envelope { .target = peer_id, .handle = *handle, .msg = msg };
}

PeerDirectory::Fanout PeerDirectory::broadcast(const PBFTMessage& msg) const
{
    Fanout out;
    out.envelopes.reserve(peers_.size());
    for (const auto& [peer_id, _] : peers_) {
        if (peer_id == self_id_) {
            continue;
        }
        if (auto env = route(peer_id, msg)) {
            out.envelopes.push_back(std::move(*env));
        } else {
            out.dropped.push_back(peer_id);
        }
    }
    return out;
}

} // namespace Tally::BFT::PBFT
