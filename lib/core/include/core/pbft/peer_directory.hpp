#pragma once

#include "core/common.hpp"
#include "core/pbft/messages.hpp"
#include <map>
#include <optional>
#include <vector>

namespace Tally::BFT::PBFT {

/**
 * @brief Maps peer ids to delivery handles
 *
 * A missing entry and an entry without a handle both mean "disconnected".
 */
class PeerDirectory {
public:
    struct Fanout {
        std::vector<Envelope> envelopes;
        std::vector<NodeId> dropped;
    };

    explicit PeerDirectory(NodeId self_id)
        : self_id_(self_id)
    {
    }

    /**
     * @brief Directory listing every id in [1, total_nodes], all disconnected
     */
    [[nodiscard]] static PeerDirectory create(NodeId self_id, int total_nodes);

    /**
     * @brief Register or overwrite one peer entry
     */
    [[nodiscard]] PeerDirectory connect(NodeId peer_id, std::optional<PeerHandle> handle) const;

    [[nodiscard]] std::optional<PeerHandle> resolve(NodeId peer_id) const;
    [[nodiscard]] bool is_connected(NodeId peer_id) const { return resolve(peer_id).has_value(); }

    /**
     * @brief Address `msg` to one peer
     * @return nullopt if the peer is unknown or disconnected
     */
    [[nodiscard]] std::optional<Envelope> route(NodeId peer_id, const PBFTMessage& msg) const;

    /**
     * @brief Address `msg` to every known peer except ourselves
     */
    [[nodiscard]] Fanout broadcast(const PBFTMessage& msg) const;

    [[nodiscard]] NodeId self_id() const noexcept { return self_id_; }
    [[nodiscard]] const std::map<NodeId, std::optional<PeerHandle>>& peers() const noexcept { return peers_; }

private:
    NodeId self_id_;
    std::map<NodeId, std::optional<PeerHandle>> peers_;
};

} // namespace Tally::BFT::PBFT
