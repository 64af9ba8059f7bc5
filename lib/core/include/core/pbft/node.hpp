#pragma once

#include "core/common.hpp"
#include "core/logging.hpp"
#include "core/pbft/consensus_state.hpp"
#include "core/pbft/messages.hpp"
#include "core/pbft/peer_directory.hpp"
#include "core/pbft/strategy.hpp"
#include "ledger/blockchain.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace Tally::BFT::PBFT {

using Ledger::Blockchain;

/**
 * @brief One PBFT replica: ledger, consensus state, peer directory and behavior
 *
 * Node is a value. deliver() and connect() return the updated node and leave
 * the receiver untouched, so a driver may keep or discard old states freely.
 */
class Node {
public:
    /**
     * @brief Build a node for a validated system
     * @return InvalidNodeId if id is outside [1, ctx.N]
     */
    [[nodiscard]] static std::expected<Node, std::error_code> create(
        NodeId id,
        const SystemContext& ctx,
        Behavior behavior = Behavior::Honest,
        uint64_t seed = 0);

    /**
     * @brief Validates N > 3f before building anything
     */
    [[nodiscard]] static std::expected<Node, std::error_code> create(
        NodeId id,
        int total_nodes,
        int f,
        bool is_byzantine);

    [[nodiscard]] Node connect(NodeId peer_id, std::optional<PeerHandle> handle) const;

    /**
     * @brief The single state transition entry point
     */
    [[nodiscard]] Transition deliver(const PBFTMessage& msg) const;

    // --- used by strategies ---
    [[nodiscard]] Node with_consensus(ConsensusState consensus) const;
    [[nodiscard]] Node with_ledger(Blockchain ledger) const;

    // Fan `msg` out to every other peer; unreachable peers are logged and skipped
    [[nodiscard]] std::vector<Envelope> broadcast(const PBFTMessage& msg) const;

    [[nodiscard]] NodeId id() const noexcept { return id_; }
    [[nodiscard]] const SystemContext& context() const noexcept { return ctx_; }
    [[nodiscard]] const Blockchain& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const ConsensusState& consensus() const noexcept { return consensus_; }
    [[nodiscard]] Phase phase() const noexcept { return consensus_.phase(); }
    [[nodiscard]] const PeerDirectory& peers() const noexcept { return peers_; }
    [[nodiscard]] Behavior behavior() const noexcept { return strategy_->behavior(); }
    [[nodiscard]] bool is_byzantine() const noexcept { return behavior() != Behavior::Honest; }

private:
    Node(NodeId id, const SystemContext& ctx, std::shared_ptr<const Strategy> strategy);

    NodeId id_;
    SystemContext ctx_;
    Blockchain ledger_;
    ConsensusState consensus_;
    PeerDirectory peers_;
    std::shared_ptr<const Strategy> strategy_;
    Log::Logger log_;
};

struct Transition {
    Node node;
    std::vector<Envelope> outbound;
};

} // namespace Tally::BFT::PBFT
