#pragma once

#include "core/common.hpp"
#include "ledger/block.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace Tally::BFT::PBFT {

using Ledger::Block;

enum class Phase : std::uint8_t {
    Initial,
    PrePrepared,
    Prepared,
    Committed,
};

std::string_view to_string(Phase phase);

// block hash -> unique voters
using VoteMap = std::map<std::string, std::set<NodeId>>;

/**
 * @brief True iff some single block hash has at least (total_nodes - f - 1) unique voters
 *
 * Votes for different hashes never add up.
 */
[[nodiscard]]
bool quorum_reached(const VoteMap& votes, int total_nodes, int f);

/**
 * @brief Leader of a view: (view mod total_nodes) + 1, always in [1, total_nodes]
 * @throws std::invalid_argument if total_nodes < 1
 */
[[nodiscard]]
NodeId rotate_leader(int view, int total_nodes);

/**
 * @brief Vote bookkeeping of one node for one block round
 *
 * Every transition returns a new state; the receiver is never modified.
 * Phases only move forward within a round; start() begins a new round.
 */
class ConsensusState {
public:
    ConsensusState(NodeId node_id, const SystemContext& ctx)
        : node_id_(node_id)
        , N_(ctx.N)
        , f_(ctx.f)
    {
    }

    // initial/any -> pre-prepared, seeds our own prepare vote
    [[nodiscard]] ConsensusState start(const Block& block) const;

    [[nodiscard]] ConsensusState record_prepare_vote(const Block& block, NodeId voter) const;
    [[nodiscard]] ConsensusState record_commit_vote(const Block& block, NodeId voter) const;

    [[nodiscard]] ConsensusState enter_view(int view) const;

    [[nodiscard]] bool has_prepare_quorum() const { return quorum_reached(prepare_votes_, N_, f_); }
    [[nodiscard]] bool has_commit_quorum() const { return quorum_reached(commit_votes_, N_, f_); }

    [[nodiscard]] int count_prepare(const std::string& hash) const;
    [[nodiscard]] int count_commit(const std::string& hash) const;

    [[nodiscard]] NodeId node_id() const noexcept { return node_id_; }
    [[nodiscard]] int view() const noexcept { return view_; }
    [[nodiscard]] NodeId leader() const { return rotate_leader(view_, N_); }
    [[nodiscard]] Phase phase() const noexcept { return phase_; }
    [[nodiscard]] const std::optional<Block>& current_block() const noexcept { return current_block_; }
    [[nodiscard]] const VoteMap& prepare_votes() const noexcept { return prepare_votes_; }
    [[nodiscard]] const VoteMap& commit_votes() const noexcept { return commit_votes_; }
    [[nodiscard]] const std::optional<std::string>& committed_hash() const noexcept { return committed_hash_; }
    [[nodiscard]] int total_nodes() const noexcept { return N_; }
    [[nodiscard]] int fault_tolerance() const noexcept { return f_; }

private:
    NodeId node_id_;
    int N_;
    int f_;
    int view_ = 0;

    Phase phase_ = Phase::Initial;
    std::optional<Block> current_block_;
    VoteMap prepare_votes_;
    VoteMap commit_votes_;
    // hash whose commit votes reached quorum
    std::optional<std::string> committed_hash_;
};

} // namespace Tally::BFT::PBFT
