#include "core/pbft/consensus_state.hpp"
#include <algorithm>
#include <stdexcept>

namespace Tally::BFT::PBFT {

namespace {
    int count_voters(const VoteMap& votes, const std::string& hash)
    {
        auto it = votes.find(hash);
        if (it != votes.end()) {
            return static_cast<int>(it->second.size());
        }
        return 0;
    }
} // namespace

std::string_view to_string(Phase phase)
{
    switch (phase) {
    case Phase::Initial:
        return "initial";
    case Phase::PrePrepared:
        return "pre-prepared";
    case Phase::Prepared:
        return "prepared";
    case Phase::Committed:
        return "committed";
    }
    return "unknown";
}

bool quorum_reached(const VoteMap& votes, int total_nodes, int f)
{
    const auto threshold = static_cast<size_t>(std::max(total_nodes - f - 1, 0));
    return std::ranges::any_of(votes, [&](const auto& entry) {
        return entry.second.size() >= threshold;
    });
}

NodeId rotate_leader(int view, int total_nodes)
{
    if (total_nodes < 1) {
        throw std::invalid_argument("rotate_leader: total_nodes must be positive");
    }
    return (((view % total_nodes) + total_nodes) % total_nodes) + 1;
}

ConsensusState ConsensusState::start(const Block& block) const
{
    ConsensusState next = *this;
    next.current_block_ = block;
    next.phase_ = Phase::PrePrepared;
    next.prepare_votes_ = { { block.hash(), { node_id_ } } };
    next.commit_votes_.clear();
    next.committed_hash_.reset();
    return next;
}

/*
- Add `voter` to the prepare set of `block.hash` (re-adding is a no-op).
- Upon prepare quorum on any hash: advance to PREPARED.
*/
ConsensusState ConsensusState::record_prepare_vote(const Block& block, NodeId voter) const
{
    ConsensusState next = *this;
    next.prepare_votes_[block.hash()].insert(voter);

    if (next.phase_ < Phase::Prepared && next.has_prepare_quorum()) {
        next.phase_ = Phase::Prepared;
    }
    return next;
}

/*
- Add `voter` to the commit set of `block.hash`.
- Upon commit quorum on any hash: advance to COMMITTED and remember that hash.
*/
ConsensusState ConsensusState::record_commit_vote(const Block& block, NodeId voter) const
{
    ConsensusState next = *this;
    next.commit_votes_[block.hash()].insert(voter);

    if (next.phase_ < Phase::Committed && next.has_commit_quorum()) {
        next.phase_ = Phase::Committed;
        // Prefer the hash of the vote that tipped the balance
        const auto threshold = static_cast<size_t>(std::max(N_ - f_ - 1, 0));
        if (next.commit_votes_[block.hash()].size() >= threshold) {
            next.committed_hash_ = block.hash();
        } else {
            for (const auto& [hash, voters] : next.commit_votes_) {
                if (voters.size() >= threshold) {
                    next.committed_hash_ = hash;
                    break;
                }
            }
        }
    }
    return next;
}

ConsensusState ConsensusState::enter_view(int view) const
{
    ConsensusState next = *this;
    next.view_ = view;
    return next;
}

int ConsensusState::count_prepare(const std::string& hash) const
{
    return count_voters(prepare_votes_, hash);
}

int ConsensusState::count_commit(const std::string& hash) const
{
    return count_voters(commit_votes_, hash);
}

} // namespace Tally::BFT::PBFT
