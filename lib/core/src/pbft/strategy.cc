#include "core/pbft/strategy.hpp"
#include "core/logging.hpp"
#include "core/pbft/node.hpp"
#include <functional>
#include <random>
#include <string>
#include <utility>

namespace Tally::BFT::PBFT {

namespace {
    Log::Logger pbft_log()
    {
        return Log::channel("pbft");
    }

    Transition unchanged(const Node& node)
    {
        return Transition { .node = node, .outbound = {} };
    }

    PBFTMessage make_vote(const Node& node, int view, PBFTPayload payload)
    {
        return PBFTMessage { .sender = node.id(), .view = view, .payload = std::move(payload) };
    }
} // namespace

std::string_view to_string(Behavior behavior)
{
    switch (behavior) {
    case Behavior::Honest:
        return "honest";
    case Behavior::Byzantine:
        return "byzantine";
    case Behavior::Randomized:
        return "randomized";
    }
    return "unknown";
}

std::string forged_payload(NodeId id, int i)
{
    return "Malicious Block - Node " + std::to_string(id) + " #" + std::to_string(i);
}

std::shared_ptr<const Strategy> make_strategy(Behavior behavior, uint64_t seed)
{
    switch (behavior) {
    case Behavior::Byzantine:
        return std::make_shared<ByzantineStrategy>();
    case Behavior::Randomized:
        return std::make_shared<RandomFaultStrategy>(seed);
    case Behavior::Honest:
        break;
    }
    return std::make_shared<HonestStrategy>();
}

// --- Honest ---

Transition HonestStrategy::handle(const Node& node, const PBFTMessage& msg) const
{
    if (const auto* p = std::get_if<PrePreparePayload>(&msg.payload)) {
        return on_pre_prepare(node, msg, *p);
    }

    // Votes from another view belong to another round
    if (msg.view != node.consensus().view()) {
        pbft_log()->debug("node {}: dropping {} from node {} for view {} (current view {})",
            node.id(), kind_name(msg.payload), msg.sender, msg.view, node.consensus().view());
        return unchanged(node);
    }

    if (const auto* p = std::get_if<PreparePayload>(&msg.payload)) {
        return on_prepare(node, msg, *p);
    }
    return on_commit(node, msg, std::get<CommitPayload>(msg.payload));
}

/*
- Upon receiving `PRE-PREPARE(b)`:
- Ignore b unless it is well formed and extends our ledger tail.
- Start a round for b (our own prepare vote included).
- Multicast `PREPARE(b)` to every other peer.
*/
Transition HonestStrategy::on_pre_prepare(const Node& node, const PBFTMessage& msg, const PrePreparePayload& p) const
{
    if (!Ledger::is_block_valid(p.block) || !Ledger::is_linked(node.ledger().back(), p.block)) {
        pbft_log()->warn("node {}: ignoring proposal {} from node {} in view {}, it does not extend our ledger",
            node.id(), p.block.hash().substr(0, 12), msg.sender, msg.view);
        return unchanged(node);
    }

    auto next = node.with_consensus(node.consensus().enter_view(msg.view).start(p.block));
    pbft_log()->debug("node {}: pre-prepared {} ({}) in view {}",
        node.id(), p.block.data(), p.block.hash().substr(0, 12), msg.view);

    auto outbound = next.broadcast(make_vote(node, msg.view, PreparePayload { p.block }));
    return Transition { .node = std::move(next), .outbound = std::move(outbound) };
}

/*
- Upon receiving `PREPARE(b)` from P_j: record the vote.
- The first time this round is prepared, multicast `COMMIT(b)`. That is either
  the vote that moves the phase to PREPARED, or the vote that completes the
  prepare quorum after commits already moved the phase to COMMITTED.
*/
Transition HonestStrategy::on_prepare(const Node& node, const PBFTMessage& msg, const PreparePayload& p) const
{
    const bool had_quorum = node.consensus().has_prepare_quorum();
    const Phase before = node.consensus().phase();
    auto consensus = node.consensus().record_prepare_vote(p.block, msg.sender);

    // A quorum of one is already met by our own seeded vote
    const bool phase_edge = before < Phase::Prepared && consensus.phase() == Phase::Prepared;
    const bool quorum_edge = !had_quorum && consensus.has_prepare_quorum();

    auto next = node.with_consensus(std::move(consensus));
    if (!phase_edge && !quorum_edge) {
        return unchanged(next);
    }

    pbft_log()->debug("node {}: prepared {} with {} votes",
        node.id(), p.block.hash().substr(0, 12), next.consensus().count_prepare(p.block.hash()));

    auto outbound = next.broadcast(make_vote(node, msg.view, CommitPayload { p.block }));
    return Transition { .node = std::move(next), .outbound = std::move(outbound) };
}

/*
- Upon receiving `COMMIT(b)` from P_j: record the vote.
- Once commit votes for b reach quorum: append b unless the ledger already holds it.
*/
Transition HonestStrategy::on_commit(const Node& node, const PBFTMessage& msg, const CommitPayload& p) const
{
    auto next = node.with_consensus(node.consensus().record_commit_vote(p.block, msg.sender));

    const auto& consensus = next.consensus();
    if (consensus.phase() != Phase::Committed || consensus.committed_hash() != p.block.hash()) {
        return unchanged(next);
    }
    if (next.ledger().contains(p.block.hash())) {
        return unchanged(next);
    }

    auto appended = next.ledger().append_block(p.block);
    if (!appended) {
        pbft_log()->warn("node {}: committed block {} rejected by ledger: {}",
            node.id(), p.block.hash().substr(0, 12), appended.error().message());
        return unchanged(next);
    }

    pbft_log()->info("node {}: committed {} at height {}", node.id(), p.block.data(), appended->size() - 1);
    return unchanged(next.with_ledger(std::move(*appended)));
}

// --- Byzantine ---

/*
- Upon receiving `PRE-PREPARE(b)`: ignore b, forge kForkCount blocks on b's
  parent and start a silent round for each. Nothing is sent.
- PREPARE / COMMIT: ignored.
*/
Transition ByzantineStrategy::handle(const Node& node, const PBFTMessage& msg) const
{
    const auto* p = std::get_if<PrePreparePayload>(&msg.payload);
    if (p == nullptr) {
        return unchanged(node);
    }

    auto consensus = node.consensus().enter_view(msg.view);
    for (int i = 1; i <= kForkCount; ++i) {
        auto forged = Block::create(forged_payload(node.id(), i), p->block.prev_hash());
        consensus = consensus.start(forged);
        pbft_log()->debug("node {}: forked round on {}", node.id(), forged.hash().substr(0, 12));
    }
    return unchanged(node.with_consensus(std::move(consensus)));
}

// --- Randomized ---

RandomFaultStrategy::Action RandomFaultStrategy::choose(const Node& node, const PBFTMessage& msg) const
{
    std::seed_seq seq {
        static_cast<uint32_t>(seed_),
        static_cast<uint32_t>(seed_ >> 32),
        static_cast<uint32_t>(node.id()),
        static_cast<uint32_t>(msg.sender),
        static_cast<uint32_t>(msg.view),
        static_cast<uint32_t>(msg.payload.index()),
        static_cast<uint32_t>(std::hash<std::string> {}(msg.block().hash())),
    };
    std::mt19937 rng(seq);
    std::uniform_int_distribution<int> dist(0, 2);
    return static_cast<Action>(dist(rng));
}

Transition RandomFaultStrategy::handle(const Node& node, const PBFTMessage& msg) const
{
    switch (choose(node, msg)) {
    case Action::Obey:
        return honest_.handle(node, msg);

    case Action::ConflictingVote: {
        auto forged = Block::create(forged_payload(node.id(), 1), msg.block().prev_hash());
        pbft_log()->debug("node {}: answering {} from node {} with forged {}",
            node.id(), kind_name(msg.payload), msg.sender, forged.hash().substr(0, 12));
        if (std::holds_alternative<PrePreparePayload>(msg.payload)) {
            return unchanged(node.with_consensus(node.consensus().enter_view(msg.view).start(forged)));
        }
        return unchanged(node.with_consensus(node.consensus().record_prepare_vote(forged, msg.sender)));
    }

    case Action::Silent:
        break;
    }
    return unchanged(node);
}

} // namespace Tally::BFT::PBFT
