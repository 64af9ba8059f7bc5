#include "core/pbft/node.hpp"
#include <utility>

namespace Tally::BFT::PBFT {

Node::Node(NodeId id, const SystemContext& ctx, std::shared_ptr<const Strategy> strategy)
    : id_(id)
    , ctx_(ctx)
    , ledger_(Blockchain::genesis())
    , consensus_(id, ctx)
    , peers_(PeerDirectory::create(id, ctx.N))
    , strategy_(std::move(strategy))
    , log_(Log::channel("net"))
{
}

std::expected<Node, std::error_code> Node::create(NodeId id, const SystemContext& ctx, Behavior behavior, uint64_t seed)
{
    if (id < 1 || id > ctx.N) {
        return std::unexpected(make_error_code(Error::InvalidNodeId));
    }
    return Node(id, ctx, make_strategy(behavior, seed));
}

std::expected<Node, std::error_code> Node::create(NodeId id, int total_nodes, int f, bool is_byzantine)
{
    auto ctx = SystemContext::create(total_nodes, f);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    return create(id, *ctx, is_byzantine ? Behavior::Byzantine : Behavior::Honest);
}

Node Node::connect(NodeId peer_id, std::optional<PeerHandle> handle) const
{
    Node next = *this;
    next.peers_ = peers_.connect(peer_id, handle);
    return next;
}

Transition Node::deliver(const PBFTMessage& msg) const
{
    return strategy_->handle(*this, msg);
}

Node Node::with_consensus(ConsensusState consensus) const
{
    Node next = *this;
    next.consensus_ = std::move(consensus);
    return next;
}

Node Node::with_ledger(Blockchain ledger) const
{
    Node next = *this;
    next.ledger_ = std::move(ledger);
    return next;
}

std::vector<Envelope> Node::broadcast(const PBFTMessage& msg) const
{
    auto fanout = peers_.broadcast(msg);
    for (NodeId peer_id : fanout.dropped) {
        log_->warn("node {}: peer {} disconnected, {} message lost", id_, peer_id, kind_name(msg.payload));
    }
    return std::move(fanout.envelopes);
}

} // namespace Tally::BFT::PBFT
