#include "sim/in_memory_network.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace Tally::Sim {

namespace {
    // Handles are distinct from node ids
    constexpr uint64_t kHandleBase = 0x1000;
}

InMemoryNetwork::InMemoryNetwork(std::vector<Node> nodes, bool shuffle, uint64_t seed)
    : nodes_(std::move(nodes))
    , shuffle_(shuffle)
    , rng_(seed)
    , log_(Log::channel("net"))
{
}

PeerHandle InMemoryNetwork::handle_of(NodeId id) const
{
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].id() == id) {
            return PeerHandle { .value = kHandleBase + i };
        }
    }
    throw std::out_of_range("InMemoryNetwork: unknown node id " + std::to_string(id));
}

std::optional<size_t> InMemoryNetwork::index_of(PeerHandle handle) const
{
    if (handle.value < kHandleBase || handle.value - kHandleBase >= nodes_.size()) {
        return std::nullopt;
    }
    return static_cast<size_t>(handle.value - kHandleBase);
}

const Node& InMemoryNetwork::node(NodeId id) const
{
    return nodes_[*index_of(handle_of(id))];
}

void InMemoryNetwork::connect_all()
{
    for (auto& node : nodes_) {
        for (const auto& peer : nodes_) {
            if (peer.id() != node.id()) {
                node = node.connect(peer.id(), handle_of(peer.id()));
            }
        }
    }
}

void InMemoryNetwork::inject(PeerHandle handle, const PBFTMessage& msg)
{
    auto idx = index_of(handle);
    if (!idx) {
        throw std::out_of_range("InMemoryNetwork: handle not issued by this network");
    }
    auto& target = nodes_[*idx];
    auto transition = target.deliver(msg);
    target = std::move(transition.node);
    post(std::move(transition.outbound));
}

void InMemoryNetwork::post(std::vector<Envelope> envelopes)
{
    for (auto& env : envelopes) {
        queue_.push_back(std::move(env));
    }
}

size_t InMemoryNetwork::pump()
{
    size_t delivered = 0;
    while (!queue_.empty()) {
        if (shuffle_ && queue_.size() > 1) {
            std::uniform_int_distribution<size_t> pick(0, queue_.size() - 1);
            std::swap(queue_.front(), queue_[pick(rng_)]);
        }
        Envelope env = std::move(queue_.front());
        queue_.pop_front();
        if (deliver(env)) {
            ++delivered;
        }
    }
    return delivered;
}

bool InMemoryNetwork::deliver(const Envelope& env)
{
    auto idx = index_of(env.handle);
    if (!idx) {
        ++dropped_;
        log_->warn("dropping {} for node {}: handle {:#x} not issued by this network",
            BFT::PBFT::kind_name(env.msg.payload), env.target, env.handle.value);
        return false;
    }

    if (on_delivery_) {
        on_delivery_(env);
    }
    log_->trace("{} {} -> {}", BFT::PBFT::kind_name(env.msg.payload), env.msg.sender, env.target);

    auto transition = nodes_[*idx].deliver(env.msg);
    nodes_[*idx] = std::move(transition.node);
    post(std::move(transition.outbound));
    return true;
}

} // namespace Tally::Sim
