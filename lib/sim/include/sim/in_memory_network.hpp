#pragma once

#include "core/logging.hpp"
#include "core/pbft/node.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <vector>

namespace Tally::Sim {

using BFT::NodeId;
using BFT::PBFT::Envelope;
using BFT::PBFT::Node;
using BFT::PBFT::PBFTMessage;
using BFT::PBFT::PeerHandle;

/**
 * @brief Single threaded loopback transport
 *
 * Owns the nodes, hands out one opaque PeerHandle per node and delivers
 * queued envelopes one at a time, either FIFO or in a seeded random order.
 */
class InMemoryNetwork {
public:
    using DeliveryHook = std::function<void(const Envelope&)>;

    InMemoryNetwork(std::vector<Node> nodes, bool shuffle, uint64_t seed);

    [[nodiscard]] PeerHandle handle_of(NodeId id) const;

    // Every node learns the handle of every other node
    void connect_all();

    // Hand `msg` straight to the node behind `handle`; its output is queued.
    // Throws std::out_of_range for a handle this network did not issue.
    void inject(PeerHandle handle, const PBFTMessage& msg);

    void post(std::vector<Envelope> envelopes);

    /**
     * @brief Deliver queued envelopes until none are left
     * @return number of envelopes delivered; dropped ones are not counted
     */
    size_t pump();

    void set_delivery_hook(DeliveryHook hook) { on_delivery_ = std::move(hook); }

    [[nodiscard]] const std::vector<Node>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] const Node& node(NodeId id) const;
    [[nodiscard]] size_t pending() const noexcept { return queue_.size(); }
    [[nodiscard]] size_t dropped() const noexcept { return dropped_; }

private:
    // nullopt for a handle this network did not issue
    [[nodiscard]] std::optional<size_t> index_of(PeerHandle handle) const;
    bool deliver(const Envelope& env);

    std::vector<Node> nodes_;
    std::deque<Envelope> queue_;
    bool shuffle_;
    std::mt19937_64 rng_;
    size_t dropped_ = 0;
    DeliveryHook on_delivery_;
    Log::Logger log_;
};

} // namespace Tally::Sim
