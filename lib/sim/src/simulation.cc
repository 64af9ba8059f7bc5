#include "sim/simulation.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace Tally::Sim {

using BFT::PBFT::PBFTMessage;
using BFT::PBFT::PrePreparePayload;
using BFT::PBFT::rotate_leader;

std::vector<Node> SimulationReport::honest_nodes() const
{
    std::vector<Node> honest;
    std::ranges::copy_if(nodes, std::back_inserter(honest), [](const Node& n) { return !n.is_byzantine(); });
    return honest;
}

bool SimulationReport::agreement() const
{
    const auto honest = honest_nodes();
    return std::ranges::all_of(honest, [&](const Node& n) {
        return n.ledger() == honest.front().ledger();
    });
}

std::expected<Simulation, std::error_code> Simulation::create(SimulationConfig config)
{
    auto ctx = BFT::SystemContext::create(config.total_nodes, config.fault_tolerance);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    const int faulty = config.faulty_nodes.value_or(config.fault_tolerance);
    if (faulty < 0 || faulty > config.total_nodes) {
        return std::unexpected(make_error_code(BFT::Error::InvalidFaultTolerance));
    }
    if (config.blocks.empty()) {
        return std::unexpected(make_error_code(BFT::Error::EmptyProposal));
    }
    return Simulation(std::move(config), *ctx, faulty);
}

std::vector<Node> Simulation::make_nodes() const
{
    std::vector<Node> nodes;
    nodes.reserve(static_cast<size_t>(ctx_.N));
    for (NodeId id = 1; id <= ctx_.N; ++id) {
        const auto behavior = id > ctx_.N - faulty_ ? config_.faulty_behavior : Behavior::Honest;
        auto node = Node::create(id, ctx_, behavior, config_.seed + static_cast<uint64_t>(id));
        if (!node) {
            // ids come from [1, N], so this is a programming error
            throw std::logic_error("Simulation: " + node.error().message());
        }
        nodes.push_back(std::move(*node));
    }
    return nodes;
}

SimulationReport Simulation::run(SimulationObserver* observer) const
{
    auto log = Log::channel("sim");

    InMemoryNetwork net(make_nodes(), config_.shuffle_delivery, config_.seed);
    if (observer != nullptr) {
        observer->on_nodes_created(net.nodes());
        net.set_delivery_hook([observer](const Envelope& env) { observer->on_delivery(env); });
    }
    net.connect_all();
    log->info("{} nodes connected, f = {}, {} faulty ({})",
        ctx_.N, ctx_.f, faulty_, BFT::PBFT::to_string(config_.faulty_behavior));

    SimulationReport report;
    for (size_t round = 0; round < config_.blocks.size(); ++round) {
        const int view = static_cast<int>(round);
        const NodeId leader = rotate_leader(view, ctx_.N);

        auto proposal = Block::create(config_.blocks[round], net.node(leader).ledger().back().hash());
        log->info("view {}: node {} proposes {} ({})", view, leader, proposal.data(), proposal.hash().substr(0, 12));
        if (observer != nullptr) {
            observer->on_round_started(view, leader, proposal, net.nodes());
        }

        // Every node sees the pre-prepare before any vote of this round
        const PBFTMessage pre_prepare { .sender = leader, .view = view, .payload = PrePreparePayload { proposal } };
        for (NodeId id = 1; id <= ctx_.N; ++id) {
            net.inject(net.handle_of(id), pre_prepare);
        }
        const size_t delivered = net.pump();

        RoundReport rr { .view = view, .leader = leader, .proposal = std::move(proposal), .delivered = delivered };
        log->info("view {}: quiescent after {} messages", view, delivered);
        if (observer != nullptr) {
            observer->on_round_finished(rr, net.nodes());
        }
        report.rounds.push_back(std::move(rr));
    }

    report.nodes = net.nodes();
    report.dropped = net.dropped();
    return report;
}

} // namespace Tally::Sim
