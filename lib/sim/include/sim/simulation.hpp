#pragma once

#include "core/common.hpp"
#include "core/logging.hpp"
#include "core/pbft/node.hpp"
#include "sim/in_memory_network.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace Tally::Sim {

using BFT::PBFT::Behavior;
using BFT::PBFT::Block;

struct SimulationConfig {
    int total_nodes = 4;
    int fault_tolerance = 1;
    // The highest `faulty_nodes` ids misbehave; defaults to fault_tolerance
    std::optional<int> faulty_nodes;
    Behavior faulty_behavior = Behavior::Byzantine;
    // One round per entry, proposed in order
    std::vector<std::string> blocks { "Block 1" };
    bool shuffle_delivery = false;
    uint64_t seed = 0;
};

struct RoundReport {
    int view;
    NodeId leader;
    Block proposal;
    size_t delivered; ///< envelopes pumped after the pre-prepare injection
};

struct SimulationReport {
    std::vector<Node> nodes;
    std::vector<RoundReport> rounds;
    size_t dropped = 0;

    [[nodiscard]] std::vector<Node> honest_nodes() const;

    /// Every honest node holds the same chain of block hashes
    [[nodiscard]] bool agreement() const;
};

/**
 * @brief Hooks for presenting a run; every method defaults to a no-op
 */
class SimulationObserver {
public:
    virtual ~SimulationObserver() = default;

    virtual void on_nodes_created(const std::vector<Node>& /*nodes*/) { }
    virtual void on_round_started(int /*view*/, NodeId /*leader*/, const Block& /*proposal*/, const std::vector<Node>& /*nodes*/) { }
    virtual void on_delivery(const Envelope& /*env*/) { }
    virtual void on_round_finished(const RoundReport& /*round*/, const std::vector<Node>& /*nodes*/) { }
};

class Simulation {
public:
    /**
     * @brief Validate the configuration; nothing is built on failure
     */
    [[nodiscard]] static std::expected<Simulation, std::error_code> create(SimulationConfig config);

    /**
     * @brief Build and connect the nodes, then run one PBFT round per configured block
     */
    SimulationReport run(SimulationObserver* observer = nullptr) const;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }
    [[nodiscard]] const BFT::SystemContext& context() const noexcept { return ctx_; }
    [[nodiscard]] int faulty_nodes() const noexcept { return faulty_; }

private:
    Simulation(SimulationConfig config, BFT::SystemContext ctx, int faulty)
        : config_(std::move(config))
        , ctx_(ctx)
        , faulty_(faulty)
    {
    }

    [[nodiscard]] std::vector<Node> make_nodes() const;

    SimulationConfig config_;
    BFT::SystemContext ctx_;
    int faulty_;
};

} // namespace Tally::Sim
