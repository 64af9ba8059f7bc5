#include "core/logging.hpp"
#include "core/pbft/node.hpp"
#include "sim/simulation.hpp"

#include <boost/program_options.hpp>
#include <fmt/color.h>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace po = boost::program_options;

namespace {
using namespace Tally;
using BFT::PBFT::Behavior;
using BFT::PBFT::Node;

const std::string kProgramName = "tallybft-sim";
constexpr unsigned kLineWidth = 120;

class Narrator final : public Sim::SimulationObserver {
public:
    explicit Narrator(bool colored)
        : colored_(colored)
    {
    }

    void on_nodes_created(const std::vector<Node>& nodes) override
    {
        banner(fmt::color::yellow, "Byzantine nodes");
        for (const auto& node : nodes) {
            if (node.is_byzantine()) {
                line(fmt::color::red, fmt::format("Node {} is {}.", node.id(), BFT::PBFT::to_string(node.behavior())));
            } else {
                fmt::print("Node {} is honest.\n", node.id());
            }
        }
    }

    void on_round_started(int view, BFT::NodeId leader, const Sim::Block& proposal, const std::vector<Node>& nodes) override
    {
        prepares_ = 0;
        commits_ = 0;
        banner(fmt::color::green, fmt::format("Pre-Prepare: {} (view {}, leader {})", proposal.data(), view, leader));
        for (const auto& node : nodes) {
            fmt::print("Node {} receives block: {}\n", node.id(), proposal.data());
        }
    }

    void on_delivery(const BFT::PBFT::Envelope& env) override
    {
        if (std::holds_alternative<BFT::PBFT::PreparePayload>(env.msg.payload)) {
            ++prepares_;
        } else if (std::holds_alternative<BFT::PBFT::CommitPayload>(env.msg.payload)) {
            ++commits_;
        }
    }

    void on_round_finished(const Sim::RoundReport& round, const std::vector<Node>& nodes) override
    {
        banner(fmt::color::blue, "Prepare");
        fmt::print("{} prepare messages delivered\n", prepares_);
        for (const auto& node : nodes) {
            if (!node.is_byzantine()) {
                fmt::print("Node {} prepare votes for proposal: {}\n",
                    node.id(), node.consensus().count_prepare(round.proposal.hash()));
            }
        }

        banner(fmt::color::magenta, "Commit");
        fmt::print("{} commit messages delivered\n", commits_);
        for (const auto& node : nodes) {
            if (!node.is_byzantine()) {
                fmt::print("Node {} commit votes for proposal: {} -> {}\n",
                    node.id(), node.consensus().count_commit(round.proposal.hash()),
                    BFT::PBFT::to_string(node.phase()));
            }
        }
    }

    void print_final(const Sim::SimulationReport& report) const
    {
        banner(fmt::color::cyan, "Final consensus state");
        for (const auto& node : report.nodes) {
            line(fmt::color::magenta, fmt::format("-- Node {} --", node.id()));
            const auto label = std::string(BFT::PBFT::to_string(node.behavior()));
            if (node.is_byzantine()) {
                line(fmt::color::red, "  behavior: " + label);
            } else {
                fmt::print("  behavior: {}\n", label);
            }
            line(fmt::color::green, fmt::format("  phase: {} (view {})",
                                        BFT::PBFT::to_string(node.phase()), node.consensus().view()));
            fmt::print("  ledger: {} blocks, {}\n", node.ledger().size(),
                Ledger::is_chain_valid(node.ledger()) ? "valid" : "INVALID");
            for (const auto& block : node.ledger().blocks()) {
                fmt::print("    {}  {}\n", block.hash().substr(0, 16), block.data());
            }
        }

        fmt::print("\n");
        if (report.agreement()) {
            line(fmt::color::green, "Honest nodes agree on the ledger.");
        } else {
            line(fmt::color::red, "Honest nodes DISAGREE on the ledger.");
        }
    }

private:
    void banner(fmt::color color, const std::string& title) const
    {
        const std::string rule(title.size() + 6, '-');
        fmt::print("\n");
        line(color, rule);
        line(color, "-- " + title + " --");
        line(color, rule);
    }

    void line(fmt::color color, const std::string& text) const
    {
        if (colored_) {
            fmt::print(fmt::fg(color), "{}\n", text);
        } else {
            fmt::print("{}\n", text);
        }
    }

    bool colored_;
    size_t prepares_ = 0;
    size_t commits_ = 0;
};

Behavior parse_behavior(const std::string& name)
{
    if (name == "byzantine") {
        return Behavior::Byzantine;
    }
    if (name == "random") {
        return Behavior::Randomized;
    }
    throw po::validation_error(po::validation_error::invalid_option_value, "behavior", name);
}

} // namespace

int main(int argc, char** argv)
{
    Sim::SimulationConfig config;
    config.blocks.clear();
    int faulty = -1;
    std::string behavior = "byzantine";
    std::string log_level = "warn";
    bool no_color = false;

    po::options_description general_options("GENERAL OPTIONS", kLineWidth);
    auto addGeneralOption = general_options.add_options();
    addGeneralOption("help,h", "Show this help message and exit");

    po::options_description sim_options("SIMULATION OPTIONS", kLineWidth);
    auto addSimOption = sim_options.add_options();
    addSimOption("nodes,n", po::value<int>(&config.total_nodes)->default_value(4), "Total number of nodes (must exceed 3f)");
    addSimOption("faults,f", po::value<int>(&config.fault_tolerance)->default_value(1), "Byzantine faults tolerated");
    addSimOption("faulty", po::value<int>(&faulty), "Nodes that misbehave (default: f)");
    addSimOption("behavior", po::value<std::string>(&behavior)->default_value(behavior), "Faulty behavior: byzantine | random");
    addSimOption("block,b", po::value<std::vector<std::string>>(&config.blocks), "Block payload, one round each (repeatable, default: \"Block 1\")");
    addSimOption("shuffle", po::bool_switch(&config.shuffle_delivery), "Deliver messages in random order");
    addSimOption("seed", po::value<uint64_t>(&config.seed)->default_value(0), "Seed for shuffling and randomized faults");

    po::options_description logging_options("LOGGING OPTIONS", kLineWidth);
    auto addLoggingOption = logging_options.add_options();
    addLoggingOption("log-level", po::value<std::string>(&log_level)->default_value(log_level), "trace | debug | info | warn | err | off");
    addLoggingOption("log-file", po::value<std::string>(), "Also write logs to this file");
    addLoggingOption("no-color", po::bool_switch(&no_color), "Disable colored output");

    po::options_description all_options;
    all_options.add(general_options).add(sim_options).add(logging_options);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, all_options), vm);
        if (vm.count("help")) {
            std::cout << "Usage: " << kProgramName << " [OPTIONS]\n\n"
                      << all_options << std::endl;
            return 0;
        }
        po::notify(vm);
        config.faulty_behavior = parse_behavior(behavior);
    } catch (const po::error& e) {
        std::cerr << kProgramName << ": " << e.what() << "\n";
        return 1;
    }

    if (faulty >= 0) {
        config.faulty_nodes = faulty;
    }
    if (config.blocks.empty()) {
        config.blocks.emplace_back("Block 1");
    }

    Log::LoggingConfig logging_config;
    logging_config.verbosity = spdlog::level::from_str(log_level);
    logging_config.colored = !no_color;
    if (vm.count("log-file")) {
        logging_config.file_path = vm["log-file"].as<std::string>();
    }
    Log::Logging::get().Init(logging_config);
    auto log = Log::channel("sim");

    auto sim = Sim::Simulation::create(config);
    if (!sim) {
        log->error("invalid configuration (n = {}, f = {}): {}",
            config.total_nodes, config.fault_tolerance, sim.error().message());
        std::cerr << kProgramName << ": " << sim.error().message() << "\n";
        return 1;
    }

    try {
        Narrator narrator(!no_color);
        auto report = sim->run(&narrator);
        narrator.print_final(report);
    } catch (const std::exception& e) {
        log->critical("simulation aborted: {}", e.what());
        return 1;
    }
    return 0;
}
