#include "sim/simulation.hpp"

#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Tally::Sim {

using BFT::PBFT::Phase;

namespace {

    bool holds_forged_block(const Node& node)
    {
        for (const auto& b : node.ledger().blocks()) {
            if (b.data().starts_with("Malicious")) {
                return true;
            }
        }
        return false;
    }

    SimulationReport run_ok(SimulationConfig config)
    {
        auto sim = Simulation::create(std::move(config));
        EXPECT_TRUE(sim.has_value());
        return sim->run();
    }

    struct CountingObserver : SimulationObserver {
        int created = 0;
        int started = 0;
        int finished = 0;
        std::map<std::string, int> by_kind;

        void on_nodes_created(const std::vector<Node>& nodes) override { created = static_cast<int>(nodes.size()); }
        void on_round_started(int, NodeId, const Block&, const std::vector<Node>&) override { ++started; }
        void on_delivery(const Envelope& env) override { ++by_kind[std::string(BFT::PBFT::kind_name(env.msg.payload))]; }
        void on_round_finished(const RoundReport&, const std::vector<Node>&) override { ++finished; }
    };

} // namespace

TEST(SimulationTest, RejectsTooFewNodes)
{
    for (int f = 1; f <= 3; ++f) {
        auto sim = Simulation::create({ .total_nodes = 3 * f, .fault_tolerance = f });
        ASSERT_FALSE(sim.has_value());
        EXPECT_EQ(sim.error(), BFT::Error::InsufficientNodes);
    }
    EXPECT_TRUE(Simulation::create({ .total_nodes = 4, .fault_tolerance = 1 }).has_value());
}

TEST(SimulationTest, RejectsEmptyProposalList)
{
    auto sim = Simulation::create({ .total_nodes = 4, .fault_tolerance = 1, .blocks = {} });
    ASSERT_FALSE(sim.has_value());
    EXPECT_EQ(sim.error(), BFT::Error::EmptyProposal);
}

TEST(SimulationTest, RejectsMoreFaultyNodesThanNodes)
{
    auto sim = Simulation::create({ .total_nodes = 4, .fault_tolerance = 1, .faulty_nodes = 5 });
    ASSERT_FALSE(sim.has_value());
    EXPECT_EQ(sim.error(), BFT::Error::InvalidFaultTolerance);
}

TEST(SimulationTest, AllHonestFourNodesAgree)
{
    auto report = run_ok({ .total_nodes = 4, .fault_tolerance = 1, .faulty_nodes = 0 });

    ASSERT_EQ(report.nodes.size(), 4U);
    ASSERT_EQ(report.rounds.size(), 1U);
    const auto& proposal = report.rounds.front().proposal;

    for (const auto& node : report.nodes) {
        EXPECT_FALSE(node.is_byzantine());
        EXPECT_EQ(node.phase(), Phase::Committed) << "node " << node.id();
        ASSERT_EQ(node.ledger().size(), 2U) << "node " << node.id();
        EXPECT_EQ(node.ledger().back(), proposal);
        EXPECT_TRUE(Ledger::is_chain_valid(node.ledger()));
    }
    EXPECT_TRUE(report.agreement());
    EXPECT_EQ(report.dropped, 0U);
}

TEST(SimulationTest, ByzantineForksNeverReachHonestLedgers)
{
    auto report = run_ok({ .total_nodes = 7, .fault_tolerance = 2 });

    const NodeId leader = report.rounds.front().leader;
    ASSERT_EQ(leader, 1);
    EXPECT_FALSE(report.nodes.at(static_cast<size_t>(leader - 1)).is_byzantine());

    int byzantine = 0;
    for (const auto& node : report.nodes) {
        EXPECT_FALSE(holds_forged_block(node)) << "node " << node.id();
        if (node.is_byzantine()) {
            ++byzantine;
            EXPECT_GE(node.id(), 6);
            EXPECT_EQ(node.ledger().size(), 1U);
            // each forged hash only ever holds the forger's own vote
            for (const auto& [hash, voters] : node.consensus().prepare_votes()) {
                EXPECT_EQ(voters.size(), 1U);
            }
            EXPECT_NE(node.phase(), Phase::Committed);
        } else {
            EXPECT_EQ(node.ledger().size(), 2U) << "node " << node.id();
            EXPECT_EQ(node.ledger().back(), report.rounds.front().proposal);
        }
    }
    EXPECT_EQ(byzantine, 2);
    EXPECT_TRUE(report.agreement());
}

TEST(SimulationTest, ShuffledDeliveryKeepsOutcome)
{
    for (uint64_t seed = 1; seed <= 5; ++seed) {
        auto report = run_ok({ .total_nodes = 7, .fault_tolerance = 2, .shuffle_delivery = true, .seed = seed });

        EXPECT_TRUE(report.agreement()) << "seed " << seed;
        for (const auto& node : report.honest_nodes()) {
            EXPECT_EQ(node.ledger().size(), 2U) << "seed " << seed << " node " << node.id();
            EXPECT_FALSE(holds_forged_block(node));
        }
    }
}

TEST(SimulationTest, RandomizedFaultsKeepSafety)
{
    for (uint64_t seed = 1; seed <= 5; ++seed) {
        auto report = run_ok({ .total_nodes = 7,
            .fault_tolerance = 2,
            .faulty_behavior = Behavior::Randomized,
            .shuffle_delivery = true,
            .seed = seed });

        EXPECT_TRUE(report.agreement()) << "seed " << seed;
        for (const auto& node : report.nodes) {
            EXPECT_FALSE(holds_forged_block(node)) << "seed " << seed << " node " << node.id();
            EXPECT_TRUE(Ledger::is_chain_valid(node.ledger()));
        }
        for (const auto& node : report.honest_nodes()) {
            EXPECT_EQ(node.ledger().size(), 2U);
        }
    }
}

TEST(SimulationTest, TwoNodeSystemCommits)
{
    auto report = run_ok({ .total_nodes = 2, .fault_tolerance = 0 });

    ASSERT_EQ(report.nodes.size(), 2U);
    for (const auto& node : report.nodes) {
        EXPECT_FALSE(node.is_byzantine());
        EXPECT_EQ(node.phase(), Phase::Committed) << "node " << node.id();
        ASSERT_EQ(node.ledger().size(), 2U) << "node " << node.id();
        EXPECT_EQ(node.ledger().back(), report.rounds.front().proposal);
    }
    EXPECT_TRUE(report.agreement());
}

TEST(SimulationTest, MultipleRoundsGrowHonestLedgers)
{
    // views 0..3 -> leaders 1..4
    auto report = run_ok({ .total_nodes = 4,
        .fault_tolerance = 1,
        .faulty_nodes = 0,
        .blocks = { "Block 1", "Block 2", "Block 3", "Block 4" } });

    ASSERT_EQ(report.rounds.size(), 4U);
    for (size_t i = 0; i < report.rounds.size(); ++i) {
        EXPECT_EQ(report.rounds[i].view, static_cast<int>(i));
        EXPECT_EQ(report.rounds[i].leader, static_cast<NodeId>(i) + 1);
    }
    for (const auto& node : report.honest_nodes()) {
        ASSERT_EQ(node.ledger().size(), 5U);
        EXPECT_TRUE(Ledger::is_chain_valid(node.ledger()));
        EXPECT_EQ(node.ledger().back().data(), "Block 4");
    }
    EXPECT_TRUE(report.agreement());
}

TEST(SimulationTest, FaultyLeaderRoundLeavesLedgersUntouched)
{
    // node 4 is byzantine and leads view 3; its ledger never left genesis
    auto report = run_ok({ .total_nodes = 4,
        .fault_tolerance = 1,
        .blocks = { "Block 1", "Block 2", "Block 3", "Block 4" } });

    ASSERT_EQ(report.rounds.size(), 4U);
    const auto& last = report.rounds.back();
    ASSERT_EQ(last.leader, 4);
    EXPECT_TRUE(report.nodes.at(3).is_byzantine());
    EXPECT_EQ(last.proposal.prev_hash(), Ledger::Blockchain::genesis().back().hash());
    EXPECT_EQ(last.delivered, 0U);

    for (const auto& node : report.honest_nodes()) {
        ASSERT_EQ(node.ledger().size(), 4U) << "node " << node.id();
        EXPECT_EQ(node.ledger().back().data(), "Block 3");
        EXPECT_FALSE(node.ledger().contains(last.proposal.hash()));
        // still parked on the round it last accepted
        EXPECT_EQ(node.consensus().view(), 2);
        EXPECT_EQ(node.phase(), Phase::Committed);
    }
    EXPECT_TRUE(report.agreement());
}

TEST(SimulationTest, ObserverSeesEveryPhase)
{
    auto sim = Simulation::create({ .total_nodes = 4, .fault_tolerance = 1, .faulty_nodes = 0 });
    ASSERT_TRUE(sim.has_value());

    CountingObserver observer;
    auto report = sim->run(&observer);

    EXPECT_EQ(observer.created, 4);
    EXPECT_EQ(observer.started, 1);
    EXPECT_EQ(observer.finished, 1);
    // 4 nodes x 3 peers, once per phase
    EXPECT_EQ(observer.by_kind["PREPARE"], 12);
    EXPECT_EQ(observer.by_kind["COMMIT"], 12);
    EXPECT_EQ(report.rounds.front().delivered, 24U);
}

TEST(InMemoryNetworkTest, HandlesAreOpaqueAndStable)
{
    auto ctx = *BFT::SystemContext::create(4, 1);
    std::vector<Node> nodes;
    for (NodeId id = 1; id <= 4; ++id) {
        nodes.push_back(*Node::create(id, ctx));
    }
    InMemoryNetwork net(nodes, false, 0);

    EXPECT_EQ(net.handle_of(3), net.handle_of(3));
    EXPECT_NE(net.handle_of(3).value, 3U);
    EXPECT_THROW((void)net.handle_of(9), std::out_of_range);

    net.connect_all();
    for (const auto& node : net.nodes()) {
        for (NodeId peer = 1; peer <= 4; ++peer) {
            EXPECT_EQ(node.peers().is_connected(peer), peer != node.id());
        }
    }
}

TEST(InMemoryNetworkTest, UnconnectedNodesDropBroadcasts)
{
    auto ctx = *BFT::SystemContext::create(4, 1);
    std::vector<Node> nodes;
    for (NodeId id = 1; id <= 4; ++id) {
        nodes.push_back(*Node::create(id, ctx));
    }
    InMemoryNetwork net(nodes, false, 0);

    const auto proposal = Block::create("Block 1", Ledger::Blockchain::genesis().back().hash());
    net.inject(net.handle_of(1), BFT::PBFT::PBFTMessage { .sender = 1, .view = 0, .payload = BFT::PBFT::PrePreparePayload { proposal } });

    EXPECT_EQ(net.pending(), 0U);
    EXPECT_EQ(net.pump(), 0U);
    EXPECT_EQ(net.node(1).phase(), Phase::PrePrepared);
    EXPECT_EQ(net.node(1).ledger().size(), 1U);
}

TEST(InMemoryNetworkTest, ForeignHandlesAreDroppedNotDelivered)
{
    auto ctx = *BFT::SystemContext::create(4, 1);
    std::vector<Node> nodes;
    for (NodeId id = 1; id <= 4; ++id) {
        nodes.push_back(*Node::create(id, ctx));
    }
    InMemoryNetwork net(nodes, false, 0);
    net.connect_all();

    const auto proposal = Block::create("Block 1", Ledger::Blockchain::genesis().back().hash());
    const BFT::PBFT::PBFTMessage prepare { .sender = 2, .view = 0, .payload = BFT::PBFT::PreparePayload { proposal } };
    std::vector<Envelope> envelopes;
    envelopes.push_back(Envelope { .target = 3, .handle = PeerHandle { .value = 3 }, .msg = prepare });
    envelopes.push_back(Envelope { .target = 3, .handle = net.handle_of(3), .msg = prepare });
    net.post(std::move(envelopes));

    EXPECT_EQ(net.pump(), 1U);
    EXPECT_EQ(net.dropped(), 1U);
    EXPECT_EQ(net.node(3).consensus().count_prepare(proposal.hash()), 1);

    EXPECT_THROW(net.inject(PeerHandle { .value = 3 }, prepare), std::out_of_range);
}

} // namespace Tally::Sim
