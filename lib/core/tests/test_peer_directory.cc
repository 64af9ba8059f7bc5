#include "core/pbft/peer_directory.hpp"

#include "pbft_test_utils.hpp"
#include <gtest/gtest.h>

namespace Tally::BFT::PBFT {

TEST(PeerDirectoryTest, CreateListsEveryIdDisconnected)
{
    const auto dir = PeerDirectory::create(2, 4);

    EXPECT_EQ(dir.self_id(), 2);
    EXPECT_EQ(dir.peers().size(), 4U);
    for (NodeId id = 1; id <= 4; ++id) {
        EXPECT_FALSE(dir.is_connected(id));
    }
}

TEST(PeerDirectoryTest, ConnectIsIdempotentUpsert)
{
    const auto base = PeerDirectory::create(1, 4);
    const auto once = base.connect(3, PeerHandle { 7 });
    const auto twice = once.connect(3, PeerHandle { 7 });
    const auto moved = twice.connect(3, PeerHandle { 9 });

    EXPECT_FALSE(base.is_connected(3));
    EXPECT_EQ(once.peers(), twice.peers());
    ASSERT_TRUE(moved.resolve(3).has_value());
    EXPECT_EQ(moved.resolve(3)->value, 9U);
    EXPECT_EQ(moved.peers().size(), 4U);
}

TEST(PeerDirectoryTest, NoneHandleDisconnects)
{
    const auto dir = PeerDirectory::create(1, 4).connect(2, PeerHandle { 5 }).connect(2, std::nullopt);
    EXPECT_FALSE(dir.is_connected(2));
}

TEST(PeerDirectoryTest, RouteResolvesHandle)
{
    const auto block = make_block("Block 1");
    const auto dir = PeerDirectory::create(1, 4).connect(2, PeerHandle { 42 });

    auto env = dir.route(2, make_prepare(1, block));
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->target, 2);
    EXPECT_EQ(env->handle.value, 42U);
    EXPECT_EQ(env->msg.sender, 1);

    EXPECT_FALSE(dir.route(3, make_prepare(1, block)).has_value());
    EXPECT_FALSE(dir.route(99, make_prepare(1, block)).has_value());
}

TEST(PeerDirectoryTest, BroadcastSkipsSelfAndReportsDrops)
{
    const auto block = make_block("Block 1");
    const auto dir = PeerDirectory::create(1, 4)
                         .connect(1, PeerHandle { 1 })
                         .connect(2, PeerHandle { 2 })
                         .connect(4, PeerHandle { 4 });

    auto fanout = dir.broadcast(make_prepare(1, block));

    EXPECT_EQ(targets_of(fanout.envelopes), (std::set<NodeId> { 2, 4 }));
    EXPECT_EQ(fanout.dropped, (std::vector<NodeId> { 3 }));
}

} // namespace Tally::BFT::PBFT
