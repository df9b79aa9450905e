#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../include/node_chain.hpp"

namespace selforg {
namespace test {

using StringChain = NodeChain<std::string>;

TEST(NodeChainTest, StartsEmpty) {
    StringChain chain;
    EXPECT_TRUE(chain.IsEmpty());
    EXPECT_EQ(chain.Head(), StringChain::kNil);
    EXPECT_EQ(chain.LiveCount(), 0u);
}

TEST(NodeChainTest, AllocateInitializesNode) {
    StringChain chain;
    auto h = chain.Allocate("alpha", 7);
    const auto& node = chain.At(h);
    EXPECT_EQ(node.key, "alpha");
    EXPECT_EQ(node.access_count, 0u);
    EXPECT_EQ(node.last_access_tick, 7u);
    EXPECT_EQ(node.next, StringChain::kNil);
    EXPECT_EQ(node.inserted_at, node.last_accessed_at);
    // Allocated but not yet linked.
    EXPECT_TRUE(chain.IsEmpty());
    EXPECT_EQ(chain.LiveCount(), 1u);
}

TEST(NodeChainTest, PushFrontBuildsHeadToTailOrder) {
    StringChain chain;
    for (const char* key : {"c", "b", "a"}) {
        chain.PushFront(chain.Allocate(key, 0));
    }

    std::vector<std::string> order;
    chain.ForEach([&order](StringChain::Handle, const StringChain::Node& node) {
        order.push_back(node.key);
    });
    EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(NodeChainTest, ReleasedSlotsAreReused) {
    StringChain chain;
    auto a = chain.Allocate("a", 1);
    auto b = chain.Allocate("b", 2);
    chain.PushFront(a);
    chain.PushFront(b);
    ASSERT_EQ(chain.SlotCount(), 2u);

    // Unlink and release the tail.
    chain.SetNext(b, StringChain::kNil);
    chain.Release(a);
    EXPECT_EQ(chain.LiveCount(), 1u);

    auto c = chain.Allocate("c", 3);
    EXPECT_EQ(c, a);
    EXPECT_EQ(chain.SlotCount(), 2u);
    EXPECT_EQ(chain.At(c).key, "c");
    EXPECT_EQ(chain.At(c).access_count, 0u);
    EXPECT_EQ(chain.At(c).last_access_tick, 3u);
}

TEST(NodeChainTest, HandlesStayValidAcrossRelinking) {
    StringChain chain;
    auto x = chain.Allocate("x", 1);
    auto y = chain.Allocate("y", 2);
    chain.PushFront(x);
    chain.PushFront(y);  // y -> x

    chain.SetNext(y, StringChain::kNil);
    chain.PushFront(x);  // x -> y
    EXPECT_EQ(chain.Head(), x);
    EXPECT_EQ(chain.Next(x), y);
    EXPECT_EQ(chain.At(y).key, "y");
}

TEST(NodeChainTest, ClearDropsEverything) {
    StringChain chain;
    chain.PushFront(chain.Allocate("a", 1));
    chain.PushFront(chain.Allocate("b", 2));
    chain.Clear();

    EXPECT_TRUE(chain.IsEmpty());
    EXPECT_EQ(chain.LiveCount(), 0u);
    EXPECT_EQ(chain.SlotCount(), 0u);
}

} // namespace test
} // namespace selforg
