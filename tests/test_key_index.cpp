#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "key_index.hpp"

using namespace pricemesh;

TEST(KeyIndexTest, AssignsDenseStableIndices) {
    KeyIndex index(4);
    EXPECT_EQ(index.indexOf("a"), 0u);
    EXPECT_EQ(index.indexOf("b"), 1u);
    EXPECT_EQ(index.indexOf("a"), 0u);
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(*index.find("b"), 1u);
    EXPECT_FALSE(index.find("c").has_value());
}

TEST(KeyIndexTest, CallbackRunsOnlyOnFirstAssignment) {
    KeyIndex index(4);
    int calls = 0;
    auto counting = [&calls](SlotIndex) { ++calls; };
    index.indexOf("a", counting);
    index.indexOf("a", counting);
    EXPECT_EQ(calls, 1);
}

TEST(KeyIndexTest, FullIndexThrows) {
    KeyIndex index(2);
    index.indexOf("a");
    index.indexOf("b");
    EXPECT_THROW(index.indexOf("c"), CapacityExceeded);
    // Existing keys still resolve
    EXPECT_EQ(index.indexOf("b"), 1u);
}

TEST(KeyIndexTest, AdoptSkipsTakenSlots) {
    KeyIndex index(3);
    index.adopt("x", 0);
    index.adopt("x", 0);
    EXPECT_EQ(index.indexOf("y"), 1u);
    EXPECT_TRUE(index.isAssigned(0));
    EXPECT_THROW(index.adopt("z", 1), InvariantViolation);
    EXPECT_THROW(index.adopt("x", 2), InvariantViolation);
    EXPECT_THROW(index.adopt("w", 3), InvariantViolation);
}

TEST(KeyIndexTest, ConcurrentAssignmentNeverSharesAnIndex) {
    constexpr int kThreads = 8;
    constexpr int kKeys = 200;
    KeyIndex index(kKeys);

    std::vector<std::vector<SlotIndex>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int k = 0; k < kKeys; ++k) {
                seen[t].push_back(index.indexOf("key-" + std::to_string(k)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 1; t < kThreads; ++t) {
        EXPECT_EQ(seen[t], seen[0]);
    }
    std::set<SlotIndex> unique(seen[0].begin(), seen[0].end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(kKeys));
    EXPECT_EQ(index.size(), static_cast<size_t>(kKeys));
}
