#include <gtest/gtest.h>
#include <limits>
#include <string>
#include "vector_clock.hpp"

using namespace pricemesh;

namespace {

VectorClock clockOf(std::initializer_list<std::pair<std::string, int>> counters) {
    VectorClock clock;
    for (const auto& [node, count] : counters) {
        for (int i = 0; i < count; ++i) {
            clock.increment(node);
        }
    }
    return clock;
}

} // namespace

// ============================================================================
// Ordering
// ============================================================================

TEST(VectorClockTest, IncrementAndGet) {
    VectorClock clock;
    EXPECT_EQ(clock.get("a"), 0u);
    EXPECT_EQ(clock.increment("a"), 1u);
    EXPECT_EQ(clock.increment("a"), 2u);
    EXPECT_EQ(clock.get("a"), 2u);
    EXPECT_EQ(clock.size(), 1u);
    EXPECT_THROW(clock.increment(""), std::invalid_argument);
}

TEST(VectorClockTest, CompareOrderings) {
    const auto a = clockOf({{"a", 1}});
    const auto ab = clockOf({{"a", 1}, {"b", 1}});
    const auto b = clockOf({{"b", 2}});

    EXPECT_EQ(a.compare(a), ClockOrdering::Equal);
    EXPECT_EQ(a.compare(ab), ClockOrdering::Before);
    EXPECT_EQ(ab.compare(a), ClockOrdering::After);
    EXPECT_EQ(a.compare(b), ClockOrdering::Concurrent);
    EXPECT_TRUE(a.happensBefore(ab));
    EXPECT_FALSE(ab.happensBefore(a));
    EXPECT_TRUE(b.isConcurrentWith(ab));
}

TEST(VectorClockTest, MissingComponentsReadAsZero) {
    VectorClock empty;
    EXPECT_EQ(empty.compare(VectorClock()), ClockOrdering::Equal);
    EXPECT_EQ(empty.compare(clockOf({{"x", 1}})), ClockOrdering::Before);
}

TEST(VectorClockTest, MergeIsComponentWiseMax) {
    const auto left = clockOf({{"a", 3}, {"b", 1}});
    const auto right = clockOf({{"b", 4}, {"c", 2}});

    const auto merged = left.merge(right);
    EXPECT_EQ(merged.get("a"), 3u);
    EXPECT_EQ(merged.get("b"), 4u);
    EXPECT_EQ(merged.get("c"), 2u);

    EXPECT_EQ(merged, right.merge(left));
    EXPECT_EQ(merged.merge(merged), merged);
    EXPECT_EQ(merged.merge(left), merged);
    EXPECT_EQ(left.merge(right).merge(clockOf({{"d", 1}})),
              left.merge(right.merge(clockOf({{"d", 1}}))));
    // Inputs untouched
    EXPECT_EQ(left.get("c"), 0u);
}

// ============================================================================
// Wire format
// ============================================================================

TEST(VectorClockTest, WireLayout) {
    const auto clock = clockOf({{"ab", 2}});
    const Bytes wire = clock.toWire();
    const Bytes expected = {1, 0, 0, 0, 2, 0, 'a', 'b', 2, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(wire, expected);
    EXPECT_EQ(VectorClock().toWire(), Bytes({0, 0, 0, 0}));
}

TEST(VectorClockTest, RoundTripAtScale) {
    for (int nodes : {1, 10, 1000}) {
        VectorClock clock;
        for (int n = 0; n < nodes; ++n) {
            const std::string id = "node-" + std::to_string(n);
            for (int i = 0; i <= n % 7; ++i) {
                clock.increment(id);
            }
        }
        EXPECT_EQ(VectorClock::fromWire(clock.toWire()), clock) << nodes << " nodes";
    }
}

TEST(VectorClockTest, ExtremeCountersSurviveTheWire) {
    // Counters no sequence of increments would reach in a test
    const Bytes wire = {
        0x02, 0x00, 0x00, 0x00,
        0x03, 0x00, 'm', 'a', 'x',
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0x03, 0x00, 't', 'o', 'p',
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80,
    };

    const VectorClock clock = VectorClock::fromWire(wire);
    EXPECT_EQ(clock.size(), 2u);
    EXPECT_EQ(clock.get("max"), std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(clock.get("top"), 1ull << 63);
    EXPECT_EQ(clock.toWire(), wire);

    const VectorClock merged = clockOf({{"max", 1}, {"top", 2}}).merge(clock);
    EXPECT_EQ(merged.get("max"), std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(merged.get("top"), 1ull << 63);
}

TEST(VectorClockTest, WithoutDropsOneComponent) {
    const VectorClock remote = clockOf({{"a", 9}, {"b", 4}});
    const VectorClock local = clockOf({{"a", 2}, {"b", 1}});

    const VectorClock held = local.merge(remote.without("a"));
    EXPECT_EQ(held.get("a"), 2u);
    EXPECT_EQ(held.get("b"), 4u);
    EXPECT_EQ(remote.get("a"), 9u);
}

TEST(VectorClockTest, TruncatedInputRejected) {
    const Bytes wire = clockOf({{"alpha", 5}, {"beta", 7}}).toWire();
    for (size_t length = 0; length < wire.size(); ++length) {
        EXPECT_THROW(VectorClock::fromWire(wire.data(), length), DecodeError) << "length " << length;
    }
}

TEST(VectorClockTest, TrailingBytesRejected) {
    Bytes wire = clockOf({{"a", 1}}).toWire();
    wire.push_back(0);
    EXPECT_THROW(VectorClock::fromWire(wire), DecodeError);
}

TEST(VectorClockTest, ImpossibleCountRejected) {
    // Claims four billion entries in a four byte buffer
    const Bytes wire = {0xff, 0xff, 0xff, 0xff};
    EXPECT_THROW(VectorClock::fromWire(wire), DecodeError);
}

TEST(VectorClockTest, EmptyAndDuplicateIdsRejected) {
    const Bytes empty_id = {1, 0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_THROW(VectorClock::fromWire(empty_id), DecodeError);

    Bytes duplicate;
    WireWriter writer(duplicate);
    writer.putU32(2);
    writer.putString16("a");
    writer.putU64(1);
    writer.putString16("a");
    writer.putU64(2);
    EXPECT_THROW(VectorClock::fromWire(duplicate), DecodeError);
}
