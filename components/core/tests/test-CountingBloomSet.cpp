#include <cstddef>
#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "../src/generic_bloom/storage/BloomSet.hpp"
#include "../src/generic_bloom/storage/CounterTraits.hpp"
#include "../src/generic_bloom/storage/CountingBloomSet.hpp"

using generic_bloom::BinaryBloomSet;
using generic_bloom::BloomSet;
using generic_bloom::BloomSetDelete;
using generic_bloom::CounterTraits;
using generic_bloom::CountingBloomSet;
using generic_bloom::CountingBloomSet8;
using generic_bloom::SpectralBloomSet;

static_assert(BloomSet<CountingBloomSet8>);
static_assert(BloomSetDelete<CountingBloomSet8>);
static_assert(SpectralBloomSet<CountingBloomSet8>);
static_assert(false == BinaryBloomSet<CountingBloomSet8>);
static_assert(SpectralBloomSet<CountingBloomSet<int16_t>>);

static_assert(CounterTraits<uint8_t>::saturating_add(250, 10) == 255);
static_assert(CounterTraits<uint8_t>::saturating_add(3, 4) == 7);
static_assert(CounterTraits<int8_t>::saturating_add(127, 1) == 127);

TEST(CountingBloomSetTest, StartsAtZero) {
    CountingBloomSet8 const counters{10};
    EXPECT_EQ(counters.size(), 10U);
    for (size_t i = 0; i < counters.size(); ++i) {
        EXPECT_EQ(counters.query_count(i), 0);
        EXPECT_FALSE(counters.query(i));
    }
}

TEST(CountingBloomSetTest, IncrementAndDecrementTrackMultiplicity) {
    CountingBloomSet8 counters{4};
    counters.increment(2);
    counters.increment(2);
    counters.increment(2);
    EXPECT_EQ(counters.query_count(2), 3);
    EXPECT_TRUE(counters.query(2));

    counters.decrement(2);
    EXPECT_EQ(counters.query_count(2), 2);
    counters.decrement(2);
    counters.decrement(2);
    EXPECT_EQ(counters.query_count(2), 0);
    EXPECT_FALSE(counters.query(2));
}

TEST(CountingBloomSetTest, IncrementSaturatesAtMax) {
    CountingBloomSet8 counters{1};
    constexpr auto cMax = std::numeric_limits<uint8_t>::max();
    for (int i = 0; i < static_cast<int>(cMax) + 50; ++i) {
        counters.increment(0);
    }
    EXPECT_EQ(counters.query_count(0), cMax);
}

TEST(CountingBloomSetTest, DecrementAtZeroIsNoOp) {
    CountingBloomSet8 counters{3};
    counters.decrement(1);
    counters.decrement(1);
    EXPECT_EQ(counters.query_count(1), 0);

    counters.increment(1);
    EXPECT_EQ(counters.query_count(1), 1);
}

TEST(CountingBloomSetTest, SaturatedCounterIsNeverDecremented) {
    CountingBloomSet8 counters{1};
    constexpr auto cMax = std::numeric_limits<uint8_t>::max();
    for (int i = 0; i < static_cast<int>(cMax); ++i) {
        counters.increment(0);
    }
    ASSERT_EQ(counters.query_count(0), cMax);

    counters.decrement(0);
    EXPECT_EQ(counters.query_count(0), cMax);
}

TEST(CountingBloomSetTest, CounterJustBelowMaxCanBeDecremented) {
    CountingBloomSet8 counters{1};
    constexpr auto cMax = std::numeric_limits<uint8_t>::max();
    for (int i = 0; i < static_cast<int>(cMax) - 1; ++i) {
        counters.increment(0);
    }
    counters.decrement(0);
    EXPECT_EQ(counters.query_count(0), cMax - 2);
}

TEST(CountingBloomSetTest, SignedCountersNeverGoNegative) {
    CountingBloomSet<int8_t> counters{2};
    counters.decrement(0);
    EXPECT_EQ(counters.query_count(0), 0);
    EXPECT_FALSE(counters.query(0));
}

TEST(CountingBloomSetTest, ClearResetsEveryCounter) {
    CountingBloomSet<uint32_t> counters{5};
    for (size_t i = 0; i < counters.size(); ++i) {
        for (size_t j = 0; j <= i; ++j) {
            counters.increment(i);
        }
    }
    counters.clear();
    EXPECT_EQ(counters, CountingBloomSet<uint32_t>{5});
}
