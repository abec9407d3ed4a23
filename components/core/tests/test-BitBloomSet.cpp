#include <cstddef>

#include <gtest/gtest.h>

#include "../src/generic_bloom/storage/BitBloomSet.hpp"
#include "../src/generic_bloom/storage/BloomSet.hpp"

using generic_bloom::BinaryBloomSet;
using generic_bloom::BitBloomSet;
using generic_bloom::BloomSet;
using generic_bloom::BloomSetDelete;
using generic_bloom::ErrorCodeBadParam;
using generic_bloom::SpectralBloomSet;

static_assert(BloomSet<BitBloomSet>);
static_assert(BinaryBloomSet<BitBloomSet>);
static_assert(false == BloomSetDelete<BitBloomSet>);
static_assert(false == SpectralBloomSet<BitBloomSet>);

TEST(BitBloomSetTest, StartsEmpty) {
    constexpr size_t cNumBits{37};
    BitBloomSet const bits{cNumBits};
    EXPECT_EQ(bits.size(), cNumBits);
    for (size_t i = 0; i < cNumBits; ++i) {
        EXPECT_FALSE(bits.query(i));
    }
    EXPECT_EQ(bits.count_set_bits(), 0U);
}

TEST(BitBloomSetTest, IncrementSetsOnlyThatBit) {
    BitBloomSet bits{20};
    bits.increment(0);
    bits.increment(9);
    bits.increment(19);
    for (size_t i = 0; i < bits.size(); ++i) {
        EXPECT_EQ(bits.query(i), 0 == i || 9 == i || 19 == i) << "bit " << i;
    }
}

TEST(BitBloomSetTest, IncrementIsIdempotent) {
    BitBloomSet bits{8};
    bits.increment(3);
    bits.increment(3);
    bits.increment(3);
    EXPECT_TRUE(bits.query(3));
    EXPECT_EQ(bits.count_set_bits(), 1U);
}

TEST(BitBloomSetTest, ClearResetsEveryBit) {
    BitBloomSet bits{100};
    for (size_t i = 0; i < bits.size(); i += 3) {
        bits.increment(i);
    }
    bits.clear();
    EXPECT_EQ(bits.count_set_bits(), 0U);
    EXPECT_EQ(bits, BitBloomSet{100});
}

TEST(BitBloomSetTest, UnionIsBitwiseOr) {
    BitBloomSet lhs{12};
    BitBloomSet rhs{12};
    lhs.increment(1);
    lhs.increment(4);
    rhs.increment(4);
    rhs.increment(11);

    lhs.union_with(rhs);
    EXPECT_TRUE(lhs.query(1));
    EXPECT_TRUE(lhs.query(4));
    EXPECT_TRUE(lhs.query(11));
    EXPECT_EQ(lhs.count_set_bits(), 3U);
    EXPECT_EQ(rhs.count_set_bits(), 2U);
}

TEST(BitBloomSetTest, IntersectIsBitwiseAnd) {
    BitBloomSet lhs{12};
    BitBloomSet rhs{12};
    lhs.increment(1);
    lhs.increment(4);
    rhs.increment(4);
    rhs.increment(11);

    lhs.intersect_with(rhs);
    EXPECT_FALSE(lhs.query(1));
    EXPECT_TRUE(lhs.query(4));
    EXPECT_FALSE(lhs.query(11));
    EXPECT_EQ(lhs.count_set_bits(), 1U);
}

TEST(BitBloomSetTest, CombiningDifferentSizesThrows) {
    BitBloomSet lhs{16};
    BitBloomSet const rhs{17};
    try {
        lhs.union_with(rhs);
        FAIL() << "union of differently sized bit sets succeeded";
    } catch (BitBloomSet::OperationFailed const& e) {
        EXPECT_EQ(e.get_error_code(), ErrorCodeBadParam);
    }
    EXPECT_THROW(lhs.intersect_with(rhs), BitBloomSet::OperationFailed);
}
