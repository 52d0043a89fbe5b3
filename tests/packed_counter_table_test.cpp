#include <gtest/gtest.h>
#include "PackedCounterTable.hpp"

TEST(PackedCounterTableTest, starts_zeroed) {
    PackedCounterTable table(4);
    EXPECT_EQ(table.size(), 4u);
    EXPECT_EQ(table.counters(), 64u);
    for (size_t w = 0; w < table.size(); ++w) {
        EXPECT_EQ(table.word(w), 0u);
    }
    EXPECT_TRUE(PackedCounterTable().empty());
}

TEST(PackedCounterTableTest, increment_saturates_at_15) {
    PackedCounterTable table(2);
    for (uint32_t i = 1; i <= 15; ++i) {
        EXPECT_TRUE(table.try_increment(1, 7));
        EXPECT_EQ(table.get(1, 7), i);
    }
    EXPECT_FALSE(table.try_increment(1, 7));
    EXPECT_EQ(table.get(1, 7), 15u);
    // neighbours untouched
    EXPECT_EQ(table.get(1, 6), 0u);
    EXPECT_EQ(table.get(1, 8), 0u);
    EXPECT_EQ(table.get(0, 7), 0u);
}

TEST(PackedCounterTableTest, add_saturating_clamps_and_ignores_zero_delta) {
    PackedCounterTable table(2);
    EXPECT_FALSE(table.add_saturating(0, 3, 0));
    EXPECT_TRUE(table.add_saturating(0, 3, 4));
    EXPECT_EQ(table.get(0, 3), 4u);
    EXPECT_TRUE(table.add_saturating(0, 3, 100));
    EXPECT_EQ(table.get(0, 3), 15u);
    EXPECT_FALSE(table.add_saturating(0, 3, 1));
}

TEST(PackedCounterTableTest, raise_to_never_lowers) {
    PackedCounterTable table(2);
    EXPECT_TRUE(table.raise_to(0, 15, 9));
    EXPECT_EQ(table.get(0, 15), 9u);
    EXPECT_FALSE(table.raise_to(0, 15, 9));
    EXPECT_FALSE(table.raise_to(0, 15, 3));
    EXPECT_EQ(table.get(0, 15), 9u);
    EXPECT_TRUE(table.raise_to(0, 15, 40));
    EXPECT_EQ(table.get(0, 15), 15u);
    EXPECT_EQ(table.get(0, 14), 0u);
}

TEST(PackedCounterTableTest, halve_floors_every_counter_and_counts_odd_ones) {
    PackedCounterTable table(3);
    for (uint32_t n = 0; n < 16; ++n) {
        table.raise_to(0, n, n);
        table.raise_to(1, n, 15);
        table.raise_to(2, n, (n % 2) ? 15 : 0);
    }
    // 8 odd values in word 0, 16 in word 1, 8 in word 2
    EXPECT_EQ(table.halve(), 32u);
    for (uint32_t n = 0; n < 16; ++n) {
        EXPECT_EQ(table.get(0, n), n / 2) << "nibble " << n;
        EXPECT_EQ(table.get(1, n), 7u);
        // a 15 next to a 0 must not bleed into it
        EXPECT_EQ(table.get(2, n), (n % 2) ? 7u : 0u);
    }
    EXPECT_EQ(table.halve(), 32u);
    EXPECT_EQ(table.get(1, 0), 3u);
}
