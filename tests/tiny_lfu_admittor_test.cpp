#include <gtest/gtest.h>
#include <stdexcept>
#include "TinyLfuAdmittor.hpp"

namespace {

FrequencySketchOptions seeded() {
    FrequencySketchOptions opt;
    opt.seed = 77;
    return opt;
}

}

TEST(TinyLfuAdmittorTest, hot_candidate_replaces_cold_victim) {
    TinyLfuAdmittor<int> admittor(100, seeded());
    for (int i = 0; i < 6; ++i) admittor.record(1);
    admittor.record(2);

    EXPECT_EQ(admittor.frequency(1), 6u);
    EXPECT_EQ(admittor.frequency(2), 1u);
    EXPECT_TRUE(admittor.admit(1, 2));
    EXPECT_FALSE(admittor.admit(2, 1));
    EXPECT_EQ(admittor.admitted(), 1u);
    EXPECT_EQ(admittor.rejected(), 1u);
}

TEST(TinyLfuAdmittorTest, ties_favour_the_victim) {
    TinyLfuAdmittor<int> admittor(100, seeded());
    admittor.record(1);
    admittor.record(2);
    EXPECT_FALSE(admittor.admit(1, 2));
    EXPECT_FALSE(admittor.admit(3, 4));
    EXPECT_EQ(admittor.rejected(), 2u);
}

TEST(TinyLfuAdmittorTest, growing_resets_popularity) {
    TinyLfuAdmittor<int> admittor(16, seeded());
    for (int i = 0; i < 4; ++i) admittor.record(1);
    admittor.ensure_capacity(16);
    EXPECT_EQ(admittor.frequency(1), 4u);
    admittor.ensure_capacity(4096);
    EXPECT_EQ(admittor.frequency(1), 0u);
    EXPECT_EQ(admittor.sketch().table_length(), 4096u);
}

TEST(TinyLfuAdmittorTest, negative_size_is_rejected) {
    EXPECT_THROW(TinyLfuAdmittor<int>(-5), std::invalid_argument);
}
