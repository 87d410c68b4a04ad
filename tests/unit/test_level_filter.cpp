/**
 * @file test_level_filter.cpp
 * @brief Unit tests for packet admission.
 * @author log_courier contributors
 */

#include "pipeline/level_filter.hpp"

#include <gtest/gtest.h>

using namespace log_courier;

TEST(LevelFilterTest, DisabledClientAdmitsNothing) {
    FilterState state;
    state.client_enabled = false;
    EXPECT_FALSE(is_admitted(state, Level::Fatal));
    EXPECT_FALSE(is_admitted(state, Level::Control));
}

TEST(LevelFilterTest, BothThresholdsApply) {
    FilterState state{true, Level::Message, true, Level::Warning};
    EXPECT_FALSE(is_admitted(state, Level::Message));
    EXPECT_TRUE(is_admitted(state, Level::Warning));

    state.client_level = Level::Error;
    EXPECT_FALSE(is_admitted(state, Level::Warning));
    EXPECT_TRUE(is_admitted(state, Level::Error));
}

TEST(LevelFilterTest, InactiveSessionBlocksAllButControl) {
    FilterState state{true, Level::Debug, false, Level::Debug};
    EXPECT_FALSE(is_admitted(state, Level::Fatal));
    EXPECT_TRUE(is_admitted(state, Level::Control));
}

TEST(LevelFilterTest, ControlIgnoresThresholds) {
    FilterState state{true, Level::Fatal, true, Level::Fatal};
    EXPECT_TRUE(is_admitted(state, Level::Control));
}

TEST(LevelFilterTest, EvaluatedAtCompileTime) {
    constexpr FilterState state{true, Level::Debug, true, Level::Warning};
    static_assert(!is_admitted(state, Level::Debug));
    static_assert(is_admitted(state, Level::Fatal));
    SUCCEED();
}
