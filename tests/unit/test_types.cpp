/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 * @author log_courier contributors
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace log_courier;

TEST(LevelTest, Ordered) {
    EXPECT_LT(Level::Debug, Level::Verbose);
    EXPECT_LT(Level::Verbose, Level::Message);
    EXPECT_LT(Level::Message, Level::Warning);
    EXPECT_LT(Level::Warning, Level::Error);
    EXPECT_LT(Level::Error, Level::Fatal);
    EXPECT_LT(Level::Fatal, Level::Control);
}

TEST(LevelTest, ToString) {
    EXPECT_EQ(to_string(Level::Debug), "debug");
    EXPECT_EQ(to_string(Level::Warning), "warning");
    EXPECT_EQ(to_string(Level::Control), "control");
}

TEST(LevelTest, ParseNamesCaseInsensitive) {
    EXPECT_EQ(parse_level("ERROR"), Level::Error);
    EXPECT_EQ(parse_level("Warning"), Level::Warning);
    EXPECT_EQ(parse_level(" verbose "), Level::Verbose);
}

TEST(LevelTest, ParseNumbers) {
    EXPECT_EQ(parse_level("0"), Level::Debug);
    EXPECT_EQ(parse_level("4"), Level::Error);
    EXPECT_EQ(parse_level("6"), Level::Control);
    EXPECT_FALSE(parse_level("7").has_value());
}

TEST(LevelTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_level("loud").has_value());
    EXPECT_FALSE(parse_level("").has_value());
}

TEST(TimestampTest, MicrosecondPrecision) {
    auto ts = now_timestamp();
    auto since_epoch = ts.time_since_epoch();
    EXPECT_EQ(since_epoch, std::chrono::duration_cast<std::chrono::microseconds>(since_epoch));
    EXPECT_GT(since_epoch.count(), 0);
}
