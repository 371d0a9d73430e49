// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "knet_reader/utils/ErrorAccumulator.hpp"

using knet_reader::utils::ErrorAccumulator;

TEST(ErrorAccumulatorTest, StartsEmpty) {
    ErrorAccumulator acc;
    EXPECT_TRUE(acc.empty());
    EXPECT_EQ(0u, acc.count());
}

TEST(ErrorAccumulatorTest, AddsMessagesWithDelimiter) {
    ErrorAccumulator acc;
    acc.add("first");
    acc.add("");
    acc.add("second");

    EXPECT_EQ("first; second", acc.str());
    EXPECT_EQ(2u, acc.count());
}

TEST(ErrorAccumulatorTest, PrefixesSource) {
    ErrorAccumulator acc;
    acc.add("a.NS", "IoError: Cannot open file: a.NS");
    acc.add("b.NS", "");
    EXPECT_EQ("a.NS: IoError: Cannot open file: a.NS", acc.str());
    EXPECT_EQ(1u, acc.count());
}

TEST(ErrorAccumulatorTest, ClearsMessages) {
    ErrorAccumulator acc;
    acc.add("error");
    acc.clear();
    EXPECT_TRUE(acc.empty());
    EXPECT_EQ(0u, acc.count());
}
