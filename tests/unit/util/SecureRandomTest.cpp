/**
 * @file SecureRandomTest.cpp
 * @brief Unit tests for the OpenSSL-backed random source
 */

#include "util/SecureRandom.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <set>
#include <vector>

TEST(SecureRandomTest, Fill_ProducesVaryingBytes) {
    std::vector<uint8_t> buffer(4'096, 0);
    ASSERT_TRUE(util::SecureRandom::fill(buffer).has_value());

    std::set<uint8_t> distinct(buffer.begin(), buffer.end());
    EXPECT_GT(distinct.size(), 200u);
}

TEST(SecureRandomTest, Fill_EmptyBufferSucceeds) {
    std::vector<uint8_t> buffer;
    EXPECT_TRUE(util::SecureRandom::fill(buffer).has_value());
}

TEST(SecureRandomTest, Fill_TwoCallsDiffer) {
    std::array<uint8_t, 32> first{};
    std::array<uint8_t, 32> second{};
    ASSERT_TRUE(util::SecureRandom::fill(first).has_value());
    ASSERT_TRUE(util::SecureRandom::fill(second).has_value());
    EXPECT_NE(first, second);
}

TEST(SecureRandomTest, Uniform_StaysBelowBound) {
    for (int i = 0; i < 1'000; ++i) {
        auto value = util::SecureRandom::uniform(7);
        ASSERT_TRUE(value.has_value());
        EXPECT_LT(*value, 7u);
    }
}

TEST(SecureRandomTest, Uniform_CoversEveryValueOfSmallRange) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 2'000 && seen.size() < 4; ++i) {
        auto value = util::SecureRandom::uniform(4);
        ASSERT_TRUE(value.has_value());
        seen.insert(*value);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST(SecureRandomTest, Name_HasRequestedLengthAndAlphabet) {
    auto name = util::SecureRandom::name(24);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->size(), 24u);
    EXPECT_TRUE(std::all_of(name->begin(), name->end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    }));
}

TEST(SecureRandomTest, Name_IsNotRepeated) {
    auto first = util::SecureRandom::name();
    auto second = util::SecureRandom::name();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
}
