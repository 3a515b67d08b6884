/**
 * @file PatternSourceTest.cpp
 * @brief Unit tests for standard resolution and buffer filling
 */

#include "patterns/PatternSource.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

using patterns::PatternSource;

namespace {

std::vector<PassSpec> Resolve(Standard standard, int pass_count = 0,
                              std::vector<uint8_t> custom = {}) {
    auto passes = PatternSource::resolve(
        PatternRequest{.standard = standard, .custom_pattern = std::move(custom),
                       .pass_count = pass_count});
    EXPECT_TRUE(passes.has_value()) << (passes ? "" : passes.error().message);
    return passes ? *passes : std::vector<PassSpec>{};
}

bool IsConstant(const PassSpec& pass, uint8_t value) {
    return pass.kind == PatternKind::CONSTANT && pass.bytes == std::vector<uint8_t>{value};
}

bool IsSequence(const PassSpec& pass, std::vector<uint8_t> values) {
    return pass.kind == PatternKind::SEQUENCE && pass.bytes == values;
}

}  // namespace

// Test: fixed single-pass standards
TEST(PatternSourceTest, ZeroFill_IsSingleZeroPass) {
    auto passes = Resolve(Standard::ZERO_FILL);
    ASSERT_EQ(passes.size(), 1u);
    EXPECT_TRUE(IsConstant(passes[0], 0x00));
}

TEST(PatternSourceTest, OneFill_IsSingleFfPass) {
    auto passes = Resolve(Standard::ONE_FILL);
    ASSERT_EQ(passes.size(), 1u);
    EXPECT_TRUE(IsConstant(passes[0], 0xFF));
}

TEST(PatternSourceTest, Random_IsSingleRandomPass) {
    auto passes = Resolve(Standard::RANDOM);
    ASSERT_EQ(passes.size(), 1u);
    EXPECT_TRUE(passes[0].is_random());
}

TEST(PatternSourceTest, Dod3_Is55AaRandom) {
    auto passes = Resolve(Standard::DOD_3);
    ASSERT_EQ(passes.size(), 3u);
    EXPECT_TRUE(IsConstant(passes[0], 0x55));
    EXPECT_TRUE(IsConstant(passes[1], 0xAA));
    EXPECT_TRUE(passes[2].is_random());
}

// Test: Gutmann 35-pass table in its documented order
TEST(PatternSourceTest, Gutmann35_MatchesPublishedTable) {
    auto passes = Resolve(Standard::GUTMANN_35);
    ASSERT_EQ(passes.size(), 35u);

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(passes[i].is_random()) << "pass " << i + 1;
        EXPECT_TRUE(passes[31 + i].is_random()) << "pass " << 32 + i;
    }
    EXPECT_TRUE(IsConstant(passes[4], 0x55));
    EXPECT_TRUE(IsConstant(passes[5], 0xAA));
    EXPECT_TRUE(IsSequence(passes[6], {0x92, 0x49, 0x24}));
    EXPECT_TRUE(IsSequence(passes[7], {0x49, 0x24, 0x92}));
    EXPECT_TRUE(IsSequence(passes[8], {0x24, 0x92, 0x49}));
    for (int i = 0; i < 16; ++i) {
        EXPECT_TRUE(IsConstant(passes[9 + i], static_cast<uint8_t>(i * 0x11))) << "pass " << 10 + i;
    }
    EXPECT_TRUE(IsSequence(passes[25], {0x92, 0x49, 0x24}));
    EXPECT_TRUE(IsSequence(passes[26], {0x49, 0x24, 0x92}));
    EXPECT_TRUE(IsSequence(passes[27], {0x24, 0x92, 0x49}));
    EXPECT_TRUE(IsSequence(passes[28], {0x6D, 0xB6, 0xDB}));
    EXPECT_TRUE(IsSequence(passes[29], {0xB6, 0xDB, 0x6D}));
    EXPECT_TRUE(IsSequence(passes[30], {0xDB, 0x6D, 0xB6}));
}

TEST(PatternSourceTest, Schneier7_ZeroOneThenFiveRandom) {
    auto passes = Resolve(Standard::SCHNEIER_7);
    ASSERT_EQ(passes.size(), 7u);
    EXPECT_TRUE(IsConstant(passes[0], 0x00));
    EXPECT_TRUE(IsConstant(passes[1], 0xFF));
    for (size_t i = 2; i < passes.size(); ++i) {
        EXPECT_TRUE(passes[i].is_random());
    }
}

TEST(PatternSourceTest, Vsitr7_AlternatesThenEndsWithAa) {
    auto passes = Resolve(Standard::VSITR_7);
    ASSERT_EQ(passes.size(), 7u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_TRUE(IsConstant(passes[i], i % 2 == 0 ? 0x00 : 0xFF));
    }
    EXPECT_TRUE(IsConstant(passes[6], 0xAA));
}

TEST(PatternSourceTest, Gost2_ZeroThenRandom) {
    auto passes = Resolve(Standard::GOST_2);
    ASSERT_EQ(passes.size(), 2u);
    EXPECT_TRUE(IsConstant(passes[0], 0x00));
    EXPECT_TRUE(passes[1].is_random());
}

// Test: every valid N yields exactly N passes
TEST(PatternSourceTest, Custom_EveryValidCountYieldsThatManyPasses) {
    for (int n = PatternSource::MIN_PASSES; n <= PatternSource::MAX_PASSES; ++n) {
        auto passes = Resolve(Standard::CUSTOM, n, {0xDE, 0xAD});
        ASSERT_EQ(passes.size(), static_cast<size_t>(n));
        EXPECT_TRUE(std::all_of(passes.begin(), passes.end(),
                                [](const PassSpec& p) { return IsSequence(p, {0xDE, 0xAD}); }));
    }
}

TEST(PatternSourceTest, Classic_EveryValidCountYieldsThatManyPasses) {
    for (int n = PatternSource::MIN_PASSES; n <= PatternSource::MAX_PASSES; ++n) {
        EXPECT_EQ(Resolve(Standard::CLASSIC, n).size(), static_cast<size_t>(n));
    }
}

TEST(PatternSourceTest, Classic_FollowsRotationOrder) {
    auto passes = Resolve(Standard::CLASSIC, 8);
    ASSERT_EQ(passes.size(), 8u);
    EXPECT_TRUE(IsConstant(passes[0], 0x00));
    EXPECT_TRUE(IsConstant(passes[1], 0xFF));
    EXPECT_TRUE(IsConstant(passes[2], 0xAA));
    EXPECT_TRUE(IsConstant(passes[3], 0x55));
    EXPECT_EQ(passes[4].kind, PatternKind::CONSTANT);
    EXPECT_TRUE(passes[5].is_random());
    EXPECT_TRUE(IsSequence(passes[6], {0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_EQ(passes[7].kind, PatternKind::CONSTANT);
}

TEST(PatternSourceTest, Custom_SingleBytePatternIsConstant) {
    auto passes = Resolve(Standard::CUSTOM, 2, {0x7E});
    ASSERT_EQ(passes.size(), 2u);
    EXPECT_TRUE(IsConstant(passes[0], 0x7E));
}

// Test: parameter validation
TEST(PatternSourceTest, Custom_PassCountOutOfRangeFails) {
    for (int n : {0, -1, 36, 100}) {
        auto passes = PatternSource::resolve(
            {.standard = Standard::CUSTOM, .custom_pattern = {0x01}, .pass_count = n});
        ASSERT_FALSE(passes.has_value()) << n;
        EXPECT_EQ(passes.error().kind, ErrorKind::INVALID_PASS_COUNT);
    }
}

TEST(PatternSourceTest, Classic_PassCountOutOfRangeFails) {
    auto passes = PatternSource::resolve({.standard = Standard::CLASSIC, .pass_count = 36});
    ASSERT_FALSE(passes.has_value());
    EXPECT_EQ(passes.error().kind, ErrorKind::INVALID_PASS_COUNT);
}

TEST(PatternSourceTest, Custom_EmptyPatternFails) {
    auto passes = PatternSource::resolve({.standard = Standard::CUSTOM, .pass_count = 3});
    ASSERT_FALSE(passes.has_value());
    EXPECT_EQ(passes.error().kind, ErrorKind::INVALID_PATTERN);
}

TEST(PatternSourceTest, ResolveByName_UnknownStandardFails) {
    auto passes = PatternSource::resolve_by_name("nsa-130-2");
    ASSERT_FALSE(passes.has_value());
    EXPECT_EQ(passes.error().kind, ErrorKind::UNKNOWN_STANDARD);
}

TEST(PatternSourceTest, ResolveByName_AcceptsCaseAndUnderscores) {
    auto passes = PatternSource::resolve_by_name("DoD_3");
    ASSERT_TRUE(passes.has_value());
    EXPECT_EQ(passes->size(), 3u);
}

TEST(PatternSourceTest, ParseStandard_RoundTripsEveryName) {
    for (auto standard : {Standard::ZERO_FILL, Standard::ONE_FILL, Standard::RANDOM,
                          Standard::DOD_3, Standard::GUTMANN_35, Standard::CUSTOM,
                          Standard::CLASSIC, Standard::SCHNEIER_7, Standard::VSITR_7,
                          Standard::GOST_2}) {
        auto parsed = PatternSource::parse_standard(PatternSource::standard_name(standard));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, standard);
    }
}

// Test: buffer filling
TEST(PatternSourceTest, Fill_SequencePhaseFollowsOffset) {
    auto pass = PassSpec::sequence("seq", {0x92, 0x49, 0x24});
    std::vector<uint8_t> buffer(5);

    ASSERT_TRUE(PatternSource::fill(pass, buffer, 4).has_value());

    // Offset 4 is phase 1
    EXPECT_EQ(buffer, (std::vector<uint8_t>{0x49, 0x24, 0x92, 0x49, 0x24}));
    for (size_t i = 0; i < buffer.size(); ++i) {
        EXPECT_EQ(buffer[i], PatternSource::expected_byte(pass, 4 + i));
    }
}

TEST(PatternSourceTest, Fill_ConstantIsIndependentOfOffset) {
    auto pass = PassSpec::constant("c", 0xAA);
    std::vector<uint8_t> buffer(64);
    ASSERT_TRUE(PatternSource::fill(pass, buffer, 12'345).has_value());
    EXPECT_TRUE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0xAA; }));
}

TEST(PatternSourceTest, Fill_RandomProducesVaryingBytes) {
    auto pass = PassSpec::random("r");
    std::vector<uint8_t> buffer(4'096, 0);
    ASSERT_TRUE(PatternSource::fill(pass, buffer, 0).has_value());
    std::set<uint8_t> distinct(buffer.begin(), buffer.end());
    EXPECT_GT(distinct.size(), 200u);
}
