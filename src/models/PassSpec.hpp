/**
 * @file PassSpec.hpp
 * @brief Overwrite pattern data types
 *
 * A pass is pure data: a pattern kind plus its bytes. The pass executor
 * consumes every kind the same way, there is no per-pattern subclass.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @enum PatternKind
 * @brief Closed set of byte-generation rules for one pass
 */
enum class PatternKind {
    CONSTANT,  ///< One byte repeated
    SEQUENCE,  ///< Multi-byte sequence repeated from offset 0
    RANDOM     ///< Cryptographically secure random stream
};

/**
 * @struct PassSpec
 * @brief The resolved byte-generation rule for one pass
 */
struct PassSpec {
    std::string name;
    PatternKind kind = PatternKind::CONSTANT;
    std::vector<uint8_t> bytes;  ///< Empty for RANDOM

    [[nodiscard]] static auto constant(std::string pass_name, uint8_t value) -> PassSpec {
        return PassSpec{std::move(pass_name), PatternKind::CONSTANT, {value}};
    }

    [[nodiscard]] static auto sequence(std::string pass_name, std::vector<uint8_t> values)
        -> PassSpec {
        if (values.size() == 1) {
            return constant(std::move(pass_name), values.front());
        }
        return PassSpec{std::move(pass_name), PatternKind::SEQUENCE, std::move(values)};
    }

    [[nodiscard]] static auto random(std::string pass_name) -> PassSpec {
        return PassSpec{std::move(pass_name), PatternKind::RANDOM, {}};
    }

    [[nodiscard]] auto is_random() const -> bool { return kind == PatternKind::RANDOM; }

    auto operator==(const PassSpec&) const -> bool = default;
};

/**
 * @enum Standard
 * @brief Named overwrite standards
 */
enum class Standard {
    ZERO_FILL,   ///< 1 pass, 0x00
    ONE_FILL,    ///< 1 pass, 0xFF
    RANDOM,      ///< 1 pass, secure random
    DOD_3,       ///< 0x55, 0xAA, random
    GUTMANN_35,  ///< Gutmann 35-pass sequence
    CUSTOM,      ///< Caller byte sequence repeated for N passes
    CLASSIC,     ///< Legacy shredder rotation of N passes
    SCHNEIER_7,  ///< 0x00, 0xFF, 5 x random
    VSITR_7,     ///< German VSITR 7-pass
    GOST_2       ///< GOST R 50739-95, 0x00 then random
};

/**
 * @struct PatternRequest
 * @brief Caller's choice of standard, with parameters for CUSTOM and CLASSIC
 */
struct PatternRequest {
    Standard standard = Standard::DOD_3;
    std::vector<uint8_t> custom_pattern;  ///< CUSTOM only
    int pass_count = 0;                   ///< CUSTOM and CLASSIC only
};
