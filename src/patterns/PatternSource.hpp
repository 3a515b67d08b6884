/**
 * @file PatternSource.hpp
 * @brief Resolves overwrite standards into ordered pass lists and fills pass buffers
 */

#pragma once

#include "models/PassSpec.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace patterns {

/**
 * @class PatternSource
 * @brief Stateless pattern resolution and generation
 *
 * @example
 * ```cpp
 * auto passes = patterns::PatternSource::resolve({.standard = Standard::DOD_3});
 * // passes: 0x55, 0xAA, random
 * ```
 */
class PatternSource {
public:
    static constexpr int MIN_PASSES = 1;
    static constexpr int MAX_PASSES = 35;

    /**
     * @brief Expand a standard into its ordered pass list
     * @return Passes, or INVALID_PASS_COUNT / INVALID_PATTERN for bad CUSTOM or CLASSIC parameters
     */
    [[nodiscard]] static auto resolve(const PatternRequest& request)
        -> std::expected<std::vector<PassSpec>, util::Error>;

    /**
     * @brief Resolve a standard given by name (e.g. "dod-3", "gutmann-35", "custom")
     * @return Passes, or UNKNOWN_STANDARD if the name is not recognized
     */
    [[nodiscard]] static auto resolve_by_name(std::string_view name,
                                              std::vector<uint8_t> custom_pattern = {},
                                              int pass_count = 0)
        -> std::expected<std::vector<PassSpec>, util::Error>;

    [[nodiscard]] static auto parse_standard(std::string_view name)
        -> std::expected<Standard, util::Error>;

    [[nodiscard]] static auto standard_name(Standard standard) -> std::string_view;

    /**
     * @brief Fill @p buffer with the bytes a pass writes at file offset @p offset
     *
     * Constant and sequence passes are deterministic in the offset; random
     * passes draw fresh CSPRNG output on every call.
     */
    [[nodiscard]] static auto fill(const PassSpec& spec, std::span<uint8_t> buffer, uint64_t offset)
        -> std::expected<void, util::Error>;

    /**
     * @brief Byte a non-random pass leaves at @p offset
     */
    [[nodiscard]] static auto expected_byte(const PassSpec& spec, uint64_t offset) -> uint8_t;
};

}  // namespace patterns
