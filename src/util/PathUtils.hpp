/**
 * @file PathUtils.hpp
 * @brief Path normalization and component-wise prefix matching
 */

#pragma once

#include <filesystem>

namespace util {

/**
 * @brief Absolute, lexically normal form with symlinks resolved where the path exists
 *
 * Falls back to the lexical form when resolution fails, so a missing
 * target still normalizes. Trailing separators are dropped.
 */
[[nodiscard]] auto normalize_path(const std::filesystem::path& path) -> std::filesystem::path;

/**
 * @brief Absolute, lexically normal form without touching the filesystem
 */
[[nodiscard]] auto lexical_path(const std::filesystem::path& path) -> std::filesystem::path;

/**
 * @brief Where the entry named by @p path physically lives
 *
 * The parent directory is resolved; the final component is kept as is, so
 * a symlink names its own location rather than its target.
 */
[[nodiscard]] auto physical_path(const std::filesystem::path& path) -> std::filesystem::path;

/**
 * @brief True if @p path equals @p prefix or lies beneath it
 *
 * Comparison is per path component: "/usrdata" is not under "/usr".
 * Both arguments are expected to be normalized.
 */
[[nodiscard]] auto is_same_or_under(const std::filesystem::path& path,
                                    const std::filesystem::path& prefix) -> bool;

}  // namespace util
