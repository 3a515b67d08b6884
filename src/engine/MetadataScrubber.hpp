/**
 * @file MetadataScrubber.hpp
 * @brief Timestamp randomization and non-informative renames
 */

#pragma once

#include "util/Error.hpp"

#include <expected>
#include <filesystem>

namespace engine::metadata {

/**
 * @brief Set access and modification times of @p fd to random instants
 *
 * Times are drawn uniformly between 2000-01-01 and now.
 */
[[nodiscard]] auto randomize_timestamps(int fd) -> std::expected<void, util::Error>;

/**
 * @brief Same as randomize_timestamps(int) for an entry that is not opened
 *
 * Does not follow symbolic links.
 */
[[nodiscard]] auto randomize_timestamps(const std::filesystem::path& path)
    -> std::expected<void, util::Error>;

/**
 * @brief Rename @p path to a random name in the same directory
 *
 * Never replaces an existing entry; retries with a fresh name on collision.
 * @return The new path
 */
[[nodiscard]] auto rename_to_random(const std::filesystem::path& path)
    -> std::expected<std::filesystem::path, util::Error>;

}  // namespace engine::metadata
