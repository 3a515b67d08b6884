/**
 * @file ProtectedRuleSet.hpp
 * @brief Immutable exclusion rules consulted before any destructive call
 */

#pragma once

#include "util/Error.hpp"

#include <sys/types.h>

#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

namespace guard {

/**
 * @struct ProtectedRuleSet
 * @brief Blacklist, whitelist and builtin system roots
 *
 * Built once (defaults() or load_file()) and shared read-only between
 * workers through a std::shared_ptr<const ProtectedRuleSet>. Tests build
 * their own isolated instances.
 *
 * Entries are stored normalized (absolute, symlinks resolved). Builtin roots
 * and deny entries that name a symlink keep the unresolved form too.
 */
struct ProtectedRuleSet {
    std::vector<std::filesystem::path> builtin_system_roots;
    std::vector<std::filesystem::path> blacklist_prefixes;
    std::vector<std::filesystem::path> whitelist_prefixes;
    std::vector<dev_t> protected_volumes;  ///< Root and boot volumes, denied for free-space wiping

    /**
     * @brief Operating-system directories that can never be whitelisted
     */
    [[nodiscard]] static auto builtin_roots() -> std::vector<std::filesystem::path>;

    /**
     * @brief Builtin roots only: no blacklist, no whitelist, no protected volumes
     */
    [[nodiscard]] static auto builtin_only() -> ProtectedRuleSet;

    /**
     * @brief Builtin roots, the root and boot volumes, and the invoking user's home whitelisted
     */
    [[nodiscard]] static auto defaults() -> ProtectedRuleSet;

    /**
     * @brief Extend @p base with rules read from a text file
     *
     * One rule per line: "deny <prefix>" or "allow <prefix>". Blank lines and
     * lines starting with '#' are ignored. Any other line is an error.
     */
    [[nodiscard]] static auto load_file(const std::filesystem::path& path, ProtectedRuleSet base)
        -> std::expected<ProtectedRuleSet, util::Error>;

    /**
     * @brief Return a copy with an extra blacklist prefix
     */
    [[nodiscard]] auto with_blacklist(const std::filesystem::path& prefix) const -> ProtectedRuleSet;

    /**
     * @brief Return a copy with an extra whitelist prefix
     */
    [[nodiscard]] auto with_whitelist(const std::filesystem::path& prefix) const -> ProtectedRuleSet;
};

using RuleSetPtr = std::shared_ptr<const ProtectedRuleSet>;

}  // namespace guard
