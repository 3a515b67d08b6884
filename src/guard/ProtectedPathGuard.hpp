/**
 * @file ProtectedPathGuard.hpp
 * @brief Allow/deny decision for a destructive target
 */

#pragma once

#include "guard/ProtectedRuleSet.hpp"

#include <filesystem>
#include <string>

namespace guard {

/**
 * @struct GuardVerdict
 * @brief Allow, or Deny with a reason
 */
struct GuardVerdict {
    bool allowed = true;
    std::string reason;

    [[nodiscard]] static auto allow() -> GuardVerdict { return {}; }
    [[nodiscard]] static auto deny(std::string why) -> GuardVerdict {
        return GuardVerdict{false, std::move(why)};
    }

    explicit operator bool() const { return allowed; }
};

/**
 * @class ProtectedPathGuard
 * @brief Evaluates targets against an immutable ProtectedRuleSet
 *
 * Precedence: builtin system roots always deny; otherwise the whitelist
 * overrides blacklist entries and protected volumes. Every rule is matched
 * against one path: the target's physical location, with its parent
 * directories resolved and its final component left as named. A file reached
 * through a directory link into /etc is therefore judged as /etc, while a
 * symlink is judged where it lives, not by what it points to.
 *
 * Safe to call concurrently; the guard holds no mutable state.
 */
class ProtectedPathGuard {
public:
    explicit ProtectedPathGuard(RuleSetPtr rules);

    /**
     * @brief Decide whether @p path may be overwritten or removed
     */
    [[nodiscard]] auto check(const std::filesystem::path& path) const -> GuardVerdict;

    /**
     * @brief Decide whether free space may be wiped on the volume holding @p volume_root
     *
     * Applies check() and additionally denies the active root/boot volume
     * unless @p volume_root is whitelisted.
     */
    [[nodiscard]] auto check_volume(const std::filesystem::path& volume_root) const -> GuardVerdict;

    [[nodiscard]] auto rules() const -> const ProtectedRuleSet& { return *rules_; }

private:
    [[nodiscard]] auto evaluate(const std::filesystem::path& location,
                                const std::filesystem::path& requested) const -> GuardVerdict;
    [[nodiscard]] auto is_whitelisted(const std::filesystem::path& location) const -> bool;

    RuleSetPtr rules_;
};

}  // namespace guard
