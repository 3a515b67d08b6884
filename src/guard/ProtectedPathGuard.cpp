#include "guard/ProtectedPathGuard.hpp"

#include "util/Logger.hpp"
#include "util/PathUtils.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <format>

namespace guard {

namespace {

auto matches_any(const std::vector<std::filesystem::path>& prefixes,
                 const std::filesystem::path& path) -> const std::filesystem::path* {
    auto it = std::find_if(prefixes.begin(), prefixes.end(), [&path](const auto& prefix) {
        return util::is_same_or_under(path, prefix);
    });
    return it != prefixes.end() ? &*it : nullptr;
}

}  // namespace

ProtectedPathGuard::ProtectedPathGuard(RuleSetPtr rules) : rules_(std::move(rules)) {
    if (!rules_) {
        rules_ = std::make_shared<const ProtectedRuleSet>(ProtectedRuleSet::builtin_only());
    }
}

auto ProtectedPathGuard::is_whitelisted(const std::filesystem::path& location) const -> bool {
    return matches_any(rules_->whitelist_prefixes, location) != nullptr;
}

auto ProtectedPathGuard::check(const std::filesystem::path& path) const -> GuardVerdict {
    if (path.empty()) {
        return GuardVerdict::deny("empty path");
    }
    return evaluate(util::physical_path(path), path);
}

auto ProtectedPathGuard::evaluate(const std::filesystem::path& location,
                                  const std::filesystem::path& requested) const -> GuardVerdict {
    if (location == location.root_path()) {
        return GuardVerdict::deny("filesystem root");
    }

    if (const auto* root = matches_any(rules_->builtin_system_roots, location)) {
        LOG_WARNING("ProtectedPathGuard",
                    std::format("Denied {}: builtin system root {}", requested.string(),
                                root->string()));
        return GuardVerdict::deny(std::format("builtin system root {}", root->string()));
    }

    if (const auto* prefix = matches_any(rules_->blacklist_prefixes, location)) {
        if (!is_whitelisted(location)) {
            LOG_WARNING("ProtectedPathGuard", std::format("Denied {}: blacklisted by {}",
                                                          requested.string(), prefix->string()));
            return GuardVerdict::deny(std::format("blacklisted prefix {}", prefix->string()));
        }
    }

    return GuardVerdict::allow();
}

auto ProtectedPathGuard::check_volume(const std::filesystem::path& volume_root) const
    -> GuardVerdict {
    if (volume_root.empty()) {
        return GuardVerdict::deny("empty path");
    }
    // Fillers are created inside the directory, so the volume root is followed to its target
    const auto location = util::normalize_path(volume_root);
    auto verdict = evaluate(location, volume_root);
    if (!verdict) {
        return verdict;
    }

    if (rules_->protected_volumes.empty()) {
        return verdict;
    }

    struct stat st{};
    if (::stat(volume_root.c_str(), &st) != 0) {
        return GuardVerdict::deny(std::format("cannot stat volume root {}", volume_root.string()));
    }

    const bool on_protected_volume =
        std::find(rules_->protected_volumes.begin(), rules_->protected_volumes.end(), st.st_dev) !=
        rules_->protected_volumes.end();

    if (on_protected_volume && !is_whitelisted(location)) {
        LOG_WARNING("ProtectedPathGuard",
                    std::format("Denied free-space wipe of {}: active root/boot volume",
                                volume_root.string()));
        return GuardVerdict::deny("active root/boot volume");
    }
    return verdict;
}

}  // namespace guard
