#include "guard/ProtectedRuleSet.hpp"

#include "util/Logger.hpp"
#include "util/PathUtils.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <string>

namespace guard {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

void add_volume_of(const char* path, std::vector<dev_t>& volumes) {
    struct stat st{};
    if (::stat(path, &st) == 0 &&
        std::find(volumes.begin(), volumes.end(), st.st_dev) == volumes.end()) {
        volumes.push_back(st.st_dev);
    }
}

// A denied link is protected under its own name as well as its target's
void add_deny_prefix(const std::filesystem::path& prefix,
                     std::vector<std::filesystem::path>& blacklist) {
    auto resolved = util::normalize_path(prefix);
    auto named = util::lexical_path(prefix);
    if (named != resolved) {
        blacklist.push_back(std::move(named));
    }
    blacklist.push_back(std::move(resolved));
}

}  // namespace

auto ProtectedRuleSet::builtin_roots() -> std::vector<std::filesystem::path> {
    static const std::vector<std::filesystem::path> roots = [] {
        const std::vector<std::filesystem::path> raw = {
            "/bin",  "/boot", "/dev",  "/etc",     "/lib",     "/lib32",
            "/lib64", "/libx32", "/proc", "/run", "/sbin",  "/sys",
            "/usr",  "/var/lib", "/var/log", "/var/spool", "/var/cache",
        };
        std::vector<std::filesystem::path> resolved;
        for (const auto& root : raw) {
            resolved.push_back(root);
            // Merged-/usr systems link /bin -> usr/bin; keep both forms
            auto normalized = util::normalize_path(root);
            if (normalized != root) {
                resolved.push_back(std::move(normalized));
            }
        }
        return resolved;
    }();
    return roots;
}

auto ProtectedRuleSet::builtin_only() -> ProtectedRuleSet {
    ProtectedRuleSet rules;
    rules.builtin_system_roots = builtin_roots();
    return rules;
}

auto ProtectedRuleSet::defaults() -> ProtectedRuleSet {
    auto rules = builtin_only();

    add_volume_of("/", rules.protected_volumes);
    add_volume_of("/boot", rules.protected_volumes);

    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        auto home_path = util::normalize_path(home);
        if (home_path != "/") {
            rules.whitelist_prefixes.push_back(std::move(home_path));
        }
    }
    return rules;
}

auto ProtectedRuleSet::load_file(const std::filesystem::path& path, ProtectedRuleSet base)
    -> std::expected<ProtectedRuleSet, util::Error> {
    std::ifstream input(path);
    if (!input.is_open()) {
        return util::fail(ErrorKind::IO_ERROR,
                          std::format("Cannot open rule file {}", path.string()));
    }

    std::string line;
    int line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        auto text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }

        const auto space = text.find_first_of(" \t");
        const auto verb = text.substr(0, space);
        const auto argument = space == std::string_view::npos ? std::string_view{}
                                                               : trim(text.substr(space));
        if (argument.empty() || (verb != "deny" && verb != "allow")) {
            return util::fail(ErrorKind::IO_ERROR,
                              std::format("{}:{}: expected 'deny <path>' or 'allow <path>'",
                                          path.string(), line_number));
        }

        const std::filesystem::path prefix(argument);
        if (verb == "deny") {
            add_deny_prefix(prefix, base.blacklist_prefixes);
        } else {
            base.whitelist_prefixes.push_back(util::normalize_path(prefix));
        }
    }

    LOG_INFO("ProtectedRuleSet",
             std::format("Loaded {}: {} deny, {} allow rules", path.string(),
                         base.blacklist_prefixes.size(), base.whitelist_prefixes.size()));
    return base;
}

auto ProtectedRuleSet::with_blacklist(const std::filesystem::path& prefix) const
    -> ProtectedRuleSet {
    auto copy = *this;
    add_deny_prefix(prefix, copy.blacklist_prefixes);
    return copy;
}

auto ProtectedRuleSet::with_whitelist(const std::filesystem::path& prefix) const
    -> ProtectedRuleSet {
    auto copy = *this;
    copy.whitelist_prefixes.push_back(util::normalize_path(prefix));
    return copy;
}

}  // namespace guard
