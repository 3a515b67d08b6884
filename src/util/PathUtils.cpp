#include "util/PathUtils.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

namespace util {

namespace {

auto strip_trailing_separator(std::filesystem::path path) -> std::filesystem::path {
    if (!path.has_filename() && path.has_relative_path()) {
        path = path.parent_path();
    }
    return path;
}

}  // namespace

auto lexical_path(const std::filesystem::path& path) -> std::filesystem::path {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    return strip_trailing_separator(absolute.lexically_normal());
}

auto normalize_path(const std::filesystem::path& path) -> std::filesystem::path {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(lexical_path(path), ec);
    if (ec) {
        return lexical_path(path);
    }
    return strip_trailing_separator(resolved.lexically_normal());
}

auto physical_path(const std::filesystem::path& path) -> std::filesystem::path {
    const auto lexical = lexical_path(path);
    if (lexical == lexical.root_path() || !lexical.has_filename()) {
        return lexical;
    }
    std::error_code ec;
    auto parent = std::filesystem::weakly_canonical(lexical.parent_path(), ec);
    if (ec) {
        return lexical;
    }
    return strip_trailing_separator(parent.lexically_normal()) / lexical.filename();
}

auto is_same_or_under(const std::filesystem::path& path, const std::filesystem::path& prefix)
    -> bool {
    if (prefix.empty()) {
        return false;
    }
    auto [prefix_end, path_it] =
        std::mismatch(prefix.begin(), prefix.end(), path.begin(), path.end());
    if (prefix_end == prefix.end()) {
        return true;
    }
    // A trailing empty element ("/usr/") still counts as a match
    return std::next(prefix_end) == prefix.end() && prefix_end->empty();
}

}  // namespace util
