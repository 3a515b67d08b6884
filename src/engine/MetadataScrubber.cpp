#include "engine/MetadataScrubber.hpp"

#include "util/SecureRandom.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>

#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace engine::metadata {

namespace {

constexpr int64_t EARLIEST_TIMESTAMP = 946'684'800;  // 2000-01-01T00:00:00Z
constexpr int MAX_RENAME_ATTEMPTS = 16;
constexpr size_t RANDOM_NAME_LENGTH = 16;

auto random_times() -> std::expected<std::array<timespec, 2>, util::Error> {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    const auto span = static_cast<uint64_t>(std::max<int64_t>(now - EARLIEST_TIMESTAMP, 1));

    std::array<timespec, 2> times{};
    for (auto& time : times) {
        auto seconds = util::SecureRandom::uniform(span);
        auto nanos = util::SecureRandom::uniform(1'000'000'000);
        if (!seconds || !nanos) {
            return std::unexpected(!seconds ? seconds.error() : nanos.error());
        }
        time.tv_sec = static_cast<time_t>(EARLIEST_TIMESTAMP + static_cast<int64_t>(*seconds));
        time.tv_nsec = static_cast<long>(*nanos);
    }
    return times;
}

auto rename_noreplace(const std::filesystem::path& from, const std::filesystem::path& to) -> int {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return 0;
    }
    if (errno != EINVAL && errno != ENOSYS) {
        return errno;
    }
    // Filesystem without RENAME_NOREPLACE support
    struct stat st{};
    if (::lstat(to.c_str(), &st) == 0) {
        return EEXIST;
    }
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return errno;
    }
    return 0;
}

}  // namespace

auto randomize_timestamps(int fd) -> std::expected<void, util::Error> {
    auto times = random_times();
    if (!times) {
        return std::unexpected(times.error());
    }
    if (::futimens(fd, times->data()) != 0) {
        return util::fail_errno(ErrorKind::IO_ERROR, "futimens");
    }
    return {};
}

auto randomize_timestamps(const std::filesystem::path& path) -> std::expected<void, util::Error> {
    auto times = random_times();
    if (!times) {
        return std::unexpected(times.error());
    }
    if (::utimensat(AT_FDCWD, path.c_str(), times->data(), AT_SYMLINK_NOFOLLOW) != 0) {
        return util::fail_errno(ErrorKind::IO_ERROR, "utimensat " + path.string());
    }
    return {};
}

auto rename_to_random(const std::filesystem::path& path)
    -> std::expected<std::filesystem::path, util::Error> {
    const auto parent = path.parent_path();
    for (int attempt = 0; attempt < MAX_RENAME_ATTEMPTS; ++attempt) {
        auto name = util::SecureRandom::name(RANDOM_NAME_LENGTH);
        if (!name) {
            return std::unexpected(name.error());
        }
        const auto candidate = parent / *name;
        const int err = rename_noreplace(path, candidate);
        if (err == 0) {
            return candidate;
        }
        if (err != EEXIST) {
            return util::fail(ErrorKind::IO_ERROR,
                              std::format("rename {}: {}", path.string(), std::strerror(err)), err);
        }
    }
    return util::fail(ErrorKind::IO_ERROR,
                      std::format("rename {}: no free random name after {} attempts",
                                  path.string(), MAX_RENAME_ATTEMPTS),
                      EEXIST);
}

}  // namespace engine::metadata
