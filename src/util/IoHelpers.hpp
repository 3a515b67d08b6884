/**
 * @file IoHelpers.hpp
 * @brief Positional read/write loops and durability helpers
 */

#pragma once

#include "util/Error.hpp"
#include "util/FileDescriptor.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace util {

inline auto pread_with_retry(int fd, void* buffer, size_t size, uint64_t offset) -> ssize_t {
    while (true) {
        const auto result = ::pread(fd, buffer, size, static_cast<off_t>(offset));
        if (result < 0 && errno == EINTR) {
            continue;
        }
        return result;
    }
}

/**
 * @brief Write all of @p size bytes at @p offset, resuming after short writes
 *
 * ENOSPC maps to INSUFFICIENT_SPACE, everything else to IO_ERROR.
 */
[[nodiscard]] inline auto pwrite_all(int fd, const uint8_t* data, size_t size, uint64_t offset)
    -> std::expected<void, Error> {
    size_t written = 0;
    while (written < size) {
        const auto result = ::pwrite(fd, data + written, size - written,
                                     static_cast<off_t>(offset + written));
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return fail_errno(errno == ENOSPC ? ErrorKind::INSUFFICIENT_SPACE : ErrorKind::IO_ERROR,
                              "pwrite");
        }
        if (result == 0) {
            return fail(ErrorKind::IO_ERROR, "pwrite made no progress");
        }
        written += static_cast<size_t>(result);
    }
    return {};
}

/**
 * @brief Read up to @p size bytes at @p offset, stopping early only at end of file
 * @return Bytes read
 */
[[nodiscard]] inline auto pread_full(int fd, uint8_t* data, size_t size, uint64_t offset)
    -> std::expected<size_t, Error> {
    size_t total = 0;
    while (total < size) {
        const auto result = pread_with_retry(fd, data + total, size - total, offset + total);
        if (result < 0) {
            return fail_errno(ErrorKind::IO_ERROR, "pread");
        }
        if (result == 0) {
            break;
        }
        total += static_cast<size_t>(result);
    }
    return total;
}

/**
 * @brief fsync a file and drop its cached pages so later reads come from the device
 */
[[nodiscard]] inline auto sync_and_drop_cache(int fd) -> std::expected<void, Error> {
    if (::fsync(fd) != 0) {
        return fail_errno(ErrorKind::IO_ERROR, "fsync");
    }
    // Advisory; failure leaves reads served from cache, which is still the written data.
    (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_DONTNEED);
    return {};
}

/**
 * @brief fsync a directory so renames and unlinks inside it are durable
 */
[[nodiscard]] inline auto sync_directory(const std::filesystem::path& dir)
    -> std::expected<void, Error> {
    auto fd = FileDescriptor::open(dir, O_RDONLY | O_DIRECTORY);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    if (::fsync(fd->get()) != 0) {
        return fail_errno(ErrorKind::IO_ERROR, "fsync directory " + dir.string());
    }
    return {};
}

}  // namespace util
