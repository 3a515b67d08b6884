/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Each task owns its descriptor exclusively for its lifetime; closing the
 * descriptor also drops any flock() the task took on it.
 */

#pragma once

#include "util/Error.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <expected>
#include <filesystem>
#include <format>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief RAII wrapper for POSIX file descriptors
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Construct from raw file descriptor
     * @param fd Raw file descriptor (may be invalid)
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    /**
     * @brief Open a path, mapping ENOENT to TARGET_NOT_FOUND and ELOOP to UNSUPPORTED_TARGET
     * @param path File to open
     * @param flags open(2) flags; O_CLOEXEC is always added
     * @param mode Creation mode when O_CREAT is set
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, int flags, mode_t mode = 0600)
        -> std::expected<FileDescriptor, Error> {
        const int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        if (fd < 0) {
            const int err = errno;
            auto kind = ErrorKind::IO_ERROR;
            if (err == ENOENT) {
                kind = ErrorKind::TARGET_NOT_FOUND;
            } else if (err == ELOOP) {
                kind = ErrorKind::UNSUPPORTED_TARGET;
            }
            return std::unexpected(Error{
                kind, std::format("open {}: {}", path.string(), std::strerror(err)), err});
        }
        return FileDescriptor{fd};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the current descriptor (if any) and adopt @p fd
     */
    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

}  // namespace util
