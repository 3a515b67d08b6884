/**
 * @file LockDetector.hpp
 * @brief Detects targets held by another process
 */

#pragma once

#include "util/Error.hpp"

#include <sys/types.h>

#include <expected>
#include <filesystem>
#include <string>

namespace guard {

/**
 * @struct LockProbe
 * @brief Unlocked, or Locked with a hint about the holder
 */
struct LockProbe {
    bool locked = false;
    std::string holder_hint;

    [[nodiscard]] static auto unlocked() -> LockProbe { return {}; }
    [[nodiscard]] static auto held_by(std::string hint) -> LockProbe {
        return LockProbe{true, std::move(hint)};
    }
};

/**
 * @class ILockDetector
 * @brief Interface for exclusive-access checks
 */
class ILockDetector {
public:
    virtual ~ILockDetector() = default;

    /**
     * @brief Check whether @p path could be exclusively acquired right now
     *
     * The probe releases whatever it acquired before returning.
     */
    [[nodiscard]] virtual auto probe(const std::filesystem::path& path)
        -> std::expected<LockProbe, util::Error> = 0;

    /**
     * @brief Take an exclusive, non-blocking lock on an already open descriptor
     *
     * The lock lives as long as the descriptor. Returns Locked if another
     * holder exists.
     */
    [[nodiscard]] virtual auto acquire(int fd) -> std::expected<LockProbe, util::Error> = 0;
};

/**
 * @class LockDetector
 * @brief flock(2) and POSIX record-lock based detector
 *
 * A target counts as locked if flock(LOCK_EX | LOCK_NB) fails, or if
 * F_GETLK reports a conflicting record lock. Holder hints come from the
 * F_GETLK pid or, for flock holders, from /proc/locks.
 */
class LockDetector : public ILockDetector {
public:
    [[nodiscard]] auto probe(const std::filesystem::path& path)
        -> std::expected<LockProbe, util::Error> override;

    [[nodiscard]] auto acquire(int fd) -> std::expected<LockProbe, util::Error> override;

    /**
     * @brief Look up the pid holding a lock on the given inode in /proc/locks
     * @return "pid N" or an empty string if not found
     */
    [[nodiscard]] static auto find_holder(dev_t device, ino_t inode) -> std::string;

private:
    [[nodiscard]] static auto check_descriptor(int fd) -> std::expected<LockProbe, util::Error>;
};

}  // namespace guard
