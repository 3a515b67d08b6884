#include "guard/LockDetector.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <format>
#include <fstream>
#include <sstream>

namespace guard {

auto LockDetector::find_holder(dev_t device, ino_t inode) -> std::string {
    // Line format: "1: FLOCK  ADVISORY  WRITE 1234 08:01:131 0 EOF"
    std::ifstream locks("/proc/locks");
    if (!locks.is_open()) {
        return {};
    }

    const auto wanted = std::format("{:02x}:{:02x}:{}", major(device), minor(device), inode);

    std::string line;
    while (std::getline(locks, line)) {
        std::istringstream fields(line);
        std::string id, type, mode, access, pid, location;
        if (!(fields >> id >> type)) {
            continue;
        }
        // Blocked waiters are listed as "-> FLOCK ..."; skip them
        if (type == "->") {
            continue;
        }
        if (!(fields >> mode >> access >> pid >> location)) {
            continue;
        }
        if (location == wanted) {
            return std::format("pid {} ({} {})", pid, type, access);
        }
    }
    return {};
}

auto LockDetector::check_descriptor(int fd) -> std::expected<LockProbe, util::Error> {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return util::fail_errno(ErrorKind::IO_ERROR, "fstat");
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            auto hint = find_holder(st.st_dev, st.st_ino);
            return LockProbe::held_by(hint.empty() ? "flock held by another process" : hint);
        }
        return util::fail_errno(ErrorKind::IO_ERROR, "flock");
    }

    struct flock record{};
    record.l_type = F_WRLCK;
    record.l_whence = SEEK_SET;
    record.l_start = 0;
    record.l_len = 0;
    if (::fcntl(fd, F_GETLK, &record) != 0) {
        return util::fail_errno(ErrorKind::IO_ERROR, "fcntl(F_GETLK)");
    }
    if (record.l_type != F_UNLCK) {
        // l_pid is -1 for open file description locks
        if (record.l_pid > 0) {
            return LockProbe::held_by(std::format("pid {} (POSIX record lock)", record.l_pid));
        }
        auto hint = find_holder(st.st_dev, st.st_ino);
        return LockProbe::held_by(hint.empty() ? "record lock held by another process" : hint);
    }

    return LockProbe::unlocked();
}

auto LockDetector::probe(const std::filesystem::path& path)
    -> std::expected<LockProbe, util::Error> {
    auto fd = util::FileDescriptor::open(path, O_RDONLY | O_NOFOLLOW | O_NONBLOCK);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    auto result = check_descriptor(fd->get());
    if (result && result->locked) {
        LOG_INFO("LockDetector",
                 std::format("{} is locked: {}", path.string(), result->holder_hint));
    }
    // Closing the probe descriptor releases the flock we may have taken
    return result;
}

auto LockDetector::acquire(int fd) -> std::expected<LockProbe, util::Error> {
    return check_descriptor(fd);
}

}  // namespace guard
