#include "engine/FreeSpaceWiper.hpp"

#include "engine/FileShredder.hpp"
#include "patterns/PatternSource.hpp"
#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"
#include "util/SecureRandom.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <span>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace engine {

namespace fs = std::filesystem;

namespace {

constexpr const char* COMPONENT = "FreeSpaceWiper";

struct Filler {
    fs::path path;
    util::FileDescriptor fd;
    uint64_t length = 0;
};

/**
 * @brief Private working directory holding the fillers; removed on destruction
 */
class WorkArea {
public:
    WorkArea() = default;
    WorkArea(const WorkArea&) = delete;
    auto operator=(const WorkArea&) -> WorkArea& = delete;

    ~WorkArea() {
        if (auto removed = remove(); !removed) {
            LOG_ERROR(COMPONENT, removed.error().message);
        }
    }

    auto create(const fs::path& root, const std::string& prefix) -> std::expected<void, util::Error> {
        auto name = util::SecureRandom::name();
        if (!name) {
            return std::unexpected(name.error());
        }
        const auto dir = root / (prefix + *name);
        if (::mkdir(dir.c_str(), 0700) != 0) {
            return util::fail_errno(ErrorKind::IO_ERROR, "mkdir " + dir.string());
        }
        dir_ = dir;
        return {};
    }

    auto add_filler() -> std::expected<Filler*, util::Error> {
        auto name = util::SecureRandom::name();
        if (!name) {
            return std::unexpected(name.error());
        }
        const auto path = dir_ / *name;
        auto fd = util::FileDescriptor::open(path, O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, 0600);
        if (!fd) {
            return std::unexpected(fd.error());
        }
        fillers_.push_back(Filler{path, std::move(*fd), 0});
        return &fillers_.back();
    }

    [[nodiscard]] auto fillers() -> std::vector<Filler>& { return fillers_; }
    [[nodiscard]] auto directory() const -> const fs::path& { return dir_; }

    auto remove() -> std::expected<void, util::Error> {
        if (dir_.empty()) {
            return {};
        }
        std::expected<void, util::Error> status;
        for (auto& filler : fillers_) {
            filler.fd.reset();
            if (::unlink(filler.path.c_str()) != 0 && errno != ENOENT && status) {
                status = util::fail_errno(ErrorKind::IO_ERROR, "unlink " + filler.path.string());
            }
        }
        fillers_.clear();
        if (::rmdir(dir_.c_str()) != 0 && errno != ENOENT && status) {
            status = util::fail_errno(ErrorKind::IO_ERROR, "rmdir " + dir_.string());
        }
        if (auto synced = util::sync_directory(dir_.parent_path()); !synced && status) {
            status = std::unexpected(synced.error());
        }
        dir_.clear();
        return status;
    }

private:
    fs::path dir_;
    std::vector<Filler> fillers_;
};

}  // namespace

auto StatvfsVolumeProbe::available_bytes(const fs::path& path)
    -> std::expected<uint64_t, util::Error> {
    struct statvfs info{};
    if (::statvfs(path.c_str(), &info) != 0) {
        return util::fail_errno(ErrorKind::IO_ERROR, "statvfs " + path.string());
    }
    return static_cast<uint64_t>(info.f_bavail) * static_cast<uint64_t>(info.f_frsize);
}

FreeSpaceWiper::FreeSpaceWiper(const guard::ProtectedPathGuard& guard, IVolumeProbe& probe,
                               FreeSpaceConfig config,
                               const verification::VerificationLayer* verifier)
    : guard_(guard), probe_(probe), config_(std::move(config)), verifier_(verifier) {
    config_.write_chunk_size = std::max<size_t>(config_.write_chunk_size, 4'096);
    config_.max_filler_size = std::max<uint64_t>(config_.max_filler_size, config_.write_chunk_size);
}

auto FreeSpaceWiper::fill_budget(const fs::path& volume_root)
    -> std::expected<uint64_t, util::Error> {
    auto available = probe_.available_bytes(volume_root);
    if (!available) {
        return std::unexpected(available.error());
    }
    return *available > config_.headroom_bytes ? *available - config_.headroom_bytes : 0;
}

auto FreeSpaceWiper::wipe(ShredTask& task, const CancellationToken& cancel,
                          const TaskProgressCallback& on_progress) -> OperationResult {
    if (is_terminal(task.status())) {
        return terminal_result(task);
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = make_result(task);
    const auto& root = task.target_path;
    const int total_passes = static_cast<int>(task.passes.size());
    const uint64_t chunk_size = config_.write_chunk_size;

    if (cancel.is_cancelled()) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::CANCELLED,
                      "cancelled before start");
        return result;
    }
    if (auto verdict = guard_.check_volume(root); !verdict) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::PATH_DENIED,
                      verdict.reason);
        return result;
    }
    if (total_passes == 0) {
        finish_result(task, result, TaskStatus::FAILED, started, ErrorKind::INVALID_PASS_COUNT,
                      "no passes");
        return result;
    }

    auto initial = fill_budget(root);
    if (!initial) {
        finish_result(task, result, TaskStatus::FAILED, started, initial.error().kind,
                      initial.error().message);
        return result;
    }
    if (*initial < chunk_size * 2) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::INSUFFICIENT_SPACE,
                      std::format("{}: free space is within the {} byte headroom", root.string(),
                                  config_.headroom_bytes));
        return result;
    }

    WorkArea area;
    if (auto created = area.create(root, config_.work_dir_prefix); !created) {
        finish_result(task, result, TaskStatus::FAILED, started, created.error().kind,
                      created.error().message);
        return result;
    }

    task.advance_to(TaskStatus::RUNNING);
    LOG_INFO(COMPONENT, std::format("Wiping free space on {} ({} passes, {} bytes above headroom)",
                                    root.string(), total_passes, *initial));

    // Aborts the run: fillers are removed before the result is returned
    auto abort_run = [&](ErrorKind kind, std::string message) {
        if (auto removed = area.remove(); !removed) {
            LOG_ERROR(COMPONENT, removed.error().message);
        }
        LOG_WARNING(COMPONENT, std::format("Free-space wipe of {} aborted: {}", root.string(),
                                           message));
        finish_result(task, result, TaskStatus::FAILED, started, kind, std::move(message));
        return result;
    };

    // Budget left before the headroom, or an error if outside consumption crossed it
    auto check_space = [&]() -> std::expected<uint64_t, util::Error> {
        auto available = probe_.available_bytes(root);
        if (!available) {
            return std::unexpected(available.error());
        }
        if (*available < config_.headroom_bytes) {
            return util::fail(ErrorKind::INSUFFICIENT_SPACE,
                              std::format("free space on {} fell to {} bytes, below the {} byte "
                                          "headroom",
                                          root.string(), *available, config_.headroom_bytes));
        }
        return *available - config_.headroom_bytes;
    };

    std::vector<uint8_t> buffer(chunk_size);
    const auto& first = task.passes.front();

    // Pass 1 allocates the fillers
    uint64_t allocated = 0;
    bool exhausted = false;
    while (!exhausted) {
        auto filler = area.add_filler();
        if (!filler) {
            if (filler.error().code == ENOSPC) {
                break;
            }
            return abort_run(filler.error().kind, filler.error().message);
        }
        Filler& current = **filler;

        while (current.length < config_.max_filler_size) {
            if (cancel.is_cancelled()) {
                return abort_run(ErrorKind::CANCELLED,
                                 std::format("cancelled after allocating {} bytes", allocated));
            }
            auto budget = check_space();
            if (!budget) {
                return abort_run(budget.error().kind, budget.error().message);
            }
            // Leave one chunk of slack so block-allocation overhead cannot cross the headroom
            if (*budget < chunk_size * 2) {
                exhausted = true;
                break;
            }

            const auto size = static_cast<size_t>(
                std::min<uint64_t>(chunk_size, config_.max_filler_size - current.length));
            std::span<uint8_t> chunk(buffer.data(), size);
            if (auto filled = patterns::PatternSource::fill(first, chunk, current.length); !filled) {
                return abort_run(filled.error().kind, filled.error().message);
            }
            auto written = util::pwrite_all(current.fd.get(), chunk.data(), size, current.length);
            if (!written) {
                if (written.error().kind == ErrorKind::INSUFFICIENT_SPACE) {
                    // ENOSPC is the expected terminator; keep what was fully written
                    if (::ftruncate(current.fd.get(), static_cast<off_t>(current.length)) != 0) {
                        LOG_WARNING(COMPONENT, "Could not trim partial filler chunk");
                    }
                    exhausted = true;
                    break;
                }
                return abort_run(written.error().kind, written.error().message);
            }

            current.length += size;
            allocated += size;
            result.bytes_overwritten += size;
            if (on_progress) {
                on_progress(TaskProgress{task.id, size, 1, total_passes, false});
            }
        }

        if (auto synced = util::sync_and_drop_cache(current.fd.get()); !synced) {
            return abort_run(synced.error().kind, synced.error().message);
        }
    }

    ++result.passes_completed;
    result.bytes_per_pass.push_back(allocated);
    if (on_progress) {
        on_progress(TaskProgress{task.id, 0, 1, total_passes, true});
    }
    LOG_DEBUG(COMPONENT, std::format("Allocated {} bytes in {} fillers", allocated,
                                     area.fillers().size()));

    // Remaining passes overwrite the fillers in place
    for (int pass = 1; pass < total_passes; ++pass) {
        const auto& spec = task.passes[static_cast<size_t>(pass)];
        for (auto& filler : area.fillers()) {
            for (uint64_t offset = 0; offset < filler.length;) {
                if (cancel.is_cancelled()) {
                    return abort_run(ErrorKind::CANCELLED,
                                     std::format("cancelled during pass {} of {}", pass + 1,
                                                 total_passes));
                }
                if (auto budget = check_space(); !budget) {
                    return abort_run(budget.error().kind, budget.error().message);
                }

                const auto size =
                    static_cast<size_t>(std::min<uint64_t>(chunk_size, filler.length - offset));
                std::span<uint8_t> chunk(buffer.data(), size);
                if (auto filled = patterns::PatternSource::fill(spec, chunk, offset); !filled) {
                    return abort_run(filled.error().kind, filled.error().message);
                }
                if (auto written = util::pwrite_all(filler.fd.get(), chunk.data(), size, offset);
                    !written) {
                    return abort_run(written.error().kind, written.error().message);
                }
                offset += size;
                result.bytes_overwritten += size;
                if (on_progress) {
                    on_progress(TaskProgress{task.id, size, pass + 1, total_passes, false});
                }
            }
            if (auto synced = util::sync_and_drop_cache(filler.fd.get()); !synced) {
                return abort_run(synced.error().kind, synced.error().message);
            }
        }
        ++result.passes_completed;
        result.bytes_per_pass.push_back(allocated);
        if (on_progress) {
            on_progress(TaskProgress{task.id, 0, pass + 1, total_passes, true});
        }
    }

    if (task.verify && verifier_ != nullptr && verifier_->config().enabled) {
        task.advance_to(TaskStatus::VERIFYING);
        for (auto& filler : area.fillers()) {
            auto reader = util::FileDescriptor::open(filler.path, O_RDONLY | O_NOFOLLOW);
            if (!reader) {
                return abort_run(reader.error().kind, reader.error().message);
            }
            auto outcome = verifier_->verify(task, reader->get(), filler.length);
            if (!outcome) {
                return abort_run(ErrorKind::VERIFICATION_FAILED,
                                 std::format("{}: {}", filler.path.filename().string(),
                                             outcome.detail));
            }
        }
        result.verified = true;
    }

    if (auto removed = area.remove(); !removed) {
        finish_result(task, result, TaskStatus::FAILED, started, removed.error().kind,
                      removed.error().message);
        return result;
    }

    finish_result(task, result, TaskStatus::DONE, started);
    LOG_INFO(COMPONENT, std::format("Free space on {} wiped: {} bytes allocated, {} written",
                                    root.string(), allocated, result.bytes_overwritten));
    return result;
}

}  // namespace engine
