#include "engine/FileShredder.hpp"

#include "engine/MetadataScrubber.hpp"
#include "patterns/PatternSource.hpp"
#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <span>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace engine {

namespace {

constexpr const char* COMPONENT = "FileShredder";

}  // namespace

auto make_result(const ShredTask& task) -> OperationResult {
    OperationResult result;
    result.task_id = task.id;
    result.request_id = task.request_id;
    result.target = task.target_path;
    result.kind = task.kind;
    result.passes_planned = static_cast<int>(task.passes.size());
    return result;
}

auto terminal_result(const ShredTask& task) -> OperationResult {
    LOG_WARNING(COMPONENT, std::format("Task {} for {} is already {}, not executing again", task.id,
                                       task.target_path.string(), to_string(task.status())));
    auto result = make_result(task);
    result.status = task.status();
    result.error = task.error();
    result.error_message =
        task.error() ? std::format("task already {} ({})", to_string(task.status()),
                                   to_string(*task.error()))
                     : std::format("task already {}", to_string(task.status()));
    result.completed_at = std::chrono::system_clock::now();
    return result;
}

void finish_result(ShredTask& task, OperationResult& result, TaskStatus status,
                   std::chrono::steady_clock::time_point started, std::optional<ErrorKind> error,
                   std::string message) {
    if (!task.advance_to(status, error)) {
        LOG_ERROR(COMPONENT, std::format("Task {} already terminal ({}), refusing {}", task.id,
                                         to_string(task.status()), to_string(status)));
    }
    result.status = task.status();
    result.error = error;
    result.error_message = std::move(message);
    result.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started)
            .count());
    result.completed_at = std::chrono::system_clock::now();
}

FileShredder::FileShredder(const guard::ProtectedPathGuard& guard, guard::ILockDetector& locks,
                           const verification::VerificationLayer* verifier)
    : guard_(guard), locks_(locks), verifier_(verifier) {}

auto FileShredder::execute(ShredTask& task, const CancellationToken& cancel,
                           const TaskProgressCallback& on_progress) -> OperationResult {
    if (is_terminal(task.status())) {
        return terminal_result(task);
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = make_result(task);
    const auto& path = task.target_path;
    const int total_passes = static_cast<int>(task.passes.size());

    if (cancel.is_cancelled()) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::CANCELLED,
                      "cancelled before start");
        return result;
    }

    if (auto verdict = guard_.check(path); !verdict) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::PATH_DENIED,
                      verdict.reason);
        return result;
    }

    if (!task.content_bearing) {
        remove_entry(task, result);
        finish_result(task, result, result.error ? TaskStatus::FAILED : TaskStatus::DONE, started,
                      result.error, result.error_message);
        return result;
    }

    auto fd = util::FileDescriptor::open(path, O_RDWR | O_NOFOLLOW | O_NOCTTY | O_NONBLOCK);
    if (!fd) {
        const auto kind = fd.error().kind;
        const auto status = kind == ErrorKind::IO_ERROR ? TaskStatus::FAILED : TaskStatus::SKIPPED;
        finish_result(task, result, status, started, kind, fd.error().message);
        return result;
    }

    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        auto err = util::fail_errno(ErrorKind::IO_ERROR, "fstat " + path.string());
        finish_result(task, result, TaskStatus::FAILED, started, err.error().kind,
                      err.error().message);
        return result;
    }
    if (!S_ISREG(st.st_mode)) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::UNSUPPORTED_TARGET,
                      path.string() + ": not a regular file");
        return result;
    }

    auto lock = locks_.acquire(fd->get());
    if (!lock) {
        finish_result(task, result, TaskStatus::FAILED, started, lock.error().kind,
                      lock.error().message);
        return result;
    }
    if (lock->locked) {
        LOG_WARNING(COMPONENT, std::format("{} is locked{}{}, skipping", path.string(),
                                           lock->holder_hint.empty() ? "" : " by ",
                                           lock->holder_hint));
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::TARGET_LOCKED,
                      lock->holder_hint.empty() ? "locked by another process"
                                                : "locked by " + lock->holder_hint);
        return result;
    }
    if (st.st_nlink > 1) {
        LOG_WARNING(COMPONENT, std::format("{} has {} hard links; other names keep the inode alive",
                                           path.string(), st.st_nlink));
    }

    const bool verifying = task.verify && verifier_ != nullptr && verifier_->config().enabled;
    std::optional<verification::ContentSignature> signature;
    if (verifying && verifier_->config().record_signatures) {
        auto recorded = verifier_->record_signature(fd->get(), static_cast<uint64_t>(st.st_size));
        if (!recorded) {
            finish_result(task, result, TaskStatus::FAILED, started, recorded.error().kind,
                          recorded.error().message);
            return result;
        }
        signature = std::move(*recorded);
    }

    task.advance_to(TaskStatus::RUNNING);
    LOG_INFO(COMPONENT, std::format("Shredding {} ({} passes, chunk {})", path.string(),
                                    total_passes, task.chunk_size));

    std::vector<uint8_t> buffer(std::max<size_t>(task.chunk_size, 1));
    for (int pass = 0; pass < total_passes; ++pass) {
        const auto& spec = task.passes[static_cast<size_t>(pass)];

        if (cancel.is_cancelled()) {
            finish_result(task, result, TaskStatus::FAILED, started, ErrorKind::CANCELLED,
                          std::format("cancelled after {} of {} passes", pass, total_passes));
            return result;
        }

        if (::fstat(fd->get(), &st) != 0) {
            auto err = util::fail_errno(ErrorKind::IO_ERROR, "fstat " + path.string());
            finish_result(task, result, TaskStatus::FAILED, started, err.error().kind,
                          err.error().message);
            return result;
        }
        const auto length = static_cast<uint64_t>(st.st_size);

        uint64_t offset = 0;
        while (offset < length) {
            if (offset > 0 && cancel.is_cancelled()) {
                finish_result(task, result, TaskStatus::FAILED, started, ErrorKind::CANCELLED,
                              std::format("cancelled during pass {} of {} at offset {}", pass + 1,
                                          total_passes, offset));
                return result;
            }

            const auto size = static_cast<size_t>(std::min<uint64_t>(buffer.size(), length - offset));
            std::span<uint8_t> chunk(buffer.data(), size);
            auto filled = patterns::PatternSource::fill(spec, chunk, offset);
            if (!filled) {
                finish_result(task, result, TaskStatus::FAILED, started, filled.error().kind,
                              filled.error().message);
                return result;
            }
            auto written = util::pwrite_all(fd->get(), chunk.data(), chunk.size(), offset);
            if (!written) {
                LOG_ERROR(COMPONENT, std::format("Pass {} on {} failed: {}", pass + 1,
                                                 path.string(), written.error().message));
                finish_result(task, result, TaskStatus::FAILED, started, written.error().kind,
                              written.error().message);
                return result;
            }

            offset += size;
            result.bytes_overwritten += size;
            if (on_progress) {
                on_progress(TaskProgress{task.id, size, pass + 1, total_passes, false});
            }
        }

        auto synced = util::sync_and_drop_cache(fd->get());
        if (!synced) {
            finish_result(task, result, TaskStatus::FAILED, started, synced.error().kind,
                          synced.error().message);
            return result;
        }

        ++result.passes_completed;
        result.bytes_per_pass.push_back(length);
        LOG_DEBUG(COMPONENT, std::format("{}: pass {}/{} '{}' wrote {} bytes", path.string(),
                                         pass + 1, total_passes, spec.name, length));
        if (on_progress) {
            on_progress(TaskProgress{task.id, 0, pass + 1, total_passes, true});
        }
    }

    if (verifying) {
        task.advance_to(TaskStatus::VERIFYING);
        if (::fstat(fd->get(), &st) != 0) {
            auto err = util::fail_errno(ErrorKind::IO_ERROR, "fstat " + path.string());
            finish_result(task, result, TaskStatus::FAILED, started, err.error().kind,
                          err.error().message);
            return result;
        }
        auto outcome = verifier_->verify(task, fd->get(), static_cast<uint64_t>(st.st_size),
                                         signature ? &*signature : nullptr);
        if (!outcome) {
            LOG_ERROR(COMPONENT, std::format("Verification of {} failed: {}", path.string(),
                                             outcome.detail));
            finish_result(task, result, TaskStatus::FAILED, started,
                          ErrorKind::VERIFICATION_FAILED, outcome.detail);
            return result;
        }
        result.verified = true;
    }

    if (task.destroy_metadata) {
        if (::ftruncate(fd->get(), 0) != 0 || ::fsync(fd->get()) != 0) {
            auto err = util::fail_errno(ErrorKind::IO_ERROR, "truncate " + path.string());
            finish_result(task, result, TaskStatus::FAILED, started, err.error().kind,
                          err.error().message);
            return result;
        }
        if (auto stamped = metadata::randomize_timestamps(fd->get()); !stamped) {
            finish_result(task, result, TaskStatus::FAILED, started, stamped.error().kind,
                          stamped.error().message);
            return result;
        }
        remove_entry(task, result);
        if (result.error) {
            finish_result(task, result, TaskStatus::FAILED, started, result.error,
                          result.error_message);
            return result;
        }
    }

    finish_result(task, result, TaskStatus::DONE, started);
    LOG_INFO(COMPONENT, std::format("Shredded {}: {} passes, {} bytes, {} ms", path.string(),
                                    result.passes_completed, result.bytes_overwritten,
                                    result.duration_ms));
    return result;
}

auto FileShredder::remove_entry(ShredTask& task, OperationResult& result) -> void {
    const auto& path = task.target_path;

    auto renamed = metadata::rename_to_random(path);
    if (!renamed) {
        result.error = renamed.error().kind;
        result.error_message = renamed.error().message;
        return;
    }
    if (::unlink(renamed->c_str()) != 0) {
        auto err = util::fail_errno(ErrorKind::IO_ERROR, "unlink " + renamed->string());
        result.error = err.error().kind;
        result.error_message = err.error().message;
        return;
    }
    if (auto synced = util::sync_directory(path.parent_path()); !synced) {
        result.error = synced.error().kind;
        result.error_message = synced.error().message;
        return;
    }
    if (!verification::VerificationLayer::confirm_removed(path, *renamed)) {
        result.error = ErrorKind::IO_ERROR;
        result.error_message = path.string() + " still present after unlink";
    }
}

}  // namespace engine
