#include "engine/DirectoryShredder.hpp"

#include "engine/MetadataScrubber.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <iterator>
#include <system_error>

#include <unistd.h>

namespace engine {

namespace fs = std::filesystem;

namespace {

constexpr const char* COMPONENT = "DirectoryShredder";

auto count_entries(const fs::path& dir, std::error_code& ec) -> size_t {
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return 0;
    }
    size_t count = 0;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return count;
        }
        ++count;
    }
    return count;
}

}  // namespace

DirectoryShredder::DirectoryShredder(const guard::ProtectedPathGuard& guard, FileShredder& files)
    : guard_(guard), files_(files) {}

auto DirectoryShredder::execute(DirectoryManifest& manifest, const CancellationToken& cancel,
                                const TaskProgressCallback& on_progress)
    -> std::vector<OperationResult> {
    std::vector<OperationResult> results;
    results.reserve(manifest.task_count());

    for (auto& task : manifest.files) {
        results.push_back(files_.execute(task, cancel, on_progress));
    }

    auto directories = destroy_directories(manifest, cancel);
    results.insert(results.end(), std::make_move_iterator(directories.begin()),
                   std::make_move_iterator(directories.end()));
    return results;
}

auto DirectoryShredder::destroy_directories(DirectoryManifest& manifest,
                                            const CancellationToken& cancel)
    -> std::vector<OperationResult> {
    std::vector<OperationResult> results;
    results.reserve(manifest.directories.size());
    size_t partial = 0;
    for (auto& task : manifest.directories) {
        results.push_back(destroy_directory(task, cancel));
        if (results.back().error == ErrorKind::PARTIAL_DIRECTORY) {
            ++partial;
        }
    }
    if (partial > 0) {
        LOG_WARNING(COMPONENT, std::format("{}: {} directories left in place", manifest.root.string(),
                                           partial));
    }
    return results;
}

auto DirectoryShredder::destroy_directory(ShredTask& task, const CancellationToken& cancel)
    -> OperationResult {
    if (is_terminal(task.status())) {
        return terminal_result(task);
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = make_result(task);
    const auto& path = task.target_path;

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

    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (!ec && fs::exists(status) && !fs::is_directory(status)) {
        finish_result(task, result, TaskStatus::SKIPPED, started, ErrorKind::UNSUPPORTED_TARGET,
                      std::format("{}: no longer a directory", path.string()));
        return result;
    }
    const auto remaining = count_entries(path, ec);
    if (ec) {
        const auto kind = ec == std::errc::no_such_file_or_directory ? ErrorKind::TARGET_NOT_FOUND
                                                                     : ErrorKind::IO_ERROR;
        finish_result(task, result, TaskStatus::FAILED, started, kind,
                      std::format("{}: {}", path.string(), ec.message()));
        return result;
    }
    if (remaining > 0) {
        finish_result(task, result, TaskStatus::FAILED, started, ErrorKind::PARTIAL_DIRECTORY,
                      std::format("{}: {} entries remain", path.string(), remaining));
        return result;
    }

    task.advance_to(TaskStatus::RUNNING);

    if (auto stamped = metadata::randomize_timestamps(path); !stamped) {
        finish_result(task, result, TaskStatus::FAILED, started, stamped.error().kind,
                      stamped.error().message);
        return result;
    }
    auto renamed = metadata::rename_to_random(path);
    if (!renamed) {
        finish_result(task, result, TaskStatus::FAILED, started, renamed.error().kind,
                      renamed.error().message);
        return result;
    }
    if (::rmdir(renamed->c_str()) != 0) {
        const int err = errno;
        // Something was created in the directory after the emptiness check
        if (::rename(renamed->c_str(), path.c_str()) != 0) {
            LOG_ERROR(COMPONENT, std::format("Could not restore {} from {}: {}", path.string(),
                                             renamed->string(), std::strerror(errno)));
        }
        const auto kind = (err == ENOTEMPTY || err == EEXIST) ? ErrorKind::PARTIAL_DIRECTORY
                                                              : ErrorKind::IO_ERROR;
        finish_result(task, result, TaskStatus::FAILED, started, kind,
                      std::format("rmdir {}: {}", path.string(), std::strerror(err)));
        return result;
    }
    if (auto synced = util::sync_directory(path.parent_path()); !synced) {
        finish_result(task, result, TaskStatus::FAILED, started, synced.error().kind,
                      synced.error().message);
        return result;
    }

    finish_result(task, result, TaskStatus::DONE, started);
    LOG_DEBUG(COMPONENT, std::format("Removed directory {}", path.string()));
    return result;
}

}  // namespace engine
