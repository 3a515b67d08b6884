#include "engine/PassScheduler.hpp"

#include "patterns/PatternSource.hpp"
#include "util/Logger.hpp"
#include "util/PathUtils.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <numeric>
#include <system_error>

#include <unistd.h>

namespace engine {

namespace fs = std::filesystem;

namespace {

auto not_found_or_io(const fs::path& target, const std::error_code& ec) -> util::Error {
    if (ec == std::errc::no_such_file_or_directory) {
        return {ErrorKind::TARGET_NOT_FOUND, std::format("{}: no such file or directory", target.string()),
                ec.value()};
    }
    return {ErrorKind::IO_ERROR, std::format("{}: {}", target.string(), ec.message()), ec.value()};
}

auto depth(const fs::path& path) -> size_t {
    return static_cast<size_t>(std::distance(path.begin(), path.end()));
}

auto available_memory() -> uint64_t {
    const long pages = ::sysconf(_SC_AVPHYS_PAGES);
    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) {
        return 0;
    }
    return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
}

}  // namespace

auto next_task_id() -> TaskId {
    static std::atomic<TaskId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

auto DirectoryManifest::planned_bytes() const -> uint64_t {
    return std::accumulate(files.begin(), files.end(), uint64_t{0},
                           [](uint64_t sum, const ShredTask& task) {
                               return sum + task.planned_length * task.passes.size();
                           });
}

PassScheduler::PassScheduler(SchedulerConfig config, size_t worker_count)
    : config_(config), worker_count_(std::max<size_t>(worker_count, 1)) {
    config_.min_chunk_size = std::max<size_t>(config_.min_chunk_size, 1);
    config_.max_chunk_size = std::max(config_.max_chunk_size, config_.min_chunk_size);
}

auto PassScheduler::effective_chunk_size(size_t hint, uint64_t target_size) const -> size_t {
    uint64_t chunk = hint == 0 ? config_.max_chunk_size : hint;

    const uint64_t memory = available_memory();
    if (memory > 0) {
        chunk = std::min<uint64_t>(chunk, memory / worker_count_);
    }
    chunk = std::min<uint64_t>(chunk, std::max<uint64_t>(target_size, config_.min_chunk_size));

    return static_cast<size_t>(std::clamp<uint64_t>(chunk, config_.min_chunk_size,
                                                    config_.max_chunk_size));
}

auto PassScheduler::make_task(const fs::path& target, TaskKind kind,
                              const std::vector<PassSpec>& passes, uint64_t length,
                              size_t chunk_size_hint) const -> ShredTask {
    ShredTask task;
    task.id = next_task_id();
    task.target_path = target;
    task.kind = kind;
    task.passes = passes;
    task.planned_length = length;
    task.chunk_size = effective_chunk_size(chunk_size_hint, length);
    return task;
}

auto PassScheduler::plan(const fs::path& target, const PatternRequest& pattern,
                         size_t chunk_size_hint) const -> std::expected<ShredTask, util::Error> {
    auto passes = patterns::PatternSource::resolve(pattern);
    if (!passes) {
        return std::unexpected(passes.error());
    }
    return plan(target, *passes, chunk_size_hint);
}

auto PassScheduler::plan(const fs::path& target, const std::vector<PassSpec>& passes,
                         size_t chunk_size_hint) const -> std::expected<ShredTask, util::Error> {
    if (target.empty()) {
        return util::fail(ErrorKind::TARGET_NOT_FOUND, "empty target path");
    }

    const auto path = util::lexical_path(target);
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(
            not_found_or_io(path, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory)));
    }

    if (fs::is_directory(status)) {
        return make_task(path, TaskKind::DIRECTORY, passes, 0, chunk_size_hint);
    }
    if (!fs::is_regular_file(status)) {
        return util::fail(ErrorKind::UNSUPPORTED_TARGET,
                          std::format("{}: not a regular file or directory", path.string()));
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(not_found_or_io(path, ec));
    }

    auto task = make_task(path, TaskKind::FILE, passes, size, chunk_size_hint);
    LOG_DEBUG("PassScheduler", std::format("Planned task {} for {} ({} bytes, {} passes, chunk {})",
                                           task.id, path.string(), size, passes.size(),
                                           task.chunk_size));
    return task;
}

auto PassScheduler::plan_tree(const fs::path& root, const std::vector<PassSpec>& passes,
                              size_t chunk_size_hint) const
    -> std::expected<DirectoryManifest, util::Error> {
    const auto path = util::lexical_path(root);
    std::error_code ec;
    const auto root_status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(root_status)) {
        return std::unexpected(
            not_found_or_io(path, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory)));
    }
    if (!fs::is_directory(root_status)) {
        return util::fail(ErrorKind::UNSUPPORTED_TARGET,
                          std::format("{}: not a directory", path.string()));
    }

    DirectoryManifest manifest;
    manifest.root = path;

    fs::recursive_directory_iterator it(path, fs::directory_options::none, ec);
    if (ec) {
        return std::unexpected(not_found_or_io(path, ec));
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(not_found_or_io(path, ec));
        }
        const auto& entry = *it;
        const auto status = entry.symlink_status(ec);
        if (ec) {
            return std::unexpected(not_found_or_io(entry.path(), ec));
        }

        if (fs::is_directory(status)) {
            manifest.directories.push_back(
                make_task(entry.path(), TaskKind::DIRECTORY, {}, 0, chunk_size_hint));
            continue;
        }

        uint64_t size = 0;
        const bool regular = fs::is_regular_file(status);
        if (regular) {
            size = entry.file_size(ec);
            if (ec) {
                return std::unexpected(not_found_or_io(entry.path(), ec));
            }
        }
        auto task = make_task(entry.path(), TaskKind::FILE, passes, size, chunk_size_hint);
        task.content_bearing = regular;
        manifest.files.push_back(std::move(task));
    }
    if (ec) {
        return std::unexpected(not_found_or_io(path, ec));
    }

    std::stable_sort(manifest.directories.begin(), manifest.directories.end(),
                     [](const ShredTask& a, const ShredTask& b) {
                         return depth(a.target_path) > depth(b.target_path);
                     });
    manifest.directories.push_back(make_task(path, TaskKind::DIRECTORY, {}, 0, chunk_size_hint));

    LOG_INFO("PassScheduler", std::format("Planned tree {}: {} files, {} directories",
                                          path.string(), manifest.files.size(),
                                          manifest.directories.size()));
    return manifest;
}

auto PassScheduler::plan_free_space(const fs::path& volume_root,
                                    const std::vector<PassSpec>& passes,
                                    size_t chunk_size_hint) const
    -> std::expected<ShredTask, util::Error> {
    const auto path = util::lexical_path(volume_root);
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(
            not_found_or_io(path, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory)));
    }
    if (!fs::is_directory(status)) {
        return util::fail(ErrorKind::UNSUPPORTED_TARGET,
                          std::format("{}: not a directory", path.string()));
    }

    auto task = make_task(path, TaskKind::FREE_SPACE_SEGMENT, passes, 0, chunk_size_hint);
    task.destroy_metadata = false;
    return task;
}

}  // namespace engine
