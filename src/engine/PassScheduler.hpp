/**
 * @file PassScheduler.hpp
 * @brief Turns targets and pattern requests into executable ShredTasks
 */

#pragma once

#include "models/EngineConfig.hpp"
#include "models/ShredTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <vector>

namespace engine {

/**
 * @struct DirectoryManifest
 * @brief Ordered plan for destroying a directory tree
 *
 * Every file task precedes the destruction of its parent directory.
 * Directories are ordered innermost first; the root comes last.
 */
struct DirectoryManifest {
    std::filesystem::path root;
    std::vector<ShredTask> files;
    std::vector<ShredTask> directories;

    [[nodiscard]] auto task_count() const -> size_t { return files.size() + directories.size(); }
    [[nodiscard]] auto planned_bytes() const -> uint64_t;
};

/**
 * @class PassScheduler
 * @brief Plans tasks: target kind, pass list and effective chunk size
 *
 * Planning never writes. Symbolic links are never followed: a top-level
 * target must be a regular file or a directory, while non-regular entries
 * inside a tree are planned as content-less tasks.
 */
class PassScheduler {
public:
    PassScheduler(SchedulerConfig config, size_t worker_count);

    /**
     * @brief Plan a single target
     * @return TARGET_NOT_FOUND, UNSUPPORTED_TARGET, or a pattern error
     */
    [[nodiscard]] auto plan(const std::filesystem::path& target, const PatternRequest& pattern,
                            size_t chunk_size_hint) const
        -> std::expected<ShredTask, util::Error>;

    [[nodiscard]] auto plan(const std::filesystem::path& target,
                            const std::vector<PassSpec>& passes, size_t chunk_size_hint) const
        -> std::expected<ShredTask, util::Error>;

    /**
     * @brief Plan every entry below @p root, without following symlinks
     */
    [[nodiscard]] auto plan_tree(const std::filesystem::path& root,
                                 const std::vector<PassSpec>& passes,
                                 size_t chunk_size_hint) const
        -> std::expected<DirectoryManifest, util::Error>;

    /**
     * @brief Plan a free-space wipe of the volume holding @p volume_root
     */
    [[nodiscard]] auto plan_free_space(const std::filesystem::path& volume_root,
                                       const std::vector<PassSpec>& passes,
                                       size_t chunk_size_hint) const
        -> std::expected<ShredTask, util::Error>;

    /**
     * @brief Chunk size for a target of @p target_size bytes
     *
     * min(hint, available memory / workers, target size), clamped to
     * [min_chunk_size, max_chunk_size]. A zero hint means "no preference".
     */
    [[nodiscard]] auto effective_chunk_size(size_t hint, uint64_t target_size) const -> size_t;

    [[nodiscard]] auto config() const -> const SchedulerConfig& { return config_; }
    [[nodiscard]] auto worker_count() const -> size_t { return worker_count_; }

private:
    [[nodiscard]] auto make_task(const std::filesystem::path& target, TaskKind kind,
                                 const std::vector<PassSpec>& passes, uint64_t length,
                                 size_t chunk_size_hint) const -> ShredTask;

    SchedulerConfig config_;
    size_t worker_count_;
};

/**
 * @brief Next process-unique task id
 */
[[nodiscard]] auto next_task_id() -> TaskId;

}  // namespace engine
