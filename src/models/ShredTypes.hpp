/**
 * @file ShredTypes.hpp
 * @brief Task, result and progress types for erasure operations
 */

#pragma once

#include "models/ErrorKind.hpp"
#include "models/PassSpec.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using TaskId = uint64_t;
using RequestId = uint64_t;

/**
 * @enum TaskKind
 * @brief What a ShredTask destroys
 */
enum class TaskKind {
    FILE,
    DIRECTORY,
    FREE_SPACE_SEGMENT
};

/**
 * @enum TaskStatus
 * @brief Lifecycle of a ShredTask; DONE, FAILED and SKIPPED are terminal
 */
enum class TaskStatus {
    PENDING,
    RUNNING,
    VERIFYING,
    DONE,
    FAILED,
    SKIPPED
};

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) -> bool {
    return status == TaskStatus::DONE || status == TaskStatus::FAILED ||
           status == TaskStatus::SKIPPED;
}

[[nodiscard]] constexpr auto to_string(TaskStatus status) -> std::string_view {
    switch (status) {
        case TaskStatus::PENDING:
            return "Pending";
        case TaskStatus::RUNNING:
            return "Running";
        case TaskStatus::VERIFYING:
            return "Verifying";
        case TaskStatus::DONE:
            return "Done";
        case TaskStatus::FAILED:
            return "Failed";
        case TaskStatus::SKIPPED:
            return "Skipped";
    }
    return "Unknown";
}

/**
 * @class ShredTask
 * @brief One unit of destruction, executed to completion by a single worker
 */
class ShredTask {
public:
    TaskId id = 0;
    RequestId request_id = 0;
    std::filesystem::path target_path;
    TaskKind kind = TaskKind::FILE;
    std::vector<PassSpec> passes;
    size_t chunk_size = 0;
    uint64_t planned_length = 0;   ///< Length observed at planning time
    bool content_bearing = true;   ///< false for symlinks, FIFOs, sockets and device nodes
    bool verify = true;
    bool destroy_metadata = true;

    [[nodiscard]] auto status() const -> TaskStatus { return status_; }

    /// Error the task finished with; empty until it is terminal, and for DONE
    [[nodiscard]] auto error() const -> std::optional<ErrorKind> { return error_; }

    /**
     * @brief Move the task to a new status
     * @param error Recorded alongside a terminal status
     * @return false if the task is already terminal or @p next would go back to PENDING
     */
    auto advance_to(TaskStatus next, std::optional<ErrorKind> error = std::nullopt) -> bool {
        if (is_terminal(status_) || next == TaskStatus::PENDING) {
            return false;
        }
        status_ = next;
        if (is_terminal(next)) {
            error_ = error;
        }
        return true;
    }

private:
    TaskStatus status_ = TaskStatus::PENDING;
    std::optional<ErrorKind> error_;
};

/**
 * @struct OperationResult
 * @brief Outcome of one task, emitted once and never changed afterwards
 */
struct OperationResult {
    TaskId task_id = 0;
    RequestId request_id = 0;
    std::filesystem::path target;
    TaskKind kind = TaskKind::FILE;
    TaskStatus status = TaskStatus::PENDING;
    uint64_t bytes_overwritten = 0;
    int passes_completed = 0;
    int passes_planned = 0;
    std::vector<uint64_t> bytes_per_pass;  ///< Bytes written by each completed pass
    bool verified = false;
    std::optional<ErrorKind> error;
    std::string error_message;
    uint64_t duration_ms = 0;
    std::chrono::system_clock::time_point completed_at{};

    [[nodiscard]] auto succeeded() const -> bool {
        return status == TaskStatus::DONE && !error.has_value();
    }
};

/**
 * @struct ProgressSnapshot
 * @brief Point-in-time view of a request's progress
 */
struct ProgressSnapshot {
    uint64_t total_bytes_planned = 0;
    uint64_t bytes_done = 0;
    uint64_t tasks_done = 0;
    uint64_t tasks_total = 0;
    int64_t eta_ms = -1;  ///< -1 if unknown

    auto operator==(const ProgressSnapshot&) const -> bool = default;
};

using ShredEvent = std::variant<ProgressSnapshot, OperationResult>;

/**
 * @struct TaskProgress
 * @brief Per-chunk progress emitted by a running task
 */
struct TaskProgress {
    TaskId task_id = 0;
    uint64_t bytes_delta = 0;
    int current_pass = 0;
    int total_passes = 0;
    bool pass_finished = false;
};

/**
 * @brief Callback type for per-task progress reporting
 */
using TaskProgressCallback = std::function<void(const TaskProgress&)>;

/**
 * @struct ShredOptions
 * @brief Options accepted by submit() and wipe_free_space()
 */
struct ShredOptions {
    PatternRequest pattern;
    bool recursive = false;
    size_t chunk_size_hint = 1'024 * 1'024;
    size_t worker_count = 0;  ///< 0 selects the configured default
    bool verify = true;
    bool destroy_metadata = true;
};
