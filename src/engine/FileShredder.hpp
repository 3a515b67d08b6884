/**
 * @file FileShredder.hpp
 * @brief Executes the pass sequence against one file and destroys its metadata
 */

#pragma once

#include "guard/LockDetector.hpp"
#include "guard/ProtectedPathGuard.hpp"
#include "engine/Cancellation.hpp"
#include "models/ShredTypes.hpp"
#include "verification/VerificationLayer.hpp"

#include <chrono>
#include <filesystem>

namespace engine {

/**
 * @class FileShredder
 * @brief Overwrites, verifies and removes a single file
 *
 * Execution order:
 *  1. re-check the guard, open O_RDWR | O_NOFOLLOW and take an exclusive lock
 *  2. for each pass: re-measure the length, overwrite from offset 0 in
 *     chunks, fsync and drop the page cache
 *  3. verify the final pass (if enabled)
 *  4. truncate, randomize timestamps, rename to a random name, unlink and
 *     fsync the parent directory (if metadata destruction is enabled)
 *
 * A cancelled or failed task keeps the file and its length; no pass is ever
 * restarted. Entries without content (symlinks, FIFOs, sockets, device
 * nodes) skip straight to the rename and unlink.
 */
class FileShredder {
public:
    /**
     * @param guard Guard consulted immediately before the first write
     * @param locks Lock acquisition on the opened descriptor
     * @param verifier Verification layer, or nullptr to disable read-back
     */
    FileShredder(const guard::ProtectedPathGuard& guard, guard::ILockDetector& locks,
                 const verification::VerificationLayer* verifier);

    /**
     * @brief Run @p task to a terminal status
     * @param task Task to execute; its status is advanced in place
     * @param cancel Polled between chunks and between passes
     * @param on_progress Called after every chunk and at the end of every pass
     */
    auto execute(ShredTask& task, const CancellationToken& cancel,
                 const TaskProgressCallback& on_progress = {}) -> OperationResult;

private:
    auto remove_entry(ShredTask& task, OperationResult& result) -> void;

    const guard::ProtectedPathGuard& guard_;
    guard::ILockDetector& locks_;
    const verification::VerificationLayer* verifier_;
};

/**
 * @brief Build the result skeleton shared by every executor
 */
[[nodiscard]] auto make_result(const ShredTask& task) -> OperationResult;

/**
 * @brief Result for a task that already finished; reports its status without touching disk
 */
[[nodiscard]] auto terminal_result(const ShredTask& task) -> OperationResult;

/**
 * @brief Move @p task to its terminal @p status and stamp @p result
 */
void finish_result(ShredTask& task, OperationResult& result, TaskStatus status,
                   std::chrono::steady_clock::time_point started,
                   std::optional<ErrorKind> error = std::nullopt, std::string message = {});

}  // namespace engine
