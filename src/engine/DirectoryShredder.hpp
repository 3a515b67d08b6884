/**
 * @file DirectoryShredder.hpp
 * @brief Shreds a directory tree and removes its emptied directories
 */

#pragma once

#include "engine/FileShredder.hpp"
#include "engine/PassScheduler.hpp"

#include <vector>

namespace engine {

/**
 * @class DirectoryShredder
 * @brief Runs a DirectoryManifest: files first, then directories innermost first
 *
 * A directory that is not empty when its turn comes (a skipped or failed
 * file, or an entry created concurrently) is left in place under its
 * original name and reported as PARTIAL_DIRECTORY.
 */
class DirectoryShredder {
public:
    DirectoryShredder(const guard::ProtectedPathGuard& guard, FileShredder& files);

    /**
     * @brief Shred every file in @p manifest sequentially, then destroy its directories
     * @return One result per manifest task, files first
     */
    auto execute(DirectoryManifest& manifest, const CancellationToken& cancel,
                 const TaskProgressCallback& on_progress = {}) -> std::vector<OperationResult>;

    /**
     * @brief Directory phase only, for callers that ran the file tasks elsewhere
     */
    auto destroy_directories(DirectoryManifest& manifest, const CancellationToken& cancel)
        -> std::vector<OperationResult>;

    /**
     * @brief Randomize, rename and remove one empty directory
     */
    auto destroy_directory(ShredTask& task, const CancellationToken& cancel) -> OperationResult;

private:
    const guard::ProtectedPathGuard& guard_;
    FileShredder& files_;
};

}  // namespace engine
