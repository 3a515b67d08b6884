/**
 * @file FreeSpaceWiper.hpp
 * @brief Overwrites unallocated blocks of a volume through filler files
 */

#pragma once

#include "engine/Cancellation.hpp"
#include "guard/ProtectedPathGuard.hpp"
#include "models/EngineConfig.hpp"
#include "models/ShredTypes.hpp"
#include "util/Error.hpp"
#include "verification/VerificationLayer.hpp"

#include <expected>
#include <filesystem>

namespace engine {

/**
 * @class IVolumeProbe
 * @brief Reports free space available to unprivileged writers
 */
class IVolumeProbe {
public:
    virtual ~IVolumeProbe() = default;

    [[nodiscard]] virtual auto available_bytes(const std::filesystem::path& path)
        -> std::expected<uint64_t, util::Error> = 0;
};

/**
 * @class StatvfsVolumeProbe
 * @brief IVolumeProbe backed by statvfs(3): f_bavail * f_frsize
 */
class StatvfsVolumeProbe : public IVolumeProbe {
public:
    [[nodiscard]] auto available_bytes(const std::filesystem::path& path)
        -> std::expected<uint64_t, util::Error> override;
};

/**
 * @class FreeSpaceWiper
 * @brief Fills free space with filler files, overwrites them, then deletes them
 *
 * The first pass allocates: fillers of at most max_filler_size are written
 * until free space reaches headroom_bytes (or ENOSPC). Remaining passes
 * overwrite the fillers in place. Free space is re-probed before every
 * chunk; if it falls below the headroom while filling or overwriting, the
 * cause is outside this wipe and the run aborts with INSUFFICIENT_SPACE.
 * Every exit path deletes all fillers and the private working directory.
 */
class FreeSpaceWiper {
public:
    FreeSpaceWiper(const guard::ProtectedPathGuard& guard, IVolumeProbe& probe,
                   FreeSpaceConfig config, const verification::VerificationLayer* verifier);

    /**
     * @brief Wipe free space on the volume holding task.target_path
     */
    auto wipe(ShredTask& task, const CancellationToken& cancel,
              const TaskProgressCallback& on_progress = {}) -> OperationResult;

    /**
     * @brief Bytes a wipe of @p volume_root would allocate right now
     */
    [[nodiscard]] auto fill_budget(const std::filesystem::path& volume_root)
        -> std::expected<uint64_t, util::Error>;

    [[nodiscard]] auto config() const -> const FreeSpaceConfig& { return config_; }

private:
    const guard::ProtectedPathGuard& guard_;
    IVolumeProbe& probe_;
    FreeSpaceConfig config_;
    const verification::VerificationLayer* verifier_;
};

}  // namespace engine
