/**
 * @file EngineConfig.hpp
 * @brief Tunables for the erasure engine
 *
 * All configuration is plain data with defaults, handed to the service at
 * construction. Nothing is read from ambient global state.
 */

#pragma once

#include "config.h"
#include "util/Logger.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @struct SchedulerConfig
 * @brief Chunk sizing and worker defaults
 */
struct SchedulerConfig {
    size_t min_chunk_size = 4 * 1'024;              ///< Floor, bounds syscall overhead
    size_t max_chunk_size = 16 * 1'024 * 1'024;     ///< Ceiling, bounds peak memory per worker
    size_t default_worker_count = 0;                ///< 0 selects hardware concurrency
};

/**
 * @struct VerificationConfig
 * @brief Read-back sampling policy
 */
struct VerificationConfig {
    bool enabled = true;
    uint64_t full_scan_threshold = 16 * 1'024 * 1'024;  ///< Files up to this size are read fully
    double sample_density = 0.05;                       ///< Fraction of larger files sampled
    size_t window_size = 4'096;                         ///< Bytes per sampled window
    bool record_signatures = false;  ///< Hash sampled windows before pass 1 (test use only)
};

/**
 * @struct FreeSpaceConfig
 * @brief Free-space sanitization limits
 */
struct FreeSpaceConfig {
    uint64_t headroom_bytes = 256ULL * 1'024 * 1'024;       ///< Never consumed
    uint64_t max_filler_size = 1'024ULL * 1'024 * 1'024;    ///< Per filler file
    size_t write_chunk_size = 1'024 * 1'024;
    std::string work_dir_prefix = ".shred-fill-";
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    util::LoggingConfig logging{.directory = SHREDDER_DEFAULT_LOG_DIR};
    SchedulerConfig scheduler;
    VerificationConfig verification;
    FreeSpaceConfig free_space;
    size_t retained_requests = 64;  ///< Finished requests kept for subscribe() before the oldest go
};
