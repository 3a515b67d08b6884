/**
 * @file ProgressTracker.hpp
 * @brief Request-wide byte and task counters with ETA estimation
 */

#pragma once

#include "models/ShredTypes.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

namespace engine {

/**
 * @class ProgressTracker
 * @brief Aggregates progress reported by every worker of a request
 *
 * Counters are atomics updated from any worker. The ETA uses a rolling
 * average of recent throughput samples, taken at most every
 * MIN_SAMPLE_INTERVAL.
 */
class ProgressTracker {
public:
    ProgressTracker();

    /**
     * @brief Account for a newly planned task
     */
    void add_planned(uint64_t bytes, uint64_t tasks = 1);

    void record_bytes(uint64_t bytes);

    /**
     * @brief Mark one task terminal
     * @param unwritten Planned bytes the task will never write (skipped or failed)
     */
    void record_task_done(uint64_t unwritten = 0);

    [[nodiscard]] auto snapshot() -> ProgressSnapshot;

private:
    static constexpr size_t MAX_SAMPLES = 10;
    static constexpr auto MIN_SAMPLE_INTERVAL = std::chrono::milliseconds{100};

    [[nodiscard]] auto estimate_eta(uint64_t planned, uint64_t done) -> int64_t;

    std::atomic<uint64_t> planned_bytes_{0};
    std::atomic<uint64_t> done_bytes_{0};
    std::atomic<uint64_t> abandoned_bytes_{0};
    std::atomic<uint64_t> tasks_total_{0};
    std::atomic<uint64_t> tasks_done_{0};

    std::mutex rate_mutex_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_sample_time_;
    uint64_t last_sample_bytes_ = 0;
    std::deque<double> speed_samples_;
};

}  // namespace engine
