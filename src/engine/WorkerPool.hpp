/**
 * @file WorkerPool.hpp
 * @brief Fixed set of worker threads draining a shared job queue
 */

#pragma once

#include "models/ShredTypes.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace engine {

/**
 * @struct PoolJob
 * @brief One queued unit of work and the identity used if it throws
 */
struct PoolJob {
    TaskId task_id = 0;
    RequestId request_id = 0;
    std::filesystem::path target;
    TaskKind kind = TaskKind::FILE;
    int passes_planned = 0;
    std::function<std::vector<OperationResult>()> run;
    std::function<void(const OperationResult&)> on_result;  ///< Called once per produced result
};

/**
 * @struct PoolStats
 * @brief Counters sampled from a running pool
 */
struct PoolStats {
    uint64_t completed = 0;  ///< Jobs finished, including failed ones
    uint64_t failed = 0;     ///< Jobs whose results contained a failure or that threw
    size_t active = 0;
    size_t queued = 0;
};

/**
 * @class WorkerPool
 * @brief Runs each submitted job to completion on exactly one worker
 *
 * The queue and counters live in the pool and are handed to every worker
 * by reference. A job that throws produces a FAILED result with IO_ERROR
 * for its task; other jobs are unaffected. Destruction stops accepting
 * new jobs, drains the queue and joins every worker.
 */
class WorkerPool {
public:
    /**
     * @param worker_count Number of threads; 0 uses std::thread::hardware_concurrency()
     */
    explicit WorkerPool(size_t worker_count = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    auto operator=(const WorkerPool&) -> WorkerPool& = delete;

    /**
     * @return false once shutdown has begun
     */
    auto submit(PoolJob job) -> bool;

    /**
     * @brief Block until the queue is empty and no worker is busy
     */
    void wait_idle();

    /**
     * @brief Stop accepting jobs, finish queued ones and join the workers
     */
    void shutdown();

    [[nodiscard]] auto stats() const -> PoolStats;
    [[nodiscard]] auto size() const -> size_t { return workers_.size(); }
    [[nodiscard]] auto is_idle() const -> bool;

    [[nodiscard]] static auto default_worker_count() -> size_t;

private:
    struct JobQueue {
        mutable std::mutex mutex;
        std::condition_variable work_available;
        std::condition_variable idle;
        std::deque<PoolJob> jobs;
        bool stopping = false;
    };

    struct PoolCounters {
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<size_t> active{0};
    };

    static void worker_loop(size_t index, JobQueue& queue, PoolCounters& counters);
    static auto run_job(PoolJob& job) -> bool;

    JobQueue queue_;
    PoolCounters counters_;
    std::vector<std::thread> workers_;
};

}  // namespace engine
