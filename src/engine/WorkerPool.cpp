#include "engine/WorkerPool.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace engine {

namespace {

constexpr const char* COMPONENT = "WorkerPool";

auto exception_result(const PoolJob& job, const std::string& what) -> OperationResult {
    OperationResult result;
    result.task_id = job.task_id;
    result.request_id = job.request_id;
    result.target = job.target;
    result.kind = job.kind;
    result.passes_planned = job.passes_planned;
    result.status = TaskStatus::FAILED;
    result.error = ErrorKind::IO_ERROR;
    result.error_message = "worker exception: " + what;
    result.completed_at = std::chrono::system_clock::now();
    return result;
}

}  // namespace

auto WorkerPool::default_worker_count() -> size_t {
    return std::max<size_t>(std::thread::hardware_concurrency(), 1);
}

WorkerPool::WorkerPool(size_t worker_count) {
    const size_t count = worker_count == 0 ? default_worker_count() : worker_count;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, i, std::ref(queue_), std::ref(counters_));
    }
    LOG_DEBUG(COMPONENT, std::format("Started {} workers", count));
}

WorkerPool::~WorkerPool() {
    shutdown();
}

auto WorkerPool::submit(PoolJob job) -> bool {
    {
        std::lock_guard lock(queue_.mutex);
        if (queue_.stopping) {
            LOG_WARNING(COMPONENT, std::format("Rejected job for task {}: pool is shutting down",
                                               job.task_id));
            return false;
        }
        queue_.jobs.push_back(std::move(job));
    }
    queue_.work_available.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(queue_.mutex);
    queue_.idle.wait(lock, [this] {
        return queue_.jobs.empty() && counters_.active.load(std::memory_order_acquire) == 0;
    });
}

auto WorkerPool::is_idle() const -> bool {
    std::lock_guard lock(queue_.mutex);
    return queue_.jobs.empty() && counters_.active.load(std::memory_order_acquire) == 0;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(queue_.mutex);
        if (queue_.stopping && workers_.empty()) {
            return;
        }
        queue_.stopping = true;
    }
    queue_.work_available.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

auto WorkerPool::stats() const -> PoolStats {
    PoolStats stats;
    stats.completed = counters_.completed.load(std::memory_order_relaxed);
    stats.failed = counters_.failed.load(std::memory_order_relaxed);
    stats.active = counters_.active.load(std::memory_order_relaxed);
    std::lock_guard lock(queue_.mutex);
    stats.queued = queue_.jobs.size();
    return stats;
}

auto WorkerPool::run_job(PoolJob& job) -> bool {
    std::vector<OperationResult> results;
    try {
        results = job.run();
    } catch (const std::exception& e) {
        LOG_ERROR(COMPONENT, std::format("Task {} ({}) threw: {}", job.task_id,
                                         job.target.string(), e.what()));
        results = {exception_result(job, e.what())};
    } catch (...) {
        LOG_ERROR(COMPONENT, std::format("Task {} ({}) threw a non-standard exception",
                                         job.task_id, job.target.string()));
        results = {exception_result(job, "unknown exception")};
    }

    bool ok = true;
    for (const auto& result : results) {
        ok = ok && result.status != TaskStatus::FAILED;
        if (job.on_result) {
            job.on_result(result);
        }
    }
    return ok;
}

void WorkerPool::worker_loop(size_t index, JobQueue& queue, PoolCounters& counters) {
    while (true) {
        PoolJob job;
        {
            std::unique_lock lock(queue.mutex);
            queue.work_available.wait(lock, [&] { return queue.stopping || !queue.jobs.empty(); });
            if (queue.jobs.empty()) {
                break;
            }
            job = std::move(queue.jobs.front());
            queue.jobs.pop_front();
            counters.active.fetch_add(1, std::memory_order_acq_rel);
        }

        const bool ok = run_job(job);

        counters.completed.fetch_add(1, std::memory_order_relaxed);
        if (!ok) {
            counters.failed.fetch_add(1, std::memory_order_relaxed);
        }
        {
            std::lock_guard lock(queue.mutex);
            counters.active.fetch_sub(1, std::memory_order_acq_rel);
        }
        queue.idle.notify_all();
    }
    LOG_DEBUG(COMPONENT, std::format("Worker {} exiting", index));
}

}  // namespace engine
