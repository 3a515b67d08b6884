#include "engine/ProgressTracker.hpp"

#include <algorithm>
#include <numeric>

namespace engine {

ProgressTracker::ProgressTracker()
    : start_time_(std::chrono::steady_clock::now()), last_sample_time_(start_time_) {}

void ProgressTracker::add_planned(uint64_t bytes, uint64_t tasks) {
    planned_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    tasks_total_.fetch_add(tasks, std::memory_order_relaxed);
}

void ProgressTracker::record_bytes(uint64_t bytes) {
    done_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressTracker::record_task_done(uint64_t unwritten) {
    abandoned_bytes_.fetch_add(unwritten, std::memory_order_relaxed);
    tasks_done_.fetch_add(1, std::memory_order_acq_rel);
}

auto ProgressTracker::snapshot() -> ProgressSnapshot {
    ProgressSnapshot snapshot;
    snapshot.tasks_total = tasks_total_.load(std::memory_order_relaxed);
    snapshot.tasks_done = std::min(tasks_done_.load(std::memory_order_acquire), snapshot.tasks_total);
    snapshot.total_bytes_planned = planned_bytes_.load(std::memory_order_relaxed);
    // Files can grow between planning and a pass; never report more done than planned
    snapshot.bytes_done =
        std::min(done_bytes_.load(std::memory_order_relaxed), snapshot.total_bytes_planned);

    const uint64_t abandoned = std::min(abandoned_bytes_.load(std::memory_order_relaxed),
                                        snapshot.total_bytes_planned - snapshot.bytes_done);
    const uint64_t reachable = snapshot.total_bytes_planned - abandoned;
    if (snapshot.tasks_total > 0 && snapshot.tasks_done == snapshot.tasks_total) {
        snapshot.eta_ms = 0;
    } else {
        snapshot.eta_ms = estimate_eta(reachable, snapshot.bytes_done);
    }
    return snapshot;
}

auto ProgressTracker::estimate_eta(uint64_t planned, uint64_t done) -> int64_t {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();

    if (now - last_sample_time_ >= MIN_SAMPLE_INTERVAL && done > last_sample_bytes_) {
        const double seconds =
            std::chrono::duration<double>(now - last_sample_time_).count();
        speed_samples_.push_back(static_cast<double>(done - last_sample_bytes_) / seconds);
        if (speed_samples_.size() > MAX_SAMPLES) {
            speed_samples_.pop_front();
        }
        last_sample_time_ = now;
        last_sample_bytes_ = done;
    }

    if (done >= planned) {
        return 0;
    }

    double speed = 0.0;
    if (!speed_samples_.empty()) {
        speed = std::accumulate(speed_samples_.begin(), speed_samples_.end(), 0.0) /
                static_cast<double>(speed_samples_.size());
    } else if (done > 0) {
        const double elapsed = std::chrono::duration<double>(now - start_time_).count();
        if (elapsed > 0.0) {
            speed = static_cast<double>(done) / elapsed;
        }
    }
    if (speed <= 0.0) {
        return -1;
    }
    return static_cast<int64_t>(static_cast<double>(planned - done) / speed * 1000.0);
}

}  // namespace engine
