/**
 * @file ProgressTrackerTest.cpp
 * @brief Unit tests for request progress aggregation
 */

#include "engine/ProgressTracker.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

TEST(ProgressTrackerTest, Snapshot_StartsEmptyWithUnknownEta) {
    engine::ProgressTracker tracker;
    auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.total_bytes_planned, 0u);
    EXPECT_EQ(snapshot.bytes_done, 0u);
    EXPECT_EQ(snapshot.tasks_total, 0u);
    EXPECT_EQ(snapshot.eta_ms, -1);
}

TEST(ProgressTrackerTest, Snapshot_ReflectsPlannedAndDone) {
    engine::ProgressTracker tracker;
    tracker.add_planned(3'000);
    tracker.add_planned(1'000);
    tracker.record_bytes(1'500);

    auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.total_bytes_planned, 4'000u);
    EXPECT_EQ(snapshot.bytes_done, 1'500u);
    EXPECT_EQ(snapshot.tasks_total, 2u);
    EXPECT_EQ(snapshot.tasks_done, 0u);
}

TEST(ProgressTrackerTest, Snapshot_BytesDoneNeverExceedPlanned) {
    engine::ProgressTracker tracker;
    tracker.add_planned(100);
    tracker.record_bytes(250);
    EXPECT_EQ(tracker.snapshot().bytes_done, 100u);
}

TEST(ProgressTrackerTest, Snapshot_EtaIsZeroWhenAllTasksDone) {
    engine::ProgressTracker tracker;
    tracker.add_planned(100);
    tracker.record_bytes(40);
    tracker.record_task_done(60);

    auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.tasks_done, 1u);
    EXPECT_EQ(snapshot.eta_ms, 0);
}

TEST(ProgressTrackerTest, Snapshot_EtaKnownOnceBytesFlow) {
    engine::ProgressTracker tracker;
    tracker.add_planned(10'000'000);
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    tracker.record_bytes(1'000'000);

    auto snapshot = tracker.snapshot();
    EXPECT_GT(snapshot.eta_ms, 0);
}

TEST(ProgressTrackerTest, ConcurrentUpdates_AreAllCounted) {
    engine::ProgressTracker tracker;
    constexpr int threads = 8;
    constexpr int updates = 1'000;
    tracker.add_planned(threads * updates * 10ull, threads);

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&tracker] {
            for (int i = 0; i < updates; ++i) {
                tracker.record_bytes(10);
            }
            tracker.record_task_done();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.bytes_done, threads * updates * 10ull);
    EXPECT_EQ(snapshot.tasks_done, static_cast<uint64_t>(threads));
}
