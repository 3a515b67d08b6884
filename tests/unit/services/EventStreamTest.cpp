/**
 * @file EventStreamTest.cpp
 * @brief Unit tests for request channels and subscriber streams
 */

#include "services/EventStream.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

namespace {

OperationResult ResultFor(TaskId id) {
    OperationResult result;
    result.task_id = id;
    result.status = TaskStatus::DONE;
    return result;
}

ProgressSnapshot SnapshotWith(uint64_t done) {
    ProgressSnapshot snapshot;
    snapshot.tasks_total = 2;
    snapshot.tasks_done = done;
    return snapshot;
}

}  // namespace

class EventStreamTest : public ::testing::Test {
protected:
    std::shared_ptr<RequestChannel> channel = std::make_shared<RequestChannel>();
};

TEST_F(EventStreamTest, Publish_RejectedAfterClose) {
    EXPECT_TRUE(channel->publish(SnapshotWith(0)));
    channel->close();
    EXPECT_FALSE(channel->publish(SnapshotWith(1)));
    EXPECT_EQ(channel->size(), 1u);
    EXPECT_TRUE(channel->is_closed());
}

TEST_F(EventStreamTest, Collect_ReturnsEventsInPublicationOrder) {
    channel->publish(SnapshotWith(0));
    channel->publish(ResultFor(11));
    channel->publish(SnapshotWith(1));
    channel->close();

    EventStream stream(channel);
    auto events = stream.collect();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ProgressSnapshot>(events[0]));
    ASSERT_TRUE(std::holds_alternative<OperationResult>(events[1]));
    EXPECT_EQ(std::get<OperationResult>(events[1]).task_id, 11u);
    EXPECT_EQ(std::get<ProgressSnapshot>(events[2]).tasks_done, 1u);
    EXPECT_TRUE(stream.finished());
}

TEST_F(EventStreamTest, LateSubscriber_ReplaysFromFirstEvent) {
    EventStream early(channel);
    channel->publish(SnapshotWith(0));
    ASSERT_TRUE(early.poll().has_value());
    channel->publish(ResultFor(1));
    channel->close();

    EventStream late(channel);
    EXPECT_EQ(late.collect().size(), 2u);
    EXPECT_EQ(early.collect().size(), 1u);
}

TEST_F(EventStreamTest, Poll_DoesNotBlockWhenNothingReady) {
    EventStream stream(channel);
    EXPECT_FALSE(stream.poll().has_value());
    EXPECT_FALSE(stream.finished());
}

TEST_F(EventStreamTest, Next_BlocksUntilPublished) {
    EventStream stream(channel);
    std::thread producer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        channel->publish(ResultFor(5));
    });

    auto event = stream.next();
    producer.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<OperationResult>(*event).task_id, 5u);
}

TEST_F(EventStreamTest, Next_ReturnsNulloptOnceClosedAndDrained) {
    channel->publish(ResultFor(1));
    EventStream stream(channel);
    std::thread closer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        channel->close();
    });

    EXPECT_TRUE(stream.next().has_value());
    EXPECT_FALSE(stream.next().has_value());
    closer.join();
    EXPECT_TRUE(stream.finished());
}

TEST_F(EventStreamTest, RangeFor_VisitsEveryEvent) {
    for (TaskId id = 1; id <= 4; ++id) {
        channel->publish(ResultFor(id));
    }
    channel->close();

    std::vector<TaskId> seen;
    EventStream stream(channel);
    for (const auto& event : stream) {
        seen.push_back(std::get<OperationResult>(event).task_id);
    }
    EXPECT_EQ(seen, (std::vector<TaskId>{1, 2, 3, 4}));
}

TEST_F(EventStreamTest, WaitClosed_ReturnsAfterClose) {
    std::thread closer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        channel->close();
    });
    EXPECT_TRUE(ThreadingTestHelper::WaitFor([this] { channel->wait_closed(); }));
    closer.join();
}

TEST_F(EventStreamTest, TryGet_OutOfRangeIsEmpty) {
    channel->publish(ResultFor(1));
    EXPECT_TRUE(channel->try_get(0).has_value());
    EXPECT_FALSE(channel->try_get(1).has_value());
}
