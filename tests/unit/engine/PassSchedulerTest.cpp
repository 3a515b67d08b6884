/**
 * @file PassSchedulerTest.cpp
 * @brief Unit tests for task planning and chunk sizing
 */

#include "engine/PassScheduler.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

using engine::PassScheduler;

class PassSchedulerTest : public ::testing::Test {
protected:
    TempDir temp;
    PassScheduler scheduler{SchedulerConfig{}, 4};
    std::vector<PassSpec> passes{PassSpec::constant("zero", 0x00)};
};

// Test: chunk sizing
TEST_F(PassSchedulerTest, EffectiveChunkSize_HonorsHintWithinBounds) {
    EXPECT_EQ(scheduler.effective_chunk_size(1'024 * 1'024, 100 * 1'024 * 1'024), 1'024u * 1'024u);
}

TEST_F(PassSchedulerTest, EffectiveChunkSize_NeverBelowFloor) {
    EXPECT_EQ(scheduler.effective_chunk_size(16, 100 * 1'024 * 1'024), 4'096u);
    EXPECT_EQ(scheduler.effective_chunk_size(1'024 * 1'024, 10), 4'096u);
}

TEST_F(PassSchedulerTest, EffectiveChunkSize_NeverAboveCeiling) {
    EXPECT_LE(scheduler.effective_chunk_size(1'024ull * 1'024 * 1'024, 1ull << 40),
              16u * 1'024u * 1'024u);
}

TEST_F(PassSchedulerTest, EffectiveChunkSize_BoundedByFileSize) {
    EXPECT_EQ(scheduler.effective_chunk_size(1'024 * 1'024, 64 * 1'024), 64u * 1'024u);
}

// Test: single targets
TEST_F(PassSchedulerTest, Plan_RegularFile) {
    auto file = TestFiles::WriteFilled(temp / "f.bin", 5'000, 0x11);

    auto task = scheduler.plan(file, PatternRequest{.standard = Standard::DOD_3}, 1'024 * 1'024);

    ASSERT_TRUE(task.has_value()) << task.error().message;
    EXPECT_EQ(task->kind, TaskKind::FILE);
    EXPECT_EQ(task->planned_length, 5'000u);
    EXPECT_EQ(task->passes.size(), 3u);
    EXPECT_EQ(task->status(), TaskStatus::PENDING);
    EXPECT_TRUE(task->content_bearing);
    EXPECT_GT(task->id, 0u);
}

TEST_F(PassSchedulerTest, Plan_AssignsDistinctIds) {
    auto file = TestFiles::WriteFilled(temp / "f.bin", 10, 0x11);
    auto first = scheduler.plan(file, passes, 0);
    auto second = scheduler.plan(file, passes, 0);
    ASSERT_TRUE(first && second);
    EXPECT_NE(first->id, second->id);
}

TEST_F(PassSchedulerTest, Plan_MissingTargetIsNotFound) {
    auto task = scheduler.plan(temp / "absent", passes, 0);
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().kind, ErrorKind::TARGET_NOT_FOUND);
}

TEST_F(PassSchedulerTest, Plan_TopLevelSymlinkIsUnsupported) {
    auto file = TestFiles::WriteFilled(temp / "real", 10, 0x11);
    std::filesystem::create_symlink(file, temp / "link");

    auto task = scheduler.plan(temp / "link", passes, 0);
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().kind, ErrorKind::UNSUPPORTED_TARGET);
}

TEST_F(PassSchedulerTest, Plan_FifoIsUnsupported) {
    ASSERT_EQ(::mkfifo((temp / "pipe").c_str(), 0600), 0);
    auto task = scheduler.plan(temp / "pipe", passes, 0);
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().kind, ErrorKind::UNSUPPORTED_TARGET);
}

TEST_F(PassSchedulerTest, Plan_InvalidPassCountRejected) {
    auto file = TestFiles::WriteFilled(temp / "f.bin", 10, 0x11);
    auto task = scheduler.plan(file, PatternRequest{.standard = Standard::CUSTOM, .pass_count = 40},
                               0);
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().kind, ErrorKind::INVALID_PASS_COUNT);
}

TEST_F(PassSchedulerTest, Plan_DirectoryTarget) {
    std::filesystem::create_directories(temp / "d");
    auto task = scheduler.plan(temp / "d", passes, 0);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->kind, TaskKind::DIRECTORY);
}

// Test: tree manifests
TEST_F(PassSchedulerTest, PlanTree_OrdersDirectoriesInnermostFirstRootLast) {
    TestFiles::WriteFilled(temp / "root" / "a.txt", 10, 1);
    TestFiles::WriteFilled(temp / "root" / "x" / "b.txt", 20, 1);
    TestFiles::WriteFilled(temp / "root" / "x" / "y" / "c.txt", 30, 1);
    std::filesystem::create_directories(temp / "root" / "empty");

    auto manifest = scheduler.plan_tree(temp / "root", passes, 0);

    ASSERT_TRUE(manifest.has_value()) << manifest.error().message;
    EXPECT_EQ(manifest->files.size(), 3u);
    ASSERT_EQ(manifest->directories.size(), 4u);
    EXPECT_EQ(manifest->directories.front().target_path, temp / "root" / "x" / "y");
    EXPECT_EQ(manifest->directories.back().target_path, temp / "root");
    EXPECT_EQ(manifest->planned_bytes(), 60u);

    // A directory never precedes one nested inside it
    auto is_inside = [](const std::filesystem::path& child, const std::filesystem::path& parent) {
        auto rel = child.lexically_relative(parent);
        return !rel.empty() && *rel.begin() != ".." && rel != ".";
    };
    const auto& dirs = manifest->directories;
    for (size_t i = 0; i < dirs.size(); ++i) {
        for (size_t j = i + 1; j < dirs.size(); ++j) {
            EXPECT_FALSE(is_inside(dirs[j].target_path, dirs[i].target_path))
                << dirs[j].target_path << " planned after " << dirs[i].target_path;
        }
    }
}

TEST_F(PassSchedulerTest, PlanTree_SymlinksAreContentlessAndNotFollowed) {
    auto outside = TestFiles::WriteFilled(temp / "outside" / "keep.txt", 10, 1);
    TestFiles::WriteFilled(temp / "root" / "a.txt", 10, 1);
    std::filesystem::create_symlink(outside, temp / "root" / "link-to-file");
    std::filesystem::create_directory_symlink(temp / "outside", temp / "root" / "link-to-dir");

    auto manifest = scheduler.plan_tree(temp / "root", passes, 0);

    ASSERT_TRUE(manifest.has_value());
    ASSERT_EQ(manifest->files.size(), 3u);
    size_t contentless = 0;
    for (const auto& file : manifest->files) {
        EXPECT_NE(file.target_path.parent_path(), temp / "outside");
        if (!file.content_bearing) {
            ++contentless;
        }
    }
    EXPECT_EQ(contentless, 2u);
    EXPECT_EQ(manifest->directories.size(), 1u);
}

TEST_F(PassSchedulerTest, PlanTree_FileTargetIsUnsupported) {
    auto file = TestFiles::WriteFilled(temp / "f", 1, 1);
    auto manifest = scheduler.plan_tree(file, passes, 0);
    ASSERT_FALSE(manifest.has_value());
    EXPECT_EQ(manifest.error().kind, ErrorKind::UNSUPPORTED_TARGET);
}

TEST_F(PassSchedulerTest, PlanFreeSpace_KeepsMetadataAndPasses) {
    auto task = scheduler.plan_free_space(temp.path(), passes, 0);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->kind, TaskKind::FREE_SPACE_SEGMENT);
    EXPECT_FALSE(task->destroy_metadata);
    EXPECT_EQ(task->passes, passes);
}

// Test: terminal states are immutable
TEST(ShredTaskTest, AdvanceTo_RefusesToLeaveTerminalState) {
    ShredTask task;
    EXPECT_TRUE(task.advance_to(TaskStatus::RUNNING));
    EXPECT_TRUE(task.advance_to(TaskStatus::DONE));
    EXPECT_FALSE(task.advance_to(TaskStatus::RUNNING));
    EXPECT_FALSE(task.advance_to(TaskStatus::FAILED));
    EXPECT_EQ(task.status(), TaskStatus::DONE);
}

TEST(ShredTaskTest, AdvanceTo_RefusesReturnToPending) {
    ShredTask task;
    EXPECT_FALSE(task.advance_to(TaskStatus::PENDING));
    EXPECT_TRUE(task.advance_to(TaskStatus::SKIPPED));
    EXPECT_FALSE(task.advance_to(TaskStatus::DONE));
}
