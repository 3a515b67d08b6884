/**
 * @file FileShredderTest.cpp
 * @brief Unit tests for single-file overwrite, verification and removal
 */

#include "engine/FileShredder.hpp"
#include "engine/PassScheduler.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <numeric>
#include <optional>

#include <csignal>

#include <sys/file.h>
#include <sys/resource.h>
#include <fcntl.h>
#include <unistd.h>

using engine::FileShredder;
using engine::PassScheduler;
using testing::_;
using testing::HasSubstr;
using testing::Return;

namespace {

// Lowers the soft file-size limit so writes past @p bytes fail with EFBIG; restored on scope exit
class FileSizeLimit {
public:
    FileSizeLimit() {
        ::getrlimit(RLIMIT_FSIZE, &saved_);
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
    }
    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &saved_);
        std::signal(SIGXFSZ, previous_handler_);
    }

    bool Lower(rlim_t bytes) {
        rlimit limit = saved_;
        limit.rlim_cur = bytes;
        return ::setrlimit(RLIMIT_FSIZE, &limit) == 0;
    }

private:
    rlimit saved_{};
    void (*previous_handler_)(int) = SIG_DFL;
};

}  // namespace

class FileShredderTest : public EngineTestFixture {
protected:
    verification::VerificationLayer verifier;
    FileShredder shredder{guard, locks, &verifier};
    PassScheduler scheduler{SchedulerConfig{}, 1};

    ShredTask Plan(const std::filesystem::path& path, PatternRequest pattern,
                   size_t chunk = 1'024 * 1'024) {
        auto task = scheduler.plan(path, pattern, chunk);
        EXPECT_TRUE(task.has_value()) << task.error().message;
        return task.value_or(ShredTask{});
    }

    static size_t EntriesIn(const std::filesystem::path& dir) {
        return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                 std::filesystem::directory_iterator{}));
    }
};

// Test: complete runs
TEST_F(FileShredderTest, DoD3_TenMegabyteFile_WritesThreePassesAndRemoves) {
    constexpr size_t size = 10 * 1'024 * 1'024;
    auto file = TestFiles::WriteSecret(temp / "secret.dat", size);
    auto task = Plan(file, PatternRequest{.standard = Standard::DOD_3});

    auto result = shredder.execute(task, cancel, CreateCapturingCallback());

    EXPECT_TRUE(result.succeeded()) << result.error_message;
    EXPECT_EQ(result.status, TaskStatus::DONE);
    EXPECT_EQ(result.passes_completed, 3);
    EXPECT_EQ(result.passes_planned, 3);
    EXPECT_EQ(result.bytes_overwritten, 3u * size);
    EXPECT_TRUE(result.verified);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(EntriesIn(temp.path()), 0u) << "renamed entry left behind";
    EXPECT_EQ(task.status(), TaskStatus::DONE);
}

TEST_F(FileShredderTest, EveryPassWritesTheWholeFile) {
    constexpr size_t size = 300'001;
    auto file = TestFiles::WriteFilled(temp / "odd.bin", size, 0x42);
    auto task = Plan(file, PatternRequest{.standard = Standard::SCHNEIER_7}, 64 * 1'024);

    auto result = shredder.execute(task, cancel, CreateCapturingCallback());

    ASSERT_TRUE(result.succeeded()) << result.error_message;
    ASSERT_EQ(result.bytes_per_pass.size(), 7u);
    for (auto bytes : result.bytes_per_pass) {
        EXPECT_EQ(bytes, size);
    }
    EXPECT_EQ(std::accumulate(result.bytes_per_pass.begin(), result.bytes_per_pass.end(),
                              uint64_t{0}),
              result.bytes_overwritten);
}

TEST_F(FileShredderTest, ProgressReportsChunksAndPassBoundaries) {
    constexpr size_t size = 256 * 1'024;
    auto file = TestFiles::WriteFilled(temp / "p.bin", size, 0x00);
    auto task = Plan(file, PatternRequest{.standard = Standard::DOD_3}, 64 * 1'024);
    ASSERT_EQ(task.chunk_size, 64u * 1'024u);

    auto result = shredder.execute(task, cancel, CreateCapturingCallback());
    ASSERT_TRUE(result.succeeded());

    uint64_t delta_sum = 0;
    int boundaries = 0;
    for (const auto& progress : captured_progress) {
        EXPECT_EQ(progress.task_id, task.id);
        EXPECT_EQ(progress.total_passes, 3);
        delta_sum += progress.bytes_delta;
        if (progress.pass_finished) {
            ++boundaries;
            EXPECT_EQ(progress.current_pass, boundaries);
        }
    }
    EXPECT_EQ(delta_sum, 3u * size);
    EXPECT_EQ(boundaries, 3);
    EXPECT_EQ(captured_progress.size(), 3u * 4u + 3u);
}

TEST_F(FileShredderTest, Gutmann35_EmptyFile_SucceedsAndRemoves) {
    auto file = TestFiles::Write(temp / "empty", {});
    auto task = Plan(file, PatternRequest{.standard = Standard::GUTMANN_35});

    auto result = shredder.execute(task, cancel);

    EXPECT_TRUE(result.succeeded()) << result.error_message;
    EXPECT_EQ(result.passes_completed, 35);
    EXPECT_EQ(result.bytes_overwritten, 0u);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(FileShredderTest, KeepMetadata_OverwritesInPlace) {
    auto file = TestFiles::WriteSecret(temp / "kept.txt", 9'000);
    auto task = Plan(file, PatternRequest{.standard = Standard::ONE_FILL});
    task.destroy_metadata = false;

    auto result = shredder.execute(task, cancel);

    ASSERT_TRUE(result.succeeded()) << result.error_message;
    ASSERT_TRUE(std::filesystem::exists(file));
    auto content = TestFiles::Read(file);
    EXPECT_EQ(content.size(), 9'000u);
    EXPECT_TRUE(TestFiles::AllBytesEqual(content, 0xFF));
}

TEST_F(FileShredderTest, VerificationDisabled_NotReportedVerified) {
    auto file = TestFiles::WriteFilled(temp / "nv.bin", 1'000, 0x01);
    auto task = Plan(file, PatternRequest{.standard = Standard::ZERO_FILL});
    task.verify = false;

    auto result = shredder.execute(task, cancel);

    EXPECT_TRUE(result.succeeded());
    EXPECT_FALSE(result.verified);
}

TEST_F(FileShredderTest, RandomFinalPass_OriginalContentNotFoundAfterwards) {
    verification::VerificationLayer recording(VerificationConfig{.record_signatures = true});
    FileShredder shredder_with_signatures(guard, locks, &recording);
    auto file = TestFiles::WriteRandom(temp / "r.bin", 512 * 1'024);
    auto task = Plan(file, PatternRequest{.standard = Standard::RANDOM});
    task.destroy_metadata = false;

    auto result = shredder_with_signatures.execute(task, cancel);

    EXPECT_TRUE(result.succeeded()) << result.error_message;
    EXPECT_TRUE(result.verified);
}

// Test: cancellation
TEST_F(FileShredderTest, CancelAfterSecondOfSevenPasses_KeepsFileIntact) {
    constexpr size_t size = 128 * 1'024;
    auto file = TestFiles::WriteSecret(temp / "c.bin", size);
    auto task = Plan(file, PatternRequest{.standard = Standard::CUSTOM,
                                          .custom_pattern = {0xAB},
                                          .pass_count = 7});

    auto result = shredder.execute(task, cancel, [this](const TaskProgress& progress) {
        if (progress.pass_finished && progress.current_pass == 2) {
            cancel.cancel();
        }
    });

    EXPECT_EQ(result.status, TaskStatus::FAILED);
    EXPECT_EQ(result.error, ErrorKind::CANCELLED);
    EXPECT_EQ(result.passes_completed, 2);
    EXPECT_EQ(result.bytes_overwritten, 2u * size);
    EXPECT_THAT(result.error_message, HasSubstr("2 of 7"));
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(std::filesystem::file_size(file), size);
    EXPECT_TRUE(TestFiles::AllBytesEqual(TestFiles::Read(file), 0xAB));
}

TEST_F(FileShredderTest, CancelledBeforeStart_IsSkippedUntouched) {
    auto file = TestFiles::WriteSecret(temp / "s.txt", 100);
    auto task = Plan(file, PatternRequest{.standard = Standard::DOD_3});
    cancel.cancel();

    auto result = shredder.execute(task, cancel);

    EXPECT_EQ(result.status, TaskStatus::SKIPPED);
    EXPECT_EQ(result.error, ErrorKind::CANCELLED);
    EXPECT_EQ(result.passes_completed, 0);
    EXPECT_EQ(TestFiles::Read(file).size(), 100u);
}

TEST_F(FileShredderTest, GlobalCancel_StopsEveryToken) {
    auto file = TestFiles::WriteSecret(temp / "g.txt", 100);
    auto task = Plan(file, PatternRequest{.standard = Standard::DOD_3});
    engine::CancellationToken::cancel_all();

    auto result = shredder.execute(task, cancel);

    EXPECT_EQ(result.error, ErrorKind::CANCELLED);
    EXPECT_TRUE(std::filesystem::exists(file));
}

// Test: refusals
TEST_F(FileShredderTest, LockedFile_IsSkippedUntouched) {
    auto file = TestFiles::WriteSecret(temp / "locked.db", 4'096);
    auto task = Plan(file, PatternRequest{.standard = Standard::DOD_3});
    EXPECT_CALL(locks, acquire(_)).WillOnce(Return(guard::LockProbe::held_by("pid 77 (FLOCK)")));

    auto result = shredder.execute(task, cancel);

    EXPECT_EQ(result.status, TaskStatus::SKIPPED);
    EXPECT_EQ(result.error, ErrorKind::TARGET_LOCKED);
    EXPECT_THAT(result.error_message, HasSubstr("pid 77"));
    EXPECT_EQ(result.passes_completed, 0);
    auto content = TestFiles::Read(file);
    ASSERT_EQ(content.size(), 4'096u);
    EXPECT_EQ(content[0], 'T');
}

TEST_F(FileShredderTest, RealFlockHeldElsewhere_IsSkipped) {
    guard::LockDetector real_locks;
    FileShredder real_shredder(guard, real_locks, &verifier);
    auto file = TestFiles::WriteSecret(temp / "held.txt", 1'000);
    int holder = ::open(file.c_str(), O_RDONLY);
    ASSERT_GE(holder, 0);
    ASSERT_EQ(::flock(holder, LOCK_EX), 0);
    auto task = Plan(file, PatternRequest{.standard = Standard::ZERO_FILL});

    auto result = real_shredder.execute(task, cancel);
    ::close(holder);

    EXPECT_EQ(result.status, TaskStatus::SKIPPED);
    EXPECT_EQ(result.error, ErrorKind::TARGET_LOCKED);
    EXPECT_EQ(TestFiles::Read(file).size(), 1'000u);
}

TEST_F(FileShredderTest, ProtectedTarget_IsDeniedWithoutOpening) {
    ShredTask task;
    task.id = engine::next_task_id();
    task.target_path = "/etc/hostname";
    task.passes = {PassSpec::constant("zero", 0x00)};
    task.chunk_size = 4'096;
    EXPECT_CALL(locks, acquire(_)).Times(0);

    auto result = shredder.execute(task, cancel);

    EXPECT_EQ(result.status, TaskStatus::SKIPPED);
    EXPECT_EQ(result.error, ErrorKind::PATH_DENIED);
}

TEST_F(FileShredderTest, VanishedFile_IsSkippedNotFound) {
    auto file = TestFiles::WriteFilled(temp / "gone", 10, 1);
    auto task = Plan(file, PatternRequest{.standard = Standard::ZERO_FILL});
    std::filesystem::remove(file);

    auto result = shredder.execute(task, cancel);

    EXPECT_EQ(result.status, TaskStatus::SKIPPED);
    EXPECT_EQ(result.error, ErrorKind::TARGET_NOT_FOUND);
}

TEST_F(FileShredderTest, SymlinkSwappedInAfterPlanning_IsNotFollowed) {
    auto victim = TestFiles::WriteSecret(temp / "victim.txt", 500);
    auto file = TestFiles::WriteFilled(temp / "swap", 10, 1);
    auto task = Plan(file, PatternRequest{.standard = Standard::ZERO_FILL});
    std::filesystem::remove(file);
    std::filesystem::create_symlink(victim, file);

    auto result = shredder.execute(task, cancel);

    EXPECT_NE(result.status, TaskStatus::DONE);
    auto content = TestFiles::Read(victim);
    ASSERT_EQ(content.size(), 500u);
    EXPECT_EQ(content[0], 'T');
}

TEST_F(FileShredderTest, ContentlessEntry_IsUnlinkedWithoutWriting) {
    auto target = TestFiles::WriteSecret(temp / "target.txt", 50);
    std::filesystem::create_symlink(target, temp / "link");
    ShredTask task;
    task.id = engine::next_task_id();
    task.target_path = temp / "link";
    task.passes = {PassSpec::constant("zero", 0x00)};
    task.content_bearing = false;

    auto result = shredder.execute(task, cancel);

    EXPECT_TRUE(result.succeeded()) << result.error_message;
    EXPECT_EQ(result.bytes_overwritten, 0u);
    EXPECT_FALSE(std::filesystem::is_symlink(std::filesystem::symlink_status(temp / "link")));
    EXPECT_EQ(TestFiles::Read(target).size(), 50u);
}

TEST_F(FileShredderTest, TerminalTask_IsNotReRun) {
    constexpr size_t size = 8 * 1'024;
    auto file = TestFiles::WriteSecret(temp / "once.bin", size);
    auto task = Plan(file, PatternRequest{.standard = Standard::CUSTOM,
                                          .custom_pattern = {0xAB},
                                          .pass_count = 7});
    auto first = shredder.execute(task, cancel, [this](const TaskProgress& progress) {
        if (progress.pass_finished && progress.current_pass == 2) {
            cancel.cancel();
        }
    });
    ASSERT_EQ(first.status, TaskStatus::FAILED);
    ASSERT_EQ(first.passes_completed, 2);
    EXPECT_CALL(locks, acquire(_)).Times(0);

    engine::CancellationToken fresh;
    size_t progress_events = 0;
    auto second = shredder.execute(task, fresh,
                                   [&progress_events](const TaskProgress&) { ++progress_events; });

    EXPECT_EQ(second.status, TaskStatus::FAILED);
    EXPECT_EQ(second.error, ErrorKind::CANCELLED);
    EXPECT_EQ(second.passes_completed, 0);
    EXPECT_EQ(second.bytes_overwritten, 0u);
    EXPECT_EQ(progress_events, 0u);
    EXPECT_EQ(task.status(), TaskStatus::FAILED);
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(std::filesystem::file_size(file), size);
    EXPECT_TRUE(TestFiles::AllBytesEqual(TestFiles::Read(file), 0xAB));
}

TEST_F(FileShredderTest, CompletedTask_IsNotExecutedAgain) {
    auto file = TestFiles::WriteFilled(temp / "done", 10, 1);
    auto task = Plan(file, PatternRequest{.standard = Standard::ZERO_FILL});
    ASSERT_TRUE(shredder.execute(task, cancel).succeeded());
    TestFiles::WriteSecret(file, 10);

    auto again = shredder.execute(task, cancel);

    EXPECT_EQ(again.status, TaskStatus::DONE);
    EXPECT_EQ(again.bytes_overwritten, 0u);
    EXPECT_FALSE(task.advance_to(TaskStatus::RUNNING));
    auto content = TestFiles::Read(file);
    ASSERT_EQ(content.size(), 10u);
    EXPECT_EQ(content[0], 'T');
}

// Test: execution-time failures keep the progress made so far
TEST_F(FileShredderTest, VerificationMismatch_FailsAndKeepsFile) {
    constexpr size_t size = 8 * 1'024;
    auto file = TestFiles::WriteSecret(temp / "tampered.bin", size);
    auto task = Plan(file, PatternRequest{.standard = Standard::CUSTOM,
                                          .custom_pattern = {0xAB},
                                          .pass_count = 3});

    auto result = shredder.execute(task, cancel, [&file](const TaskProgress& progress) {
        // Another writer replaces the content between the last pass and read-back
        if (progress.pass_finished && progress.current_pass == progress.total_passes) {
            TestFiles::WriteFilled(file, size, 'T');
        }
    });

    EXPECT_EQ(result.status, TaskStatus::FAILED);
    EXPECT_EQ(result.error, ErrorKind::VERIFICATION_FAILED);
    EXPECT_EQ(result.passes_completed, 3);
    EXPECT_EQ(result.bytes_overwritten, 3u * size);
    EXPECT_FALSE(result.verified);
    EXPECT_EQ(task.status(), TaskStatus::FAILED);
    EXPECT_EQ(task.error(), ErrorKind::VERIFICATION_FAILED);
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(std::filesystem::file_size(file), size);
}

TEST_F(FileShredderTest, WriteErrorMidway_ReportsCompletedPasses) {
    constexpr size_t size = 64 * 1'024;
    auto file = TestFiles::WriteSecret(temp / "limited.bin", size);
    auto task = Plan(file, PatternRequest{.standard = Standard::CUSTOM,
                                          .custom_pattern = {0x5A},
                                          .pass_count = 4},
                     8 * 1'024);
    std::optional<FileSizeLimit> limit(std::in_place);
    bool lowered = false;

    auto result = shredder.execute(task, cancel, [&](const TaskProgress& progress) {
        if (progress.pass_finished && progress.current_pass == 2) {
            lowered = limit->Lower(size / 2);
        }
    });
    limit.reset();

    ASSERT_TRUE(lowered);
    EXPECT_EQ(result.status, TaskStatus::FAILED);
    EXPECT_EQ(result.error, ErrorKind::IO_ERROR);
    EXPECT_EQ(result.passes_completed, 2);
    EXPECT_EQ(result.bytes_per_pass.size(), 2u);
    EXPECT_EQ(result.bytes_overwritten, 2u * size + size / 2);
    EXPECT_FALSE(result.verified);
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(std::filesystem::file_size(file), size);
}
