/**
 * @file ShredService.hpp
 * @brief IShredService implementation driving the erasure engine
 */

#pragma once

#include "engine/Cancellation.hpp"
#include "engine/FreeSpaceWiper.hpp"
#include "engine/PassScheduler.hpp"
#include "engine/ProgressTracker.hpp"
#include "engine/WorkerPool.hpp"
#include "guard/LockDetector.hpp"
#include "guard/ProtectedPathGuard.hpp"
#include "interfaces/IAuditSink.hpp"
#include "interfaces/IShredService.hpp"
#include "models/EngineConfig.hpp"
#include "verification/VerificationLayer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

/**
 * @class ShredService
 * @brief Plans requests, runs them on per-request worker pools and audits every result
 *
 * Each request owns its event channel, progress tracker, cancellation flag
 * and worker pool. Every terminal task is appended to the audit sink
 * exactly once (appends are serialized), then published as an
 * OperationResult followed by a ProgressSnapshot. The channel closes after
 * the last task of the request is terminal.
 *
 * Finished requests stay subscribable until release() is called or more
 * than EngineConfig::retained_requests of them have accumulated, at which
 * point the oldest are dropped. Destroying the service cancels unfinished
 * requests and joins their workers.
 */
class ShredService : public IShredService {
public:
    /**
     * @param config Engine configuration
     * @param rules Protected rules; nullptr applies builtin system roots only
     * @param audit Audit destination; nullptr selects LogAuditSink
     * @param locks Lock detection; nullptr selects guard::LockDetector
     * @param probe Free-space measurement; nullptr selects statvfs
     */
    explicit ShredService(EngineConfig config, guard::RuleSetPtr rules = nullptr,
                          std::shared_ptr<IAuditSink> audit = nullptr,
                          std::shared_ptr<guard::ILockDetector> locks = nullptr,
                          std::shared_ptr<engine::IVolumeProbe> probe = nullptr);
    ~ShredService() override;

    ShredService(const ShredService&) = delete;
    auto operator=(const ShredService&) -> ShredService& = delete;

    auto submit(const std::vector<std::filesystem::path>& targets, const ShredOptions& options)
        -> std::expected<RequestId, util::Error> override;

    [[nodiscard]] auto subscribe(RequestId request) -> std::optional<EventStream> override;

    auto cancel(RequestId request) -> bool override;

    auto wipe_free_space(const std::filesystem::path& volume_root, const ShredOptions& options)
        -> std::expected<RequestId, util::Error> override;

    auto wait(RequestId request) -> bool override;

    auto release(RequestId request) -> bool override;

    [[nodiscard]] auto request_count() const -> size_t;

    [[nodiscard]] auto guard() const -> const guard::ProtectedPathGuard& { return guard_; }

private:
    struct RequestState {
        RequestId id = 0;
        engine::CancellationToken cancel;
        std::shared_ptr<RequestChannel> channel = std::make_shared<RequestChannel>();
        engine::ProgressTracker progress;
        std::mutex mutex;  ///< Orders publication and guards remaining
        size_t remaining = 0;
        std::chrono::steady_clock::time_point last_snapshot{};
        std::unique_ptr<engine::WorkerPool> pool;
    };
    using StatePtr = std::shared_ptr<RequestState>;

    struct DirectoryGroup;

    [[nodiscard]] auto create_request(size_t worker_count) -> StatePtr;
    [[nodiscard]] auto worker_count_for(const ShredOptions& options) const -> size_t;

    void plan_target(const StatePtr& state, const engine::PassScheduler& scheduler,
                     const std::filesystem::path& target, const std::vector<PassSpec>& passes,
                     const ShredOptions& options, std::vector<OperationResult>& skipped,
                     std::vector<engine::PoolJob>& jobs);

    void plan_tree(const StatePtr& state, const engine::PassScheduler& scheduler,
                   const std::filesystem::path& root, const std::vector<PassSpec>& passes,
                   const ShredOptions& options, std::vector<OperationResult>& skipped,
                   std::vector<engine::PoolJob>& jobs);

    [[nodiscard]] auto make_file_job(const StatePtr& state, std::shared_ptr<ShredTask> task,
                                     std::function<void()> after = {}) -> engine::PoolJob;

    [[nodiscard]] auto make_directory_job(const StatePtr& state,
                                          std::shared_ptr<DirectoryGroup> group) -> engine::PoolJob;

    /**
     * @brief Plan-time lock probe; fills @p skipped and returns false if the file is held
     */
    [[nodiscard]] auto admit_file(ShredTask& task, std::vector<OperationResult>& skipped) -> bool;

    /**
     * @brief Start a prepared request: emit skipped results, then queue jobs
     */
    void launch(const StatePtr& state, std::vector<OperationResult> skipped,
                std::vector<engine::PoolJob> jobs);

    void finish_task(const StatePtr& state, const OperationResult& result, uint64_t planned_bytes);
    void publish_progress(const StatePtr& state, bool force);
    void reap_finished();

    [[nodiscard]] auto find(RequestId request) const -> StatePtr;

    EngineConfig config_;
    guard::ProtectedPathGuard guard_;
    verification::VerificationLayer verifier_;
    std::shared_ptr<IAuditSink> audit_;
    std::shared_ptr<guard::ILockDetector> locks_;
    std::shared_ptr<engine::IVolumeProbe> probe_;

    std::mutex audit_mutex_;
    mutable std::mutex requests_mutex_;
    std::map<RequestId, StatePtr> requests_;
    std::atomic<RequestId> next_request_id_{1};
};
