#include "services/ShredService.hpp"

#include "engine/DirectoryShredder.hpp"
#include "engine/FileShredder.hpp"
#include "patterns/PatternSource.hpp"
#include "services/LogAuditSink.hpp"
#include "config.h"
#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr const char* COMPONENT = "ShredService";
constexpr auto SNAPSHOT_INTERVAL = std::chrono::milliseconds{100};

auto planned_bytes_of(const ShredTask& task) -> uint64_t {
    return task.content_bearing ? task.planned_length * task.passes.size() : 0;
}

/**
 * @brief Result for a target rejected before any task could be planned
 */
auto rejected(RequestId request, const fs::path& target, int passes_planned,
              const util::Error& error) -> OperationResult {
    OperationResult result;
    result.task_id = engine::next_task_id();
    result.request_id = request;
    result.target = target;
    result.status = TaskStatus::SKIPPED;
    result.passes_planned = passes_planned;
    result.error = error.kind;
    result.error_message = error.message;
    result.completed_at = std::chrono::system_clock::now();
    return result;
}

/**
 * @brief Move a planned task straight to SKIPPED
 */
auto skip(ShredTask& task, ErrorKind kind, std::string message) -> OperationResult {
    auto result = engine::make_result(task);
    engine::finish_result(task, result, TaskStatus::SKIPPED, std::chrono::steady_clock::now(),
                          kind, std::move(message));
    return result;
}

}  // namespace

struct ShredService::DirectoryGroup {
    std::shared_ptr<engine::DirectoryManifest> manifest;
    std::atomic<size_t> files_left{0};
};

ShredService::ShredService(EngineConfig config, guard::RuleSetPtr rules,
                           std::shared_ptr<IAuditSink> audit,
                           std::shared_ptr<guard::ILockDetector> locks,
                           std::shared_ptr<engine::IVolumeProbe> probe)
    : config_(std::move(config)),
      guard_(std::move(rules)),
      verifier_(config_.verification),
      audit_(audit ? std::move(audit) : std::make_shared<LogAuditSink>()),
      locks_(locks ? std::move(locks) : std::make_shared<guard::LockDetector>()),
      probe_(probe ? std::move(probe) : std::make_shared<engine::StatvfsVolumeProbe>()) {
    auto& logger = util::Logger::instance();
    if (!logger.is_initialized() && !logger.initialize(config_.logging)) {
        std::cerr << "ShredService: could not open log directory "
                  << config_.logging.directory << std::endl;
    }
    LOG_INFO(COMPONENT, std::format("{} {} ready ({} blacklist, {} whitelist entries)",
                                    PROJECT_NAME, PROJECT_VERSION,
                                    guard_.rules().blacklist_prefixes.size(),
                                    guard_.rules().whitelist_prefixes.size()));
}

ShredService::~ShredService() {
    std::vector<StatePtr> states;
    {
        std::lock_guard lock(requests_mutex_);
        for (const auto& [id, state] : requests_) {
            states.push_back(state);
        }
    }
    for (const auto& state : states) {
        if (!state->channel->is_closed()) {
            LOG_WARNING(COMPONENT, std::format("Cancelling unfinished request {}", state->id));
            state->cancel.cancel();
        }
    }
    for (const auto& state : states) {
        if (state->pool) {
            state->pool->shutdown();
        }
    }
}

auto ShredService::worker_count_for(const ShredOptions& options) const -> size_t {
    if (options.worker_count > 0) {
        return options.worker_count;
    }
    if (config_.scheduler.default_worker_count > 0) {
        return config_.scheduler.default_worker_count;
    }
    return engine::WorkerPool::default_worker_count();
}

auto ShredService::create_request(size_t worker_count) -> StatePtr {
    reap_finished();

    auto state = std::make_shared<RequestState>();
    state->id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    state->pool = std::make_unique<engine::WorkerPool>(worker_count);

    std::lock_guard lock(requests_mutex_);
    requests_.emplace(state->id, state);
    return state;
}

auto ShredService::submit(const std::vector<fs::path>& targets, const ShredOptions& options)
    -> std::expected<RequestId, util::Error> {
    auto passes = patterns::PatternSource::resolve(options.pattern);
    if (!passes) {
        LOG_ERROR(COMPONENT, std::format("Request rejected: {}", passes.error().message));
        return std::unexpected(passes.error());
    }

    const size_t workers = worker_count_for(options);
    const engine::PassScheduler scheduler(config_.scheduler, workers);
    auto state = create_request(workers);

    LOG_INFO(COMPONENT, std::format("Request {}: {} targets, standard {}, {} passes, {} workers",
                                    state->id, targets.size(),
                                    patterns::PatternSource::standard_name(options.pattern.standard),
                                    passes->size(), workers));

    std::vector<OperationResult> skipped;
    std::vector<engine::PoolJob> jobs;
    for (const auto& target : targets) {
        plan_target(state, scheduler, target, *passes, options, skipped, jobs);
    }

    launch(state, std::move(skipped), std::move(jobs));
    return state->id;
}

void ShredService::plan_target(const StatePtr& state, const engine::PassScheduler& scheduler,
                               const fs::path& target, const std::vector<PassSpec>& passes,
                               const ShredOptions& options, std::vector<OperationResult>& skipped,
                               std::vector<engine::PoolJob>& jobs) {
    const int pass_count = static_cast<int>(passes.size());

    if (auto verdict = guard_.check(target); !verdict) {
        skipped.push_back(rejected(state->id, target, pass_count,
                                   util::Error{ErrorKind::PATH_DENIED, verdict.reason}));
        return;
    }

    auto planned = scheduler.plan(target, passes, options.chunk_size_hint);
    if (!planned) {
        LOG_WARNING(COMPONENT, std::format("Skipping {}: {}", target.string(),
                                           planned.error().message));
        skipped.push_back(rejected(state->id, target, pass_count, planned.error()));
        return;
    }

    if (planned->kind == TaskKind::DIRECTORY) {
        if (!options.recursive) {
            planned->request_id = state->id;
            skipped.push_back(skip(*planned, ErrorKind::UNSUPPORTED_TARGET,
                                   target.string() + " is a directory and recursion is off"));
            return;
        }
        plan_tree(state, scheduler, planned->target_path, passes, options, skipped, jobs);
        return;
    }

    auto task = std::make_shared<ShredTask>(std::move(*planned));
    task->request_id = state->id;
    task->verify = options.verify;
    task->destroy_metadata = options.destroy_metadata;
    if (!admit_file(*task, skipped)) {
        return;
    }
    state->progress.add_planned(planned_bytes_of(*task));
    jobs.push_back(make_file_job(state, std::move(task)));
}

void ShredService::plan_tree(const StatePtr& state, const engine::PassScheduler& scheduler,
                             const fs::path& root, const std::vector<PassSpec>& passes,
                             const ShredOptions& options, std::vector<OperationResult>& skipped,
                             std::vector<engine::PoolJob>& jobs) {
    auto manifest = scheduler.plan_tree(root, passes, options.chunk_size_hint);
    if (!manifest) {
        LOG_WARNING(COMPONENT, std::format("Skipping tree {}: {}", root.string(),
                                           manifest.error().message));
        skipped.push_back(rejected(state->id, root, static_cast<int>(passes.size()),
                                   manifest.error()));
        return;
    }

    auto group = std::make_shared<DirectoryGroup>();
    group->manifest = std::make_shared<engine::DirectoryManifest>(std::move(*manifest));
    auto& plan = *group->manifest;

    for (auto& directory : plan.directories) {
        directory.request_id = state->id;
    }

    std::vector<ShredTask*> admitted;
    for (auto& file : plan.files) {
        file.request_id = state->id;
        file.verify = options.verify;
        file.destroy_metadata = options.destroy_metadata;

        if (auto verdict = guard_.check(file.target_path); !verdict) {
            skipped.push_back(skip(file, ErrorKind::PATH_DENIED, verdict.reason));
            continue;
        }
        if (!admit_file(file, skipped)) {
            continue;
        }
        admitted.push_back(&file);
    }

    state->progress.add_planned(0, plan.directories.size());
    group->files_left.store(admitted.size());
    if (admitted.empty()) {
        jobs.push_back(make_directory_job(state, group));
        return;
    }

    for (auto* file : admitted) {
        state->progress.add_planned(planned_bytes_of(*file));
        // Aliasing pointer: the job keeps the whole manifest alive
        std::shared_ptr<ShredTask> task(group->manifest, file);
        jobs.push_back(make_file_job(state, std::move(task), [this, state, group] {
            if (group->files_left.fetch_sub(1, std::memory_order_acq_rel) != 1) {
                return;
            }
            if (!state->pool->submit(make_directory_job(state, group))) {
                for (auto& directory : group->manifest->directories) {
                    finish_task(state, skip(directory, ErrorKind::CANCELLED, "service shutting down"),
                                0);
                }
            }
        }));
    }
}

auto ShredService::admit_file(ShredTask& task, std::vector<OperationResult>& skipped) -> bool {
    if (!task.content_bearing) {
        return true;
    }
    auto probe = locks_->probe(task.target_path);
    if (!probe) {
        skipped.push_back(skip(task, probe.error().kind, probe.error().message));
        return false;
    }
    if (probe->locked) {
        LOG_WARNING(COMPONENT, std::format("Skipping locked file {}{}{}", task.target_path.string(),
                                           probe->holder_hint.empty() ? "" : " held by ",
                                           probe->holder_hint));
        skipped.push_back(skip(task, ErrorKind::TARGET_LOCKED,
                               probe->holder_hint.empty() ? "locked by another process"
                                                          : "locked by " + probe->holder_hint));
        return false;
    }
    return true;
}

auto ShredService::make_file_job(const StatePtr& state, std::shared_ptr<ShredTask> task,
                                 std::function<void()> after) -> engine::PoolJob {
    engine::PoolJob job;
    job.task_id = task->id;
    job.request_id = state->id;
    job.target = task->target_path;
    job.kind = task->kind;
    job.passes_planned = static_cast<int>(task->passes.size());

    const uint64_t planned = planned_bytes_of(*task);
    job.run = [this, state, task] {
        engine::FileShredder shredder(guard_, *locks_, &verifier_);
        auto on_progress = [this, &state](const TaskProgress& progress) {
            state->progress.record_bytes(progress.bytes_delta);
            publish_progress(state, progress.pass_finished);
        };
        return std::vector<OperationResult>{shredder.execute(*task, state->cancel, on_progress)};
    };
    job.on_result = [this, state, planned, after = std::move(after)](const OperationResult& result) {
        finish_task(state, result, planned);
        if (after) {
            after();
        }
    };
    return job;
}

auto ShredService::make_directory_job(const StatePtr& state, std::shared_ptr<DirectoryGroup> group)
    -> engine::PoolJob {
    engine::PoolJob job;
    const auto& root_task = group->manifest->directories.back();
    job.task_id = root_task.id;
    job.request_id = state->id;
    job.target = group->manifest->root;
    job.kind = TaskKind::DIRECTORY;
    job.run = [this, state, group] {
        engine::FileShredder files(guard_, *locks_, &verifier_);
        engine::DirectoryShredder directories(guard_, files);
        return directories.destroy_directories(*group->manifest, state->cancel);
    };
    job.on_result = [this, state](const OperationResult& result) {
        finish_task(state, result, 0);
    };
    return job;
}

auto ShredService::wipe_free_space(const fs::path& volume_root, const ShredOptions& options)
    -> std::expected<RequestId, util::Error> {
    auto passes = patterns::PatternSource::resolve(options.pattern);
    if (!passes) {
        LOG_ERROR(COMPONENT, std::format("Free-space request rejected: {}", passes.error().message));
        return std::unexpected(passes.error());
    }

    const engine::PassScheduler scheduler(config_.scheduler, 1);
    auto state = create_request(1);
    LOG_INFO(COMPONENT, std::format("Request {}: free-space wipe of {}, {} passes", state->id,
                                    volume_root.string(), passes->size()));

    std::vector<OperationResult> skipped;
    std::vector<engine::PoolJob> jobs;
    const int pass_count = static_cast<int>(passes->size());

    auto planned = scheduler.plan_free_space(volume_root, *passes, options.chunk_size_hint);
    if (!planned) {
        skipped.push_back(rejected(state->id, volume_root, pass_count, planned.error()));
    } else if (auto verdict = guard_.check_volume(planned->target_path); !verdict) {
        planned->request_id = state->id;
        skipped.push_back(skip(*planned, ErrorKind::PATH_DENIED, verdict.reason));
    } else {
        auto task = std::make_shared<ShredTask>(std::move(*planned));
        task->request_id = state->id;
        task->verify = options.verify;

        engine::FreeSpaceWiper estimator(guard_, *probe_, config_.free_space, nullptr);
        const auto budget = estimator.fill_budget(task->target_path);
        const uint64_t planned_bytes = budget ? *budget * passes->size() : 0;
        state->progress.add_planned(planned_bytes);

        engine::PoolJob job;
        job.task_id = task->id;
        job.request_id = state->id;
        job.target = task->target_path;
        job.kind = TaskKind::FREE_SPACE_SEGMENT;
        job.passes_planned = pass_count;
        job.run = [this, state, task] {
            engine::FreeSpaceWiper wiper(guard_, *probe_, config_.free_space, &verifier_);
            auto on_progress = [this, &state](const TaskProgress& progress) {
                state->progress.record_bytes(progress.bytes_delta);
                publish_progress(state, progress.pass_finished);
            };
            return std::vector<OperationResult>{wiper.wipe(*task, state->cancel, on_progress)};
        };
        job.on_result = [this, state, planned_bytes](const OperationResult& result) {
            finish_task(state, result, planned_bytes);
        };
        jobs.push_back(std::move(job));
    }

    launch(state, std::move(skipped), std::move(jobs));
    return state->id;
}

void ShredService::launch(const StatePtr& state, std::vector<OperationResult> skipped,
                          std::vector<engine::PoolJob> jobs) {
    // Jobs were counted while planning; skipped targets are counted here
    state->progress.add_planned(0, skipped.size());

    const auto snapshot = state->progress.snapshot();
    {
        std::lock_guard lock(state->mutex);
        state->remaining = snapshot.tasks_total;
        state->channel->publish(snapshot);
        state->last_snapshot = std::chrono::steady_clock::now();
        if (state->remaining == 0) {
            state->channel->close();
            LOG_INFO(COMPONENT, std::format("Request {} has nothing to do", state->id));
            return;
        }
    }

    for (const auto& result : skipped) {
        finish_task(state, result, 0);
    }
    for (auto& job : jobs) {
        if (!state->pool->submit(std::move(job))) {
            LOG_ERROR(COMPONENT, std::format("Request {}: pool refused a job", state->id));
        }
    }
}

void ShredService::finish_task(const StatePtr& state, const OperationResult& result,
                               uint64_t planned_bytes) {
    {
        std::lock_guard lock(audit_mutex_);
        audit_->append(AuditRecord::from(result));
    }

    const uint64_t unwritten = planned_bytes - std::min(planned_bytes, result.bytes_overwritten);

    std::lock_guard lock(state->mutex);
    state->progress.record_task_done(unwritten);
    state->channel->publish(result);
    state->channel->publish(state->progress.snapshot());
    state->last_snapshot = std::chrono::steady_clock::now();

    if (state->remaining > 0 && --state->remaining == 0) {
        state->channel->close();
        LOG_INFO(COMPONENT, std::format("Request {} finished", state->id));
    }
}

void ShredService::publish_progress(const StatePtr& state, bool force) {
    std::lock_guard lock(state->mutex);
    const auto now = std::chrono::steady_clock::now();
    if (!force && now - state->last_snapshot < SNAPSHOT_INTERVAL) {
        return;
    }
    state->channel->publish(state->progress.snapshot());
    state->last_snapshot = now;
}

void ShredService::reap_finished() {
    std::vector<std::unique_ptr<engine::WorkerPool>> finished;
    {
        std::lock_guard lock(requests_mutex_);
        size_t closed = 0;
        for (auto& [id, state] : requests_) {
            if (!state->channel->is_closed()) {
                continue;
            }
            ++closed;
            if (state->pool) {
                finished.push_back(std::move(state->pool));
            }
        }
        // Ids grow monotonically, so map order drops the oldest first
        auto it = requests_.begin();
        while (closed > config_.retained_requests && it != requests_.end()) {
            if (it->second->channel->is_closed()) {
                LOG_DEBUG(COMPONENT, std::format("Dropping finished request {}", it->first));
                it = requests_.erase(it);
                --closed;
            } else {
                ++it;
            }
        }
    }
    // Joined outside the lock; the destructor drains and joins
    finished.clear();
}

auto ShredService::release(RequestId request) -> bool {
    std::unique_ptr<engine::WorkerPool> pool;
    {
        std::lock_guard lock(requests_mutex_);
        auto it = requests_.find(request);
        if (it == requests_.end() || !it->second->channel->is_closed()) {
            return false;
        }
        pool = std::move(it->second->pool);
        requests_.erase(it);
    }
    LOG_DEBUG(COMPONENT, std::format("Released request {}", request));
    return true;
}

auto ShredService::request_count() const -> size_t {
    std::lock_guard lock(requests_mutex_);
    return requests_.size();
}

auto ShredService::find(RequestId request) const -> StatePtr {
    std::lock_guard lock(requests_mutex_);
    auto it = requests_.find(request);
    return it != requests_.end() ? it->second : nullptr;
}

auto ShredService::subscribe(RequestId request) -> std::optional<EventStream> {
    auto state = find(request);
    if (!state) {
        return std::nullopt;
    }
    return EventStream(state->channel);
}

auto ShredService::cancel(RequestId request) -> bool {
    auto state = find(request);
    if (!state || state->channel->is_closed()) {
        return false;
    }
    LOG_INFO(COMPONENT, std::format("Cancelling request {}", request));
    state->cancel.cancel();
    return true;
}

auto ShredService::wait(RequestId request) -> bool {
    auto state = find(request);
    if (!state) {
        return false;
    }
    state->channel->wait_closed();
    return true;
}
