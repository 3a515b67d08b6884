/**
 * @file Cancellation.hpp
 * @brief Cooperative cancellation flags polled between chunks and passes
 */

#pragma once

#include <atomic>
#include <memory>

namespace engine {

/**
 * @class CancellationToken
 * @brief Observes a per-request flag and the process-wide flag
 *
 * Copies share the same request flag. Workers poll is_cancelled() at chunk
 * and pass boundaries only, so a cancelled task never stops mid-write.
 */
class CancellationToken {
public:
    CancellationToken() : request_flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] auto is_cancelled() const -> bool {
        return request_flag_->load(std::memory_order_acquire) ||
               global_flag().load(std::memory_order_acquire);
    }

    void cancel() const { request_flag_->store(true, std::memory_order_release); }

    /**
     * @brief Cancel every request in the process (e.g. on SIGTERM)
     */
    static void cancel_all() { global_flag().store(true, std::memory_order_release); }

    static void reset_all() { global_flag().store(false, std::memory_order_release); }

private:
    static auto global_flag() -> std::atomic<bool>& {
        static std::atomic<bool> flag{false};
        return flag;
    }

    std::shared_ptr<std::atomic<bool>> request_flag_;
};

}  // namespace engine
