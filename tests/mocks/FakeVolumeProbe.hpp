/**
 * @file FakeVolumeProbe.hpp
 * @brief In-memory volume whose free space shrinks as files appear in a directory
 */

#pragma once

#include "engine/FreeSpaceWiper.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <limits>
#include <mutex>

/**
 * @brief Capacity minus the bytes of every file under the watched directory
 *
 * Lets free-space tests run against a small simulated volume inside a temp
 * directory. consume() simulates another process taking space.
 */
class FakeVolumeProbe : public engine::IVolumeProbe {
public:
    FakeVolumeProbe(std::filesystem::path watched, uint64_t capacity)
        : watched_(std::move(watched)), capacity_(capacity) {}

    auto available_bytes(const std::filesystem::path& /*path*/)
        -> std::expected<uint64_t, util::Error> override {
        std::lock_guard lock(mutex_);
        ++probes_;
        if (consume_after_ > 0 && probes_ >= consume_after_) {
            external_ = consume_bytes_;
        }
        const uint64_t used = used_bytes() + external_;
        const uint64_t available = used >= capacity_ ? 0 : capacity_ - used;
        min_available_ = std::min(min_available_, available);
        return available;
    }

    // Simulate outside consumption of @p bytes once @p after_probes probes happened
    void consume(uint64_t bytes, uint64_t after_probes) {
        std::lock_guard lock(mutex_);
        consume_bytes_ = bytes;
        consume_after_ = after_probes;
    }

    uint64_t min_available() const {
        std::lock_guard lock(mutex_);
        return min_available_;
    }

private:
    uint64_t used_bytes() const {
        uint64_t used = 0;
        std::error_code ec;
        for (std::filesystem::recursive_directory_iterator it(watched_, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                used += it->file_size(ec);
            }
        }
        return used;
    }

    mutable std::mutex mutex_;
    std::filesystem::path watched_;
    uint64_t capacity_;
    uint64_t external_ = 0;
    uint64_t consume_bytes_ = 0;
    uint64_t consume_after_ = 0;
    uint64_t probes_ = 0;
    uint64_t min_available_ = std::numeric_limits<uint64_t>::max();
};
