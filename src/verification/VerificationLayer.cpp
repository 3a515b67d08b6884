/**
 * @file VerificationLayer.cpp
 * @brief Implementation of post-overwrite verification
 */

#include "verification/VerificationLayer.hpp"

#include "patterns/PatternSource.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace verification {

namespace {

constexpr size_t READ_BUFFER_SIZE = 1'024 * 1'024;

auto sha256(const uint8_t* data, size_t size) -> std::expected<std::array<uint8_t, 32>, util::Error> {
    std::array<uint8_t, 32> digest{};
    unsigned int digest_length = 0;
    if (EVP_Digest(data, size, digest.data(), &digest_length, EVP_sha256(), nullptr) != 1 ||
        digest_length != digest.size()) {
        return util::fail(ErrorKind::IO_ERROR, "SHA-256 digest failed");
    }
    return digest;
}

/**
 * @brief Read each window in buffer-sized slices and hand them to @p visit
 * @return false on read error or short read
 */
template<typename Visitor>
auto read_windows(int fd, const std::vector<Window>& windows, Visitor&& visit)
    -> std::expected<void, util::Error> {
    std::vector<uint8_t> buffer(READ_BUFFER_SIZE);
    for (const auto& window : windows) {
        uint64_t done = 0;
        while (done < window.length) {
            const auto want = static_cast<size_t>(
                std::min<uint64_t>(buffer.size(), window.length - done));
            auto got = util::pread_full(fd, buffer.data(), want, window.offset + done);
            if (!got) {
                return std::unexpected(got.error());
            }
            if (*got != want) {
                return util::fail(ErrorKind::IO_ERROR,
                                  std::format("short read at offset {}", window.offset + done));
            }
            visit(window.offset + done, std::span<const uint8_t>(buffer.data(), want));
            done += want;
        }
    }
    return {};
}

}  // namespace

VerificationLayer::VerificationLayer(VerificationConfig config) : config_(std::move(config)) {
    config_.window_size = std::max<size_t>(config_.window_size, 1);
    config_.sample_density = std::clamp(config_.sample_density, 0.0, 1.0);
}

auto VerificationLayer::sample_windows(uint64_t length) const -> std::vector<Window> {
    if (length == 0) {
        return {};
    }

    const uint64_t window = config_.window_size;
    if (length <= config_.full_scan_threshold || length <= window * 2) {
        return {Window{0, length}};
    }

    const auto wanted_bytes =
        static_cast<uint64_t>(std::ceil(static_cast<double>(length) * config_.sample_density));
    const uint64_t count = std::max<uint64_t>(2, (wanted_bytes + window - 1) / window);
    if (count * window >= length) {
        return {Window{0, length}};
    }

    std::vector<Window> windows;
    windows.reserve(count);
    const uint64_t stride = (length - window) / (count - 1);
    for (uint64_t i = 0; i < count - 1; ++i) {
        windows.push_back(Window{i * stride, window});
    }
    windows.push_back(Window{length - window, window});
    return windows;
}

auto VerificationLayer::record_signature(int fd, uint64_t length) const
    -> std::expected<ContentSignature, util::Error> {
    ContentSignature signature;
    if (length == 0) {
        return signature;
    }

    const uint64_t window = std::min<uint64_t>(config_.window_size, length);
    const uint64_t available = (length + window - 1) / window;
    const uint64_t count = std::min<uint64_t>(available, MAX_SIGNATURE_WINDOWS);
    const uint64_t last_start = length - window;
    const uint64_t stride = count > 1 ? last_start / (count - 1) : 0;

    std::vector<uint8_t> buffer(window);
    for (uint64_t i = 0; i < count; ++i) {
        const uint64_t offset = (i + 1 == count) ? last_start : i * stride;
        auto got = util::pread_full(fd, buffer.data(), buffer.size(), offset);
        if (!got) {
            return std::unexpected(got.error());
        }
        auto digest = sha256(buffer.data(), *got);
        if (!digest) {
            return std::unexpected(digest.error());
        }
        signature.digests.push_back({Window{offset, *got}, *digest});
    }
    return signature;
}

auto VerificationLayer::entropy_bits(const ByteHistogram& histogram) -> double {
    const uint64_t total = std::accumulate(histogram.begin(), histogram.end(), uint64_t{0});
    if (total == 0) {
        return 0.0;
    }
    double entropy = 0.0;
    for (auto count : histogram) {
        if (count == 0) {
            continue;
        }
        const double p = static_cast<double>(count) / static_cast<double>(total);
        entropy -= p * std::log2(p);
    }
    return entropy;
}

auto VerificationLayer::assess_randomness(const ByteHistogram& histogram) -> VerificationOutcome {
    VerificationOutcome outcome;
    const uint64_t total = std::accumulate(histogram.begin(), histogram.end(), uint64_t{0});
    outcome.bytes_checked = total;

    if (total < MIN_STATISTICAL_SAMPLE) {
        outcome.passed = true;
        outcome.detail = "sample too small for statistics";
        return outcome;
    }

    const uint64_t max_count = *std::max_element(histogram.begin(), histogram.end());
    if (max_count == total) {
        outcome.detail = "random pass left a single repeated byte value";
        outcome.mismatches = total;
        return outcome;
    }

    const double attainable = std::log2(static_cast<double>(std::min<uint64_t>(total, 256)));
    const double entropy = entropy_bits(histogram);
    if (entropy < MIN_ENTROPY_RATIO * attainable) {
        outcome.detail = std::format("entropy {:.3f} bits/byte below {:.3f}", entropy,
                                     MIN_ENTROPY_RATIO * attainable);
        return outcome;
    }

    if (total >= CHI_SQUARED_MIN_SAMPLE) {
        // Expected count for each byte value in a uniform distribution
        const double expected = static_cast<double>(total) / 256.0;
        double chi_squared = 0.0;
        for (auto count : histogram) {
            const double diff = static_cast<double>(count) - expected;
            chi_squared += (diff * diff) / expected;
        }
        if (chi_squared >= CHI_SQUARED_LIMIT) {
            outcome.detail = std::format("chi-squared {:.1f} exceeds {:.1f}", chi_squared,
                                         CHI_SQUARED_LIMIT);
            return outcome;
        }
    }

    outcome.passed = true;
    outcome.detail = std::format("entropy {:.3f} bits/byte", entropy);
    return outcome;
}

auto VerificationLayer::verify(const ShredTask& task, int fd, uint64_t length,
                               const ContentSignature* signature) const -> VerificationOutcome {
    VerificationOutcome outcome;
    if (task.passes.empty()) {
        outcome.detail = "task has no passes";
        return outcome;
    }
    if (length == 0) {
        outcome.passed = true;
        outcome.detail = "empty file";
        return outcome;
    }

    const auto& final_pass = task.passes.back();
    const auto windows = sample_windows(length);

    if (!final_pass.is_random()) {
        uint64_t first_mismatch = 0;
        auto read = read_windows(fd, windows, [&](uint64_t offset, std::span<const uint8_t> data) {
            for (size_t i = 0; i < data.size(); ++i) {
                if (data[i] != patterns::PatternSource::expected_byte(final_pass, offset + i)) {
                    if (outcome.mismatches == 0) {
                        first_mismatch = offset + i;
                    }
                    ++outcome.mismatches;
                }
            }
            outcome.bytes_checked += data.size();
        });
        if (!read) {
            outcome.detail = read.error().message;
            return outcome;
        }
        outcome.passed = outcome.mismatches == 0;
        outcome.detail = outcome.passed
                             ? std::format("{} bytes match '{}'", outcome.bytes_checked,
                                           final_pass.name)
                             : std::format("{} mismatching bytes, first at offset {}",
                                           outcome.mismatches, first_mismatch);
        LOG_DEBUG("VerificationLayer",
                  std::format("Task {}: {}", task.id, outcome.detail));
        return outcome;
    }

    ByteHistogram histogram{};
    auto read = read_windows(fd, windows, [&](uint64_t, std::span<const uint8_t> data) {
        for (auto byte : data) {
            ++histogram[byte];
        }
    });
    if (!read) {
        outcome.detail = read.error().message;
        return outcome;
    }

    outcome = assess_randomness(histogram);
    if (!outcome) {
        LOG_WARNING("VerificationLayer", std::format("Task {}: {}", task.id, outcome.detail));
        return outcome;
    }

    if (signature != nullptr) {
        std::vector<uint8_t> buffer;
        for (const auto& recorded : signature->digests) {
            if (recorded.window.offset + recorded.window.length > length) {
                continue;
            }
            buffer.resize(recorded.window.length);
            auto got = util::pread_full(fd, buffer.data(), buffer.size(), recorded.window.offset);
            if (!got || *got != buffer.size()) {
                outcome.passed = false;
                outcome.detail = "read error while checking content signature";
                return outcome;
            }
            auto digest = sha256(buffer.data(), buffer.size());
            if (!digest) {
                outcome.passed = false;
                outcome.detail = digest.error().message;
                return outcome;
            }
            if (*digest == recorded.sha256) {
                outcome.passed = false;
                ++outcome.mismatches;
                outcome.detail = std::format("original content still present at offset {}",
                                             recorded.window.offset);
                LOG_ERROR("VerificationLayer", std::format("Task {}: {}", task.id, outcome.detail));
                return outcome;
            }
        }
    }

    LOG_DEBUG("VerificationLayer", std::format("Task {}: {}", task.id, outcome.detail));
    return outcome;
}

auto VerificationLayer::confirm_removed(const std::filesystem::path& original,
                                        const std::filesystem::path& renamed) -> bool {
    std::error_code ec;
    const bool original_exists = std::filesystem::exists(std::filesystem::symlink_status(original, ec));
    const bool renamed_exists =
        !renamed.empty() && std::filesystem::exists(std::filesystem::symlink_status(renamed, ec));
    return !original_exists && !renamed_exists;
}

}  // namespace verification
