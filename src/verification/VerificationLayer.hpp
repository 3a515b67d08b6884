/**
 * @file VerificationLayer.hpp
 * @brief Read-back confirmation that an overwrite left no recoverable signal
 */

#pragma once

#include "models/EngineConfig.hpp"
#include "models/ShredTypes.hpp"
#include "util/Error.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace verification {

/**
 * @struct VerificationOutcome
 * @brief Result of reading back a shredded file
 */
struct VerificationOutcome {
    bool passed = false;
    uint64_t bytes_checked = 0;
    uint64_t mismatches = 0;
    std::string detail;

    explicit operator bool() const { return passed; }
};

/**
 * @struct Window
 * @brief A byte range read back during verification
 */
struct Window {
    uint64_t offset = 0;
    uint64_t length = 0;

    auto operator==(const Window&) const -> bool = default;
};

/**
 * @struct ContentSignature
 * @brief SHA-256 digests of sampled windows taken before pass 1
 *
 * Only recorded when VerificationConfig::record_signatures is set; used to
 * prove a random final pass did not leave original bytes behind.
 */
struct ContentSignature {
    struct Digest {
        Window window;
        std::array<uint8_t, 32> sha256{};
    };
    std::vector<Digest> digests;
};

using ByteHistogram = std::array<uint64_t, 256>;

/**
 * @class VerificationLayer
 * @brief Samples a file after its final pass and checks it against that pass
 *
 * Files up to full_scan_threshold are read completely. Larger files are
 * sampled in evenly spaced windows at sample_density, always including the
 * first and last window.
 *
 * Constant and sequence passes must match byte for byte. Random passes
 * are accepted when the sampled bytes
 *  - are not a single repeated value,
 *  - reach 80% of the Shannon entropy attainable for the sample size,
 *  - score below 400 on a 255-degree chi-squared test (samples >= 64 KiB),
 *  - contain none of the recorded pre-overwrite window digests.
 * Samples under 16 bytes are only checked against the signature.
 */
class VerificationLayer {
public:
    static constexpr uint64_t MIN_STATISTICAL_SAMPLE = 16;
    static constexpr uint64_t CHI_SQUARED_MIN_SAMPLE = 64 * 1'024;
    static constexpr double CHI_SQUARED_LIMIT = 400.0;
    static constexpr double MIN_ENTROPY_RATIO = 0.8;
    static constexpr size_t MAX_SIGNATURE_WINDOWS = 64;

    explicit VerificationLayer(VerificationConfig config = {});

    [[nodiscard]] auto config() const -> const VerificationConfig& { return config_; }

    /**
     * @brief Ranges read back for a file of @p length bytes
     */
    [[nodiscard]] auto sample_windows(uint64_t length) const -> std::vector<Window>;

    /**
     * @brief Hash sampled windows of the current content
     *
     * Must run before the task enters RUNNING; it is the only read of
     * original content the engine ever performs.
     */
    [[nodiscard]] auto record_signature(int fd, uint64_t length) const
        -> std::expected<ContentSignature, util::Error>;

    /**
     * @brief Check the content of @p fd against the last pass of @p task
     * @param task Task whose final pass is expected
     * @param fd Descriptor open for reading
     * @param length Current file length
     * @param signature Pre-overwrite digests, or nullptr
     */
    [[nodiscard]] auto verify(const ShredTask& task, int fd, uint64_t length,
                              const ContentSignature* signature = nullptr) const
        -> VerificationOutcome;

    /**
     * @brief Apply the random-pass statistical policy to a histogram
     */
    [[nodiscard]] static auto assess_randomness(const ByteHistogram& histogram)
        -> VerificationOutcome;

    /**
     * @brief Shannon entropy in bits per byte
     */
    [[nodiscard]] static auto entropy_bits(const ByteHistogram& histogram) -> double;

    /**
     * @brief True if neither the original nor the temporary name exists any more
     */
    [[nodiscard]] static auto confirm_removed(const std::filesystem::path& original,
                                              const std::filesystem::path& renamed) -> bool;

private:
    VerificationConfig config_;
};

}  // namespace verification
