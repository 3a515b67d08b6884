/**
 * @file SecureRandom.hpp
 * @brief Cryptographically secure random bytes backed by OpenSSL
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace util {

/**
 * @class SecureRandom
 * @brief CSPRNG access for random passes, random names and random timestamps
 *
 * Every call draws from OpenSSL's DRBG (RAND_bytes). A failure to obtain
 * entropy is reported as an error, never replaced by a weaker generator.
 */
class SecureRandom {
public:
    /**
     * @brief Fill @p buffer with random bytes
     */
    [[nodiscard]] static auto fill(std::span<uint8_t> buffer) -> std::expected<void, Error>;

    /**
     * @brief Draw one uniformly distributed value in [0, bound)
     */
    [[nodiscard]] static auto uniform(uint64_t bound) -> std::expected<uint64_t, Error>;

    /**
     * @brief Random lowercase alphanumeric name carrying no information about the original
     */
    [[nodiscard]] static auto name(size_t length = 16) -> std::expected<std::string, Error>;
};

}  // namespace util
