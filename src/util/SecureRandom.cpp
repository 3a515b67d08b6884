/**
 * @file SecureRandom.cpp
 * @brief OpenSSL-backed random generation
 */

#include "util/SecureRandom.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <climits>
#include <cstring>
#include <format>

namespace util {

namespace {

constexpr std::string_view NAME_ALPHABET = "abcdefghijklmnopqrstuvwxyz0123456789";

auto openssl_error() -> std::string {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> text{};
    ERR_error_string_n(code, text.data(), text.size());
    return text.data();
}

}  // namespace

auto SecureRandom::fill(std::span<uint8_t> buffer) -> std::expected<void, Error> {
    size_t offset = 0;
    while (offset < buffer.size()) {
        const auto count = static_cast<int>(std::min<size_t>(buffer.size() - offset, INT_MAX));
        if (RAND_bytes(buffer.data() + offset, count) != 1) {
            return fail(ErrorKind::IO_ERROR, std::format("RAND_bytes failed: {}", openssl_error()));
        }
        offset += static_cast<size_t>(count);
    }
    return {};
}

auto SecureRandom::uniform(uint64_t bound) -> std::expected<uint64_t, Error> {
    if (bound == 0) {
        return 0;
    }
    // Rejection sampling keeps the distribution unbiased
    const uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
    while (true) {
        uint64_t value = 0;
        std::array<uint8_t, sizeof(uint64_t)> raw{};
        if (auto filled = fill(raw); !filled) {
            return std::unexpected(filled.error());
        }
        std::memcpy(&value, raw.data(), raw.size());
        if (value < limit) {
            return value % bound;
        }
    }
}

auto SecureRandom::name(size_t length) -> std::expected<std::string, Error> {
    std::string result;
    result.reserve(length);

    // 252 is the largest multiple of 36 below 256
    constexpr uint8_t ACCEPT_BELOW = 252;
    std::array<uint8_t, 64> raw{};
    while (result.size() < length) {
        if (auto filled = fill(raw); !filled) {
            return std::unexpected(filled.error());
        }
        for (uint8_t byte : raw) {
            if (byte < ACCEPT_BELOW && result.size() < length) {
                result.push_back(NAME_ALPHABET[byte % NAME_ALPHABET.size()]);
            }
        }
    }
    return result;
}

}  // namespace util
