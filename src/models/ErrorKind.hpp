/**
 * @file ErrorKind.hpp
 * @brief Error categories reported by the erasure engine
 */

#pragma once

#include <string_view>

/**
 * @enum ErrorKind
 * @brief Why a request, task or planning step did not complete
 */
enum class ErrorKind {
    INVALID_PASS_COUNT,   ///< Pass count outside [1, 35]
    UNKNOWN_STANDARD,     ///< Unrecognized standard name
    INVALID_PATTERN,      ///< Empty custom byte sequence
    PATH_DENIED,          ///< Target is protected
    TARGET_LOCKED,        ///< Target held by another process
    TARGET_NOT_FOUND,     ///< Target vanished or never existed
    UNSUPPORTED_TARGET,   ///< Device node, or directory without recursion
    IO_ERROR,             ///< Read/write/sync/rename failure
    INSUFFICIENT_SPACE,   ///< Allocation failed or headroom crossed
    VERIFICATION_FAILED,  ///< Read-back did not match the final pass
    CANCELLED,            ///< Cooperative cancellation observed
    PARTIAL_DIRECTORY     ///< Directory left in place with content inside
};

[[nodiscard]] constexpr auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::INVALID_PASS_COUNT:
            return "InvalidPassCount";
        case ErrorKind::UNKNOWN_STANDARD:
            return "UnknownStandard";
        case ErrorKind::INVALID_PATTERN:
            return "InvalidPattern";
        case ErrorKind::PATH_DENIED:
            return "PathDenied";
        case ErrorKind::TARGET_LOCKED:
            return "TargetLocked";
        case ErrorKind::TARGET_NOT_FOUND:
            return "TargetNotFound";
        case ErrorKind::UNSUPPORTED_TARGET:
            return "UnsupportedTarget";
        case ErrorKind::IO_ERROR:
            return "IoError";
        case ErrorKind::INSUFFICIENT_SPACE:
            return "InsufficientSpace";
        case ErrorKind::VERIFICATION_FAILED:
            return "VerificationFailed";
        case ErrorKind::CANCELLED:
            return "Cancelled";
        case ErrorKind::PARTIAL_DIRECTORY:
            return "PartialDirectory";
    }
    return "Unknown";
}
