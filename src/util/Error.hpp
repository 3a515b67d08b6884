/**
 * @file Error.hpp
 * @brief Error value carried by std::expected across the engine
 */

#pragma once

#include "models/ErrorKind.hpp"

#include <cerrno>
#include <cstring>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message, an engine error kind and the errno it came from
 */
struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::IO_ERROR;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorKind error_kind, std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code), kind(error_kind) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

/**
 * @brief Build an unexpected Error of the given kind
 */
[[nodiscard]] inline auto fail(ErrorKind kind, std::string message, int code = 0)
    -> std::unexpected<Error> {
    return std::unexpected(Error{kind, std::move(message), code});
}

/**
 * @brief Build an unexpected Error from the current errno
 * @param kind Error kind to report
 * @param context What was being attempted, e.g. "open /tmp/x"
 */
[[nodiscard]] inline auto fail_errno(ErrorKind kind, std::string_view context)
    -> std::unexpected<Error> {
    const int err = errno;
    return std::unexpected(Error{kind, std::format("{}: {}", context, std::strerror(err)), err});
}

}  // namespace util
