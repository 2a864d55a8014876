#pragma once

/// @file error.h
/// @brief tracekeep error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace tracekeep {

/// @brief Error codes used across tracekeep
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,
    kUnimplemented,

    // tracekeep-specific error codes
    kValidationError,
};

/// @brief Convert tracekeep error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Validate that a sampling rate lies within [0, 1]
/// @param name Parameter name used in the error message
absl::Status ValidateRate(std::string_view name, double rate);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define TRACEKEEP_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define TRACEKEEP_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    TRACEKEEP_ASSIGN_OR_RETURN_IMPL(                                           \
        TRACEKEEP_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define TRACEKEEP_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define TRACEKEEP_CONCAT(a, b) TRACEKEEP_CONCAT_IMPL(a, b)
#define TRACEKEEP_CONCAT_IMPL(a, b) a##b

}  // namespace tracekeep
