#pragma once

/// @file error.h
/// @brief kpiwatch error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace kpiwatch {

/// @brief Error codes used across the engine
///
/// Domain codes are carried on the absl::Status as a payload so callers can
/// tell a MissingWeight from a MissingBaseline even though both map to
/// absl::StatusCode::kFailedPrecondition.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kFailedPrecondition,
    kInternal,
    kUnavailable,

    // Engine-specific error codes
    kInvalidEntity,
    kMissingWeight,
    kMissingBaseline,
    kMissingSample,
    kAggregationFailure,
    kConfigurationError,
};

/// @brief Payload URL under which the domain code is stored
inline constexpr std::string_view kErrorCodePayload = "kpiwatch.dev/error-code";

/// @brief Convert an engine error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable name of an error code ("InvalidEntity", "MissingWeight", ...)
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the engine error code from a status
///
/// Statuses created without MakeError fall back to the absl code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief True if the status carries the given engine error code
inline bool HasErrorCode(const absl::Status& status, ErrorCode code) {
    return GetErrorCode(status) == code;
}

inline absl::Status InvalidEntityError(std::string_view entity_id) {
    return MakeError(ErrorCode::kInvalidEntity,
                     absl::StrCat("Unregistered entity: ", absl::string_view(entity_id.data(), entity_id.size())));
}

inline absl::Status MissingWeightError(std::string_view entity_id,
                                       std::string_view metric) {
    return MakeError(ErrorCode::kMissingWeight,
                     absl::StrCat("No weight configured for ", absl::string_view(entity_id.data(), entity_id.size()), "/", absl::string_view(metric.data(), metric.size())));
}

inline absl::Status MissingBaselineError(std::string_view entity_id,
                                         std::string_view metric) {
    return MakeError(ErrorCode::kMissingBaseline,
                     absl::StrCat("No baseline established for ", absl::string_view(entity_id.data(), entity_id.size()), "/", absl::string_view(metric.data(), metric.size())));
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define KPIWATCH_RETURN_IF_ERROR(expr)                                         \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define KPIWATCH_ASSIGN_OR_RETURN(lhs, rhs)                                    \
    KPIWATCH_ASSIGN_OR_RETURN_IMPL(                                            \
        KPIWATCH_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define KPIWATCH_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                     \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define KPIWATCH_CONCAT(a, b) KPIWATCH_CONCAT_IMPL(a, b)
#define KPIWATCH_CONCAT_IMPL(a, b) a##b

}  // namespace kpiwatch
