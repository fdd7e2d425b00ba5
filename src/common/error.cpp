#include "error.h"

#include <absl/strings/cord.h>

namespace kpiwatch {

namespace {

constexpr ErrorCode kTaggedCodes[] = {
    ErrorCode::kInvalidEntity,
    ErrorCode::kMissingWeight,
    ErrorCode::kMissingBaseline,
    ErrorCode::kMissingSample,
    ErrorCode::kAggregationFailure,
    ErrorCode::kConfigurationError,
};

ErrorCode FromAbslCode(absl::StatusCode code) {
    switch (code) {
        case absl::StatusCode::kOk:
            return ErrorCode::kOk;
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kAlreadyExists:
            return ErrorCode::kAlreadyExists;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kUnavailable:
            return ErrorCode::kUnavailable;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kInvalidEntity:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kAlreadyExists:
            return absl::StatusCode::kAlreadyExists;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kMissingWeight:
        case ErrorCode::kMissingBaseline:
        case ErrorCode::kMissingSample:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kAggregationFailure:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "Ok";
        case ErrorCode::kInvalidArgument: return "InvalidArgument";
        case ErrorCode::kNotFound: return "NotFound";
        case ErrorCode::kAlreadyExists: return "AlreadyExists";
        case ErrorCode::kFailedPrecondition: return "FailedPrecondition";
        case ErrorCode::kInternal: return "Internal";
        case ErrorCode::kUnavailable: return "Unavailable";
        case ErrorCode::kInvalidEntity: return "InvalidEntity";
        case ErrorCode::kMissingWeight: return "MissingWeight";
        case ErrorCode::kMissingBaseline: return "MissingBaseline";
        case ErrorCode::kMissingSample: return "MissingSample";
        case ErrorCode::kAggregationFailure: return "AggregationFailure";
        case ErrorCode::kConfigurationError: return "ConfigurationError";
        case ErrorCode::kUnknown:
        default:
            return "Unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(absl::string_view(kErrorCodePayload.data(), kErrorCodePayload.size()),
                          absl::Cord(std::string(ErrorCodeName(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    auto payload = status.GetPayload(
        absl::string_view(kErrorCodePayload.data(), kErrorCodePayload.size()));
    if (payload.has_value()) {
        const std::string name(*payload);
        for (ErrorCode code : kTaggedCodes) {
            if (ErrorCodeName(code) == name) {
                return code;
            }
        }
    }
    return FromAbslCode(status.code());
}

}  // namespace kpiwatch
