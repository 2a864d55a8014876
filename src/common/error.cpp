#include "error.h"

#include <cmath>

namespace tracekeep {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

absl::Status ValidateRate(std::string_view name, double rate) {
    // NaN fails both comparisons, so check it explicitly
    if (std::isnan(rate) || rate < 0.0 || rate > 1.0) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat(absl::string_view(name.data(), name.size()), " must be between 0 and 1, got ", rate));
    }
    return absl::OkStatus();
}

}  // namespace tracekeep
