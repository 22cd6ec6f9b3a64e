#pragma once

#include <string>

namespace chunkyard::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kForbidden,
    kFileTooLarge,
    kQuotaExceeded,
    kUploadTooLarge,
    kIncomplete,
    kConflict,
    kIoError,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code, used in logs and error envelopes.
const char* ErrorCodeName(ErrorCode code);

}  // namespace chunkyard::core
