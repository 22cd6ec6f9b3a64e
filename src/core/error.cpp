#include "chunkyard/core/error.h"

namespace chunkyard::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case ErrorCode::kForbidden:
            return "FORBIDDEN";
        case ErrorCode::kFileTooLarge:
            return "FILE_TOO_LARGE";
        case ErrorCode::kQuotaExceeded:
            return "QUOTA_EXCEEDED";
        case ErrorCode::kUploadTooLarge:
            return "UPLOAD_TOO_LARGE";
        case ErrorCode::kIncomplete:
            return "INCOMPLETE";
        case ErrorCode::kConflict:
            return "CONFLICT";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace chunkyard::core
