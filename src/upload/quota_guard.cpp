#include "chunkyard/upload/quota_guard.h"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include "chunkyard/core/logger.h"

namespace chunkyard::upload {

std::uint64_t DirectorySize(const std::filesystem::path& root) {
    std::uint64_t total = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return 0;
    }
    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += static_cast<std::uint64_t>(size);
            }
        }
        it.increment(ec);
        if (ec) {
            // A sibling upload was reaped or assembled underneath us; keep what we have.
            core::LogDebug("directory walk interrupted under " + root.string() + ": " +
                           ec.message());
            break;
        }
    }
    return total;
}

QuotaGuard::QuotaGuard(std::filesystem::path staging_root, QuotaLimits limits,
                       AdmissionPredicate allow_upload)
    : staging_root_(std::move(staging_root)),
      limits_(limits),
      allow_upload_(std::move(allow_upload)) {}

core::Result<void> QuotaGuard::Admit(const ChunkSubmission& submission) const {
    const auto declared = submission.info.upload_size;
    const auto actual = static_cast<std::uint64_t>(submission.payload.size());

    if (!IsAllowed(submission)) {
        return core::Error{core::ErrorCode::kForbidden, "File not allowed"};
    }

    if (declared > limits_.max_upload_bytes) {
        return core::Error{core::ErrorCode::kFileTooLarge, "File size exceeded"};
    }

    if (DirectorySize(staging_root_) + std::max(declared, actual) > limits_.max_directory_bytes) {
        return core::Error{core::ErrorCode::kQuotaExceeded, "Directory size exceeded"};
    }

    if (DirectorySize(staging_root_) + declared > limits_.max_upload_bytes) {
        return core::Error{core::ErrorCode::kUploadTooLarge, "Upload size exceeded"};
    }
    return core::Ok();
}

bool QuotaGuard::IsAllowed(const ChunkSubmission& submission) const {
    if (!allow_upload_) {
        return true;
    }
    try {
        return allow_upload_(submission);
    } catch (const std::exception& ex) {
        core::LogError("admission predicate failed for upload " + submission.info.upload_id +
                       ": " + ex.what());
        return false;
    }
}

}  // namespace chunkyard::upload
