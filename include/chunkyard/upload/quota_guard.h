#pragma once

#include <cstdint>
#include <filesystem>

#include "chunkyard/core/result.h"
#include "chunkyard/upload/upload_types.h"

namespace chunkyard::upload {

struct QuotaLimits {
    std::uint64_t max_upload_bytes{0};
    std::uint64_t max_directory_bytes{0};
};

/// @brief Sum of regular file sizes below root, recursively. Entries that disappear while
/// walking are skipped, so the value is a snapshot rather than an exact figure.
std::uint64_t DirectorySize(const std::filesystem::path& root);

/// @brief Admission control for chunk submissions.
///
/// Checks run in a fixed order and the first failure wins:
///   1. admission predicate            -> kForbidden      "File not allowed"
///   2. declared size > upload limit   -> kFileTooLarge   "File size exceeded"
///   3. staged + max(declared, actual)
///      > directory limit              -> kQuotaExceeded  "Directory size exceeded"
///   4. staged + declared > upload
///      limit (recomputed)             -> kUploadTooLarge "Upload size exceeded"
/// The caller removes the upload's staging area on kUploadTooLarge only.
class QuotaGuard {
public:
    QuotaGuard(std::filesystem::path staging_root, QuotaLimits limits,
               AdmissionPredicate allow_upload = {});

    core::Result<void> Admit(const ChunkSubmission& submission) const;

    const QuotaLimits& limits() const { return limits_; }

private:
    bool IsAllowed(const ChunkSubmission& submission) const;

    std::filesystem::path staging_root_;
    QuotaLimits limits_;
    AdmissionPredicate allow_upload_;
};

}  // namespace chunkyard::upload
