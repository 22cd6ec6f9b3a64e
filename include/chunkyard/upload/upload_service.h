#pragma once

#include <string>

#include "chunkyard/core/config.h"
#include "chunkyard/core/result.h"
#include "chunkyard/storage/chunk_store.h"
#include "chunkyard/upload/assembler.h"
#include "chunkyard/upload/completeness_checker.h"
#include "chunkyard/upload/quota_guard.h"
#include "chunkyard/upload/stale_upload_reaper.h"
#include "chunkyard/upload/upload_lock_table.h"
#include "chunkyard/upload/upload_types.h"

namespace chunkyard::upload {

/// @brief Evaluates chunk submissions end to end.
///
/// Each call to Submit is an independent evaluation:
///   validate -> reap stale entries -> duplicate-completion guard -> admission/quota
///   -> persist chunk -> (last part only) completeness check -> assemble.
/// Everything from the duplicate guard onwards runs under a per-upload lock, so a given
/// upload is assembled at most once even when its final part arrives twice concurrently.
/// Rejections raised after validation are recorded in the upload's error marker unless the
/// staging area was just removed or the upload already finished.
class UploadService {
public:
    explicit UploadService(const core::UploadConfig& config, UploadHooks hooks = {});

    UploadOutcome Submit(const ChunkSubmission& submission);
    core::Result<UploadStatus> Status(const std::string& upload_id) const;

    /// @brief Structural checks that need no storage access.
    static core::Result<void> Validate(const ChunkSubmission& submission);

    const storage::ChunkStore& store() const { return store_; }

private:
    UploadOutcome Reject(const std::string& upload_id, const core::Error& error,
                         bool record_marker) const;
    void NotifyFinished(const std::string& upload_id, int parts) const;

    core::UploadConfig config_;
    UploadHooks hooks_;
    storage::ChunkStore store_;
    StaleUploadReaper reaper_;
    QuotaGuard quota_;
    CompletenessChecker checker_;
    Assembler assembler_;
    UploadLockTable locks_;
};

}  // namespace chunkyard::upload
