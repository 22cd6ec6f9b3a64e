#include "chunkyard/upload/upload_service.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <set>
#include <system_error>
#include <utility>

#include "chunkyard/core/logger.h"
#include "chunkyard/core/time.h"
#include "chunkyard/observability/metrics.h"

namespace chunkyard::upload {

namespace {

std::string JoinTotals(const std::vector<int>& totals) {
    std::string out;
    for (const auto total : totals) {
        if (!out.empty()) {
            out += ",";
        }
        out += std::to_string(total);
    }
    return out;
}

}  // namespace

UploadService::UploadService(const core::UploadConfig& config, UploadHooks hooks)
    : config_(config),
      hooks_(std::move(hooks)),
      store_(config.staging_root),
      reaper_(config.staging_root, std::chrono::seconds(config.max_upload_age_seconds)),
      quota_(config.staging_root,
             QuotaLimits{config.max_upload_bytes, config.max_directory_bytes},
             hooks_.allow_upload),
      checker_(store_),
      assembler_(store_) {}

core::Result<void> UploadService::Validate(const ChunkSubmission& submission) {
    const auto& info = submission.info;
    if (!storage::ChunkStore::IsValidUploadId(info.upload_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "uploadId must be a UUID"};
    }
    if (info.upload_size < 1) {
        return core::Error{core::ErrorCode::kInvalidArgument, "uploadSize must be positive"};
    }
    if (info.total < 1 || info.part < 1 || info.part > info.total) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "part must be within 1..total"};
    }
    if (!submission.has_payload) {
        return core::Error{core::ErrorCode::kInvalidArgument, "file payload is missing"};
    }
    return core::Ok();
}

UploadOutcome UploadService::Submit(const ChunkSubmission& submission) {
    auto valid = Validate(submission);
    if (!valid.ok()) {
        core::LogDebug("invalid chunk submission: " + valid.error().message);
        observability::RecordUploadRejected();
        return UploadOutcome::Rejected(
            core::Error{core::ErrorCode::kInvalidArgument, "Invalid request"});
    }

    const auto& info = submission.info;
    auto root = store_.EnsureRoot();
    if (!root.ok()) {
        core::LogError(root.error().message);
        observability::RecordUploadRejected();
        return UploadOutcome::Rejected(root.error());
    }

    const auto reaped = reaper_.Reap();
    observability::RecordReaped(reaped.removed);

    auto guard = locks_.Acquire(info.upload_id);

    if (store_.HasFinalArtifact(info.upload_id)) {
        return Reject(info.upload_id,
                      core::Error{core::ErrorCode::kAlreadyExists, "Upload already exists"},
                      false);
    }

    auto admitted = quota_.Admit(submission);
    if (!admitted.ok()) {
        if (admitted.error().code == core::ErrorCode::kUploadTooLarge) {
            auto removed = store_.RemoveStaging(info.upload_id);
            if (!removed.ok()) {
                core::LogError(removed.error().message);
            }
            return Reject(info.upload_id, admitted.error(), false);
        }
        return Reject(info.upload_id, admitted.error(), true);
    }

    auto stored = store_.Put(info.upload_id, info.part, info.total, submission.payload);
    if (!stored.ok()) {
        return Reject(info.upload_id, stored.error(), true);
    }
    observability::RecordChunk(stored.value());
    if (!stored.value()) {
        core::LogDebug("chunk " + storage::ChunkStore::ChunkFileName(info.part, info.total) +
                       " of upload " + info.upload_id + " already stored, write skipped");
    }

    if (info.part != info.total) {
        return UploadOutcome::Pending();
    }

    auto inspected = checker_.Inspect(info.upload_id, info.total);
    if (!inspected.ok()) {
        return Reject(info.upload_id, inspected.error(), true);
    }
    const auto& completeness = inspected.value();
    if (completeness.first_missing) {
        return Reject(info.upload_id,
                      core::Error{core::ErrorCode::kIncomplete,
                                  "Missing chunk " + std::to_string(*completeness.first_missing) +
                                      ", upload failed"},
                      true);
    }
    if (!completeness.conflicting_totals.empty()) {
        core::LogWarning("upload " + info.upload_id + " declares total " +
                         std::to_string(info.total) + " but staging also holds totals " +
                         JoinTotals(completeness.conflicting_totals));
        return Reject(info.upload_id,
                      core::Error{core::ErrorCode::kConflict,
                                  "Conflicting chunk totals, upload failed"},
                      true);
    }

    auto assembled = assembler_.Assemble(info.upload_id, info.total);
    if (!assembled.ok()) {
        const bool finished_elsewhere =
            assembled.error().code == core::ErrorCode::kAlreadyExists;
        if (!finished_elsewhere) {
            core::LogError("assembly of upload " + info.upload_id +
                           " failed: " + assembled.error().message);
        }
        return Reject(info.upload_id, assembled.error(), !finished_elsewhere);
    }

    const auto& artifact = assembled.value();
    core::LogUploadEvent("finished", info.upload_id,
                         "parts=" + std::to_string(artifact.parts) + " bytes=" +
                             std::to_string(artifact.size_bytes) + " sha256=" + artifact.sha256);
    observability::RecordUploadFinished(artifact.size_bytes);
    NotifyFinished(info.upload_id, artifact.parts);
    return UploadOutcome::Finished();
}

core::Result<UploadStatus> UploadService::Status(const std::string& upload_id) const {
    if (!storage::ChunkStore::IsValidUploadId(upload_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "uploadId must be a UUID"};
    }

    UploadStatus status;
    status.upload_id = upload_id;
    status.finished = store_.HasFinalArtifact(upload_id);
    const bool staged = store_.HasStaging(upload_id);
    if (!status.finished && !staged) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }

    std::error_code ec;
    const auto anchor = status.finished ? store_.FinalPath(upload_id) : store_.StagingDir(upload_id);
    const auto modified = std::filesystem::last_write_time(anchor, ec);
    if (!ec) {
        status.last_activity = core::FileTimeToIso8601(modified);
    }

    if (staged) {
        auto chunks = store_.ListChunks(upload_id);
        if (!chunks.ok()) {
            return chunks.error();
        }
        std::set<int> totals;
        for (const auto& key : chunks.value()) {
            status.parts_received.push_back(key.part);
            totals.insert(key.total);
        }
        std::sort(status.parts_received.begin(), status.parts_received.end());
        if (totals.size() == 1) {
            status.declared_total = *totals.begin();
        }
        status.bytes_staged = DirectorySize(store_.StagingDir(upload_id));
        status.error = store_.ReadErrorMarker(upload_id);
    }
    return status;
}

UploadOutcome UploadService::Reject(const std::string& upload_id, const core::Error& error,
                                    bool record_marker) const {
    observability::RecordUploadRejected();
    core::LogUploadEvent("rejected", upload_id,
                         std::string(core::ErrorCodeName(error.code)) + ": " + error.message);
    if (record_marker) {
        auto marked = store_.WriteErrorMarker(upload_id, error.message);
        if (!marked.ok()) {
            core::LogError("failed to record error marker: " + marked.error().message);
        }
    }
    return UploadOutcome::Rejected(error);
}

void UploadService::NotifyFinished(const std::string& upload_id, int parts) const {
    if (!hooks_.on_finished) {
        return;
    }
    try {
        hooks_.on_finished(upload_id, parts);
    } catch (const std::exception& ex) {
        core::LogError("completion hook failed for upload " + upload_id + ": " + ex.what());
    }
}

}  // namespace chunkyard::upload
