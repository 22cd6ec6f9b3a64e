#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "chunkyard/core/error.h"

namespace chunkyard::upload {

/// @brief Metadata accompanying every chunk, as declared by the client.
struct ChunkInfo {
    std::string upload_id;
    std::uint64_t upload_size{0};
    int part{0};
    int total{0};
};

/// @brief One parsed chunk submission: declared metadata plus the received bytes.
struct ChunkSubmission {
    ChunkInfo info;
    std::string payload;
    std::string file_name;
    bool has_payload{false};
};

enum class OutcomeStatus {
    kPending,
    kFinished,
    kRejected,
};

/// @brief Result of evaluating one submission; maps directly onto the JSON response.
struct UploadOutcome {
    OutcomeStatus status{OutcomeStatus::kRejected};
    core::ErrorCode code{core::ErrorCode::kOk};
    std::string error;

    bool ok() const { return status != OutcomeStatus::kRejected; }
    bool finished() const { return status == OutcomeStatus::kFinished; }

    static UploadOutcome Pending() { return UploadOutcome{OutcomeStatus::kPending, {}, {}}; }
    static UploadOutcome Finished() { return UploadOutcome{OutcomeStatus::kFinished, {}, {}}; }
    static UploadOutcome Rejected(const core::Error& error) {
        return UploadOutcome{OutcomeStatus::kRejected, error.code, error.message};
    }
};

/// @brief Decides whether a submission may be stored at all. Returning false rejects it.
using AdmissionPredicate = std::function<bool(const ChunkSubmission&)>;
/// @brief Invoked once per upload after the final artifact is in place.
using CompletionHook = std::function<void(const std::string& upload_id, int parts)>;

/// @brief Optional capability hooks injected by the host.
struct UploadHooks {
    AdmissionPredicate allow_upload;
    CompletionHook on_finished;
};

/// @brief Read-only view of one upload for resuming clients.
struct UploadStatus {
    std::string upload_id;
    bool finished{false};
    std::vector<int> parts_received;
    std::optional<int> declared_total;
    std::uint64_t bytes_staged{0};
    std::string last_activity;
    std::optional<std::string> error;
};

}  // namespace chunkyard::upload
