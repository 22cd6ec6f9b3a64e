#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkyard::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
/// @brief Record a persisted chunk; stored is false when the write was skipped as a duplicate.
void RecordChunk(bool stored);
void RecordUploadFinished(std::uint64_t size_bytes);
void RecordUploadRejected();
void RecordReaped(std::size_t entries);

}  // namespace chunkyard::observability
