#include "chunkyard/observability/metrics.h"

#include <atomic>

namespace chunkyard::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_chunks_stored{0};
std::atomic<std::uint64_t> g_chunks_duplicate{0};
std::atomic<std::uint64_t> g_uploads_finished{0};
std::atomic<std::uint64_t> g_uploads_rejected{0};
std::atomic<std::uint64_t> g_bytes_assembled{0};
std::atomic<std::uint64_t> g_entries_reaped{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n"
           "# TYPE " + name + " counter\n" +
           name + " " + std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordChunk(bool stored) {
    if (stored) {
        g_chunks_stored.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_chunks_duplicate.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordUploadFinished(std::uint64_t size_bytes) {
    g_uploads_finished.fetch_add(1, std::memory_order_relaxed);
    g_bytes_assembled.fetch_add(size_bytes, std::memory_order_relaxed);
}

void RecordUploadRejected() { g_uploads_rejected.fetch_add(1, std::memory_order_relaxed); }

void RecordReaped(std::size_t entries) {
    g_entries_reaped.fetch_add(static_cast<std::uint64_t>(entries), std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP chunkyard_up 1 if server is up\n"
           "# TYPE chunkyard_up gauge\n"
           "chunkyard_up 1\n" +
           Counter("chunkyard_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("chunkyard_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("chunkyard_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("chunkyard_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("chunkyard_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("chunkyard_chunks_stored_total", "Chunks written to staging",
                   g_chunks_stored) +
           Counter("chunkyard_chunks_duplicate_total", "Chunk writes skipped as duplicates",
                   g_chunks_duplicate) +
           Counter("chunkyard_uploads_finished_total", "Uploads assembled", g_uploads_finished) +
           Counter("chunkyard_uploads_rejected_total", "Rejected chunk submissions",
                   g_uploads_rejected) +
           Counter("chunkyard_bytes_assembled_total", "Bytes written to final artifacts",
                   g_bytes_assembled) +
           Counter("chunkyard_reaped_entries_total", "Stale staging entries removed",
                   g_entries_reaped);
}

}  // namespace chunkyard::observability
