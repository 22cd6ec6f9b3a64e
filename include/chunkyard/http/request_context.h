#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkyard::http {

/// @brief Per-request metadata shared by routing, access logging and error envelopes.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    /// Declared Content-Length, 0 when absent or chunked.
    std::uint64_t body_bytes{0};
    std::chrono::steady_clock::time_point started{};

    long long ElapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started)
            .count();
    }
};

}  // namespace chunkyard::http
