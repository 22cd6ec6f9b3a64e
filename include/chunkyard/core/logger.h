#pragma once

#include <cstdint>
#include <string>

namespace chunkyard::core {

/// @brief One access log record, emitted as a JSON line on the "chunkyard.access" logger.
struct AccessLogLine {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    std::uint64_t body_bytes{0};
    int status{0};
    long long latency_ms{0};
};

/// @brief Route all "chunkyard" loggers to the console at the given level.
/// Accepts Poco level names plus "info"; anything else falls back to "information".
void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
void LogRequest(const AccessLogLine& line);
/// @brief Log an upload lifecycle event (stored, rejected, finished, reaped) as a JSON line.
void LogUploadEvent(const std::string& event, const std::string& upload_id,
                    const std::string& detail);

}  // namespace chunkyard::core
