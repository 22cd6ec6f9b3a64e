#pragma once

#include <cstdint>
#include <string>

namespace chunkyard::core {

/// @brief Request limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, worker threads, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    LimitsConfig limits;
};

/// @brief Staging root location and the quotas applied to chunked uploads.
struct UploadConfig {
    std::string staging_root;
    int max_upload_age_seconds{5400};
    std::uint64_t max_upload_bytes{1073741824ULL};
    std::uint64_t max_directory_bytes{53687091200ULL};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for Chunkyard.
struct Config {
    ServerConfig server;
    UploadConfig uploads;
    ObservabilityConfig observability;
};

/// @brief Default staging root: a subdirectory of the system temp directory.
std::string DefaultStagingRoot();
/// @brief Configuration with every field at its default value.
Config DefaultConfig();
/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);

}  // namespace chunkyard::core
