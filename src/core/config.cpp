#include "chunkyard/core/config.h"

#include <cctype>
#include <filesystem>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace chunkyard::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void Validate(const Config& config) {
    if (config.server.port <= 0 || config.server.port > 65535) {
        throw std::invalid_argument("server.port must be in 1..65535");
    }
    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.server.limits.max_body_bytes == 0) {
        throw std::invalid_argument("server.limits.max_body_bytes must be positive");
    }
    if (IsBlank(config.uploads.staging_root)) {
        throw std::invalid_argument("uploads.staging_root must not be blank");
    }
    if (config.uploads.max_upload_age_seconds <= 0) {
        throw std::invalid_argument("uploads.max_upload_age_seconds must be positive");
    }
    if (config.uploads.max_upload_bytes == 0) {
        throw std::invalid_argument("uploads.max_upload_bytes must be positive");
    }
    if (config.uploads.max_directory_bytes == 0) {
        throw std::invalid_argument("uploads.max_directory_bytes must be positive");
    }
}

std::uint64_t GetPositiveBytes(const Poco::Util::JSONConfiguration& cfg, const std::string& key,
                               std::uint64_t default_value) {
    const auto value = cfg.getInt64(key, static_cast<Poco::Int64>(default_value));
    if (value <= 0) {
        throw std::invalid_argument(key + " must be positive");
    }
    return static_cast<std::uint64_t>(value);
}

}  // namespace

std::string DefaultStagingRoot() {
    return (std::filesystem::temp_directory_path() / "chunkyard_uploads").string();
}

Config DefaultConfig() {
    Config config;
    config.uploads.staging_root = DefaultStagingRoot();
    return config;
}

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    const Config defaults = DefaultConfig();
    Config config;
    config.server.host = cfg->getString("server.host", defaults.server.host);
    config.server.port = cfg->getInt("server.port", defaults.server.port);
    config.server.threads = cfg->getInt("server.threads", defaults.server.threads);
    config.server.limits.max_body_bytes = GetPositiveBytes(
        *cfg, "server.limits.max_body_bytes", defaults.server.limits.max_body_bytes);

    config.uploads.staging_root =
        cfg->getString("uploads.staging_root", defaults.uploads.staging_root);
    config.uploads.max_upload_age_seconds = cfg->getInt(
        "uploads.max_upload_age_seconds", defaults.uploads.max_upload_age_seconds);
    config.uploads.max_upload_bytes = GetPositiveBytes(*cfg, "uploads.max_upload_bytes",
                                                       defaults.uploads.max_upload_bytes);
    config.uploads.max_directory_bytes = GetPositiveBytes(
        *cfg, "uploads.max_directory_bytes", defaults.uploads.max_directory_bytes);

    config.observability.log_level =
        cfg->getString("observability.log_level", defaults.observability.log_level);

    Validate(config);
    return config;
}

}  // namespace chunkyard::core
