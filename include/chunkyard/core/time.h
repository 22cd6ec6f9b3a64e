#pragma once

#include <filesystem>
#include <string>

namespace chunkyard::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Formats a filesystem modification time as ISO8601 UTC.
std::string FileTimeToIso8601(std::filesystem::file_time_type file_time);

}  // namespace chunkyard::core
