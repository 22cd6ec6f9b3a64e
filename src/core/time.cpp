#include "chunkyard/core/time.h"

#include <chrono>

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>

namespace chunkyard::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string FileTimeToIso8601(std::filesystem::file_time_type file_time) {
    // file_time_type's clock has no portable epoch in C++17; translate through "now".
    const auto system_time = std::chrono::time_point_cast<std::chrono::microseconds>(
        file_time - std::filesystem::file_time_type::clock::now() +
        std::chrono::system_clock::now());
    const auto micros = system_time.time_since_epoch().count();
    return Poco::DateTimeFormatter::format(
        Poco::Timestamp(static_cast<Poco::Timestamp::TimeVal>(micros)),
        Poco::DateTimeFormat::ISO8601_FORMAT);
}

}  // namespace chunkyard::core
