#include "chunkyard/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace chunkyard::core {

namespace {

constexpr const char* kRootLogger = "chunkyard";

Poco::Logger& RootLogger() {
    return Poco::Logger::get(kRootLogger);
}

Poco::Logger& AccessLogger() {
    return Poco::Logger::get("chunkyard.access");
}

Poco::Logger& UploadLogger() {
    return Poco::Logger::get("chunkyard.upload");
}

std::string ToJsonLine(const Poco::JSON::Object& obj) {
    std::ostringstream ss;
    obj.stringify(ss);
    return ss.str();
}

}  // namespace

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %s: %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));

    int priority = Poco::Message::PRIO_INFORMATION;
    bool unknown_level = false;
    try {
        priority = Poco::Logger::parseLevel(level == "info" ? "information" : level);
    } catch (const Poco::InvalidArgumentException&) {
        unknown_level = true;
    }

    // Applies to "chunkyard" and every "chunkyard.*" descendant.
    Poco::Logger::setChannel(kRootLogger, channel);
    Poco::Logger::setLevel(kRootLogger, priority);
    if (unknown_level) {
        RootLogger().warning("unknown log level '" + level + "', using information");
    }
}

void LogInfo(const std::string& message) { RootLogger().information(message); }
void LogWarning(const std::string& message) { RootLogger().warning(message); }
void LogError(const std::string& message) { RootLogger().error(message); }
void LogDebug(const std::string& message) { RootLogger().debug(message); }

void LogRequest(const AccessLogLine& line) {
    auto& logger = AccessLogger();
    if (!logger.information()) {
        return;
    }
    Poco::JSON::Object obj(Poco::JSON_PRESERVE_KEY_ORDER);
    obj.set("event", "http_request");
    obj.set("request_id", line.request_id);
    obj.set("method", line.method);
    obj.set("target", line.target);
    obj.set("remote", line.remote);
    obj.set("body_bytes", static_cast<Poco::UInt64>(line.body_bytes));
    obj.set("status", line.status);
    obj.set("latency_ms", static_cast<Poco::Int64>(line.latency_ms));
    logger.information(ToJsonLine(obj));
}

void LogUploadEvent(const std::string& event, const std::string& upload_id,
                    const std::string& detail) {
    auto& logger = UploadLogger();
    if (!logger.information()) {
        return;
    }
    Poco::JSON::Object obj(Poco::JSON_PRESERVE_KEY_ORDER);
    obj.set("event", event);
    obj.set("upload_id", upload_id);
    if (!detail.empty()) {
        obj.set("detail", detail);
    }
    logger.information(ToJsonLine(obj));
}

}  // namespace chunkyard::core
