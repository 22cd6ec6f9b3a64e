#include "chunkyard/http/chunk_request.h"

#include <climits>
#include <istream>
#include <optional>
#include <sstream>
#include <typeinfo>

#include <Poco/Dynamic/Var.h>
#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTMLForm.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/NameValueCollection.h>
#include <Poco/Net/PartHandler.h>
#include <Poco/NullStream.h>
#include <Poco/StreamCopier.h>

#include "chunkyard/core/logger.h"

namespace chunkyard::http {

namespace {

/// Captures the "file" part; any other file part is drained and dropped.
class PayloadPartHandler : public Poco::Net::PartHandler {
public:
    void handlePart(const Poco::Net::MessageHeader& header, std::istream& stream) override {
        std::string disposition;
        Poco::Net::NameValueCollection params;
        if (header.has("Content-Disposition")) {
            Poco::Net::MessageHeader::splitParameters(header.get("Content-Disposition"),
                                                      disposition, params);
        }
        if (params.get("name", "") != kFileField || found_) {
            Poco::NullOutputStream sink;
            Poco::StreamCopier::copyStream(stream, sink);
            return;
        }
        Poco::StreamCopier::copyToString(stream, payload_);
        file_name_ = params.get("filename", "");
        found_ = true;
    }

    bool found() const { return found_; }
    std::string& payload() { return payload_; }
    const std::string& file_name() const { return file_name_; }

private:
    bool found_{false};
    std::string payload_;
    std::string file_name_;
};

std::optional<Poco::Int64> GetInteger(const Poco::JSON::Object::Ptr& obj, const std::string& key) {
    if (!obj->has(key)) {
        return std::nullopt;
    }
    const auto value = obj->get(key);
    if (!value.isInteger()) {
        return std::nullopt;
    }
    return value.convert<Poco::Int64>();
}

core::Error InvalidRequest(const std::string& detail) {
    core::LogDebug("rejecting chunk request: " + detail);
    return core::Error{core::ErrorCode::kInvalidArgument, "Invalid request"};
}

}  // namespace

core::Result<upload::ChunkInfo> ParseChunkInfo(const std::string& json) {
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(json);
        if (result.type() != typeid(Poco::JSON::Object::Ptr)) {
            return InvalidRequest("info is not a JSON object");
        }
        auto obj = result.extract<Poco::JSON::Object::Ptr>();

        upload::ChunkInfo info;
        const auto upload_id = obj->get("uploadId");
        if (!upload_id.isString()) {
            return InvalidRequest("uploadId must be a string");
        }
        info.upload_id = upload_id.convert<std::string>();

        const auto upload_size = GetInteger(obj, "uploadSize");
        const auto part = GetInteger(obj, "part");
        const auto total = GetInteger(obj, "total");
        if (!upload_size || !part || !total) {
            return InvalidRequest("uploadSize, part and total must be integers");
        }
        if (*upload_size < 0 || *part < INT_MIN || *part > INT_MAX || *total < INT_MIN ||
            *total > INT_MAX) {
            return InvalidRequest("numeric field out of range");
        }
        info.upload_size = static_cast<std::uint64_t>(*upload_size);
        info.part = static_cast<int>(*part);
        info.total = static_cast<int>(*total);
        return info;
    } catch (const Poco::Exception& ex) {
        return InvalidRequest(ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidRequest(ex.what());
    }
}

core::Result<upload::ChunkSubmission> ParseChunkRequest(const std::string& content_type,
                                                        const std::string& body) {
    Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_POST, "/",
                                   Poco::Net::HTTPMessage::HTTP_1_1);
    request.setContentType(content_type);
    std::istringstream stream(body);

    PayloadPartHandler handler;
    Poco::Net::HTMLForm form;
    try {
        form.load(request, stream, handler);
    } catch (const Poco::Exception& ex) {
        return InvalidRequest("malformed form body: " + ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidRequest(std::string("malformed form body: ") + ex.what());
    }

    if (form.get(kMarkerField, "") != "true") {
        return core::Error{core::ErrorCode::kInvalidArgument, "Not a chunked upload request"};
    }
    if (!form.has(kInfoField)) {
        return InvalidRequest("info field is missing");
    }

    auto info = ParseChunkInfo(form.get(kInfoField));
    if (!info.ok()) {
        return info.error();
    }

    upload::ChunkSubmission submission;
    submission.info = info.value();
    if (handler.found()) {
        submission.has_payload = true;
        submission.payload = std::move(handler.payload());
        submission.file_name = handler.file_name();
    } else if (form.has(kFileField)) {
        // A file part sent without a filename arrives as a plain field.
        submission.has_payload = true;
        submission.payload = form.get(kFileField);
    }
    return submission;
}

}  // namespace chunkyard::http
