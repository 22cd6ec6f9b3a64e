#include "chunkyard/http/responses.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace chunkyard::http {

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body) {
    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonOk(int version, const std::string& body) {
    return JsonResponse(boost::beast::http::status::ok, version, body);
}

HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", error);
    std::stringstream ss;
    root->stringify(ss);
    return JsonResponse(status, version, ss.str());
}

boost::beast::http::status StatusFor(core::ErrorCode code) {
    using boost::beast::http::status;
    switch (code) {
        case core::ErrorCode::kOk:
            return status::ok;
        case core::ErrorCode::kInvalidArgument:
            return status::bad_request;
        case core::ErrorCode::kNotFound:
            return status::not_found;
        case core::ErrorCode::kForbidden:
            return status::forbidden;
        case core::ErrorCode::kFileTooLarge:
        case core::ErrorCode::kUploadTooLarge:
            return status::payload_too_large;
        case core::ErrorCode::kQuotaExceeded:
            return status::insufficient_storage;
        case core::ErrorCode::kAlreadyExists:
        case core::ErrorCode::kIncomplete:
        case core::ErrorCode::kConflict:
            return status::conflict;
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kInternal:
            return status::internal_server_error;
    }
    return status::internal_server_error;
}

}  // namespace chunkyard::http
