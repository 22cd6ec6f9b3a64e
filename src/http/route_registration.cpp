#include "chunkyard/http/route_registration.h"

#include <sstream>
#include <string>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include "chunkyard/core/time.h"
#include "chunkyard/http/chunk_request.h"
#include "chunkyard/http/responses.h"
#include "chunkyard/observability/metrics.h"
#include "chunkyard/upload/upload_service.h"

namespace chunkyard::http {
namespace {

std::string Stringify(const Poco::JSON::Object::Ptr& obj) {
    std::stringstream ss;
    obj->stringify(ss);
    return ss.str();
}

HttpResponse OutcomeResponse(int version, const upload::UploadOutcome& outcome) {
    const auto status = outcome.ok() ? boost::beast::http::status::ok : StatusFor(outcome.code);
    return JsonResponse(status, version, OutcomeBody(outcome));
}

std::string StatusBody(const upload::UploadStatus& status) {
    Poco::JSON::Array::Ptr parts = new Poco::JSON::Array();
    for (const auto part : status.parts_received) {
        parts->add(part);
    }
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("upload_id", status.upload_id);
    root->set("finished", status.finished);
    root->set("parts", parts);
    if (status.declared_total) {
        root->set("total", *status.declared_total);
    }
    root->set("bytes_staged", static_cast<Poco::UInt64>(status.bytes_staged));
    root->set("last_activity", status.last_activity);
    if (status.error) {
        root->set("error", *status.error);
    }
    return Stringify(root);
}

}  // namespace

std::string OutcomeBody(const upload::UploadOutcome& outcome) {
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("ok", outcome.ok());
    if (!outcome.ok()) {
        root->set("error", outcome.error);
    }
    if (outcome.finished()) {
        root->set("finished", true);
    }
    return Stringify(root);
}

void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::UploadService> uploads) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                   body->set("status", "ok");
                   body->set("time", core::NowIso8601());
                   body->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), Stringify(body));
               });

    router.Add("GET", "/readyz",
               [uploads](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   // Ready once the staging root can be created and written to.
                   auto root = uploads->store().EnsureRoot();
                   if (!root.ok()) {
                       return JsonError(req.version(), "NOT_READY", root.error().message,
                                        ctx.request_id,
                                        boost::beast::http::status::service_unavailable);
                   }
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/v1/uploads/chunks",
               [uploads](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   const auto content_type =
                       std::string(req[boost::beast::http::field::content_type]);
                   auto parsed = ParseChunkRequest(content_type, req.body());
                   if (!parsed.ok()) {
                       observability::RecordUploadRejected();
                       return OutcomeResponse(req.version(),
                                              upload::UploadOutcome::Rejected(parsed.error()));
                   }
                   return OutcomeResponse(req.version(), uploads->Submit(parsed.value()));
               });

    router.Add("GET", "/v1/uploads/{upload_id}",
               [uploads](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto status = uploads->Status(params.at("upload_id"));
                   if (!status.ok()) {
                       return JsonError(req.version(), core::ErrorCodeName(status.error().code),
                                        status.error().message, ctx.request_id,
                                        StatusFor(status.error().code));
                   }
                   return JsonOk(req.version(), StatusBody(status.value()));
               });
}

}  // namespace chunkyard::http
