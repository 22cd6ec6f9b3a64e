#include <filesystem>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkyard/http/responses.h"
#include "chunkyard/http/route_registration.h"
#include "chunkyard/http/router.h"
#include "chunkyard/upload/upload_service.h"

namespace http = boost::beast::http;

namespace {

chunkyard::http::HttpRequest MakeRequest(http::verb method, const std::string& target) {
    chunkyard::http::HttpRequest request{method, target, 11};
    return request;
}

}  // namespace

TEST(Router, MatchesTemplateParameters) {
    chunkyard::http::RouteParams params;
    EXPECT_TRUE(chunkyard::http::Router::Match("/v1/uploads/{upload_id}", "/v1/uploads/abc",
                                               &params));
    EXPECT_EQ(params.at("upload_id"), "abc");
    EXPECT_FALSE(chunkyard::http::Router::Match("/v1/uploads/{upload_id}", "/v1/uploads",
                                                nullptr));
    EXPECT_FALSE(chunkyard::http::Router::Match("/v1/uploads/chunks", "/v1/uploads/other",
                                                nullptr));
}

TEST(Router, DispatchesAndIgnoresQueryString) {
    chunkyard::http::Router router;
    router.Add("GET", "/v1/uploads/{upload_id}",
               [](const chunkyard::http::RequestContext&, const chunkyard::http::HttpRequest& req,
                  const chunkyard::http::RouteParams& params) {
                   return chunkyard::http::JsonOk(req.version(),
                                                  "{\"id\":\"" + params.at("upload_id") + "\"}");
               });
    EXPECT_EQ(router.size(), 1u);

    chunkyard::http::RequestContext ctx{"req-1", "GET", "/v1/uploads/xyz?verbose=1", "test"};
    auto routed = router.Route(ctx, MakeRequest(http::verb::get, "/v1/uploads/xyz?verbose=1"));
    ASSERT_TRUE(routed.ok());
    EXPECT_EQ(routed.value().result(), http::status::ok);
    EXPECT_EQ(routed.value().body(), "{\"id\":\"xyz\"}");
}

TEST(Router, WrongMethodYields405WithAllow) {
    chunkyard::http::Router router;
    router.Add("POST", "/v1/uploads/chunks",
               [](const chunkyard::http::RequestContext&, const chunkyard::http::HttpRequest& req,
                  const chunkyard::http::RouteParams&) {
                   return chunkyard::http::JsonOk(req.version(), "{}");
               });

    chunkyard::http::RequestContext ctx{"req-2", "GET", "/v1/uploads/chunks", "test"};
    auto routed = router.Route(ctx, MakeRequest(http::verb::get, "/v1/uploads/chunks"));
    ASSERT_TRUE(routed.ok());
    EXPECT_EQ(routed.value().result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(routed.value()[http::field::allow]), "POST");

    auto missing = router.Route(ctx, MakeRequest(http::verb::get, "/nowhere"));
    ASSERT_TRUE(missing.ok());
    EXPECT_EQ(missing.value().result(), http::status::not_found);
}

TEST(Responses, StatusForUploadErrors) {
    using chunkyard::core::ErrorCode;
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kInvalidArgument), http::status::bad_request);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kForbidden), http::status::forbidden);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kFileTooLarge),
              http::status::payload_too_large);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kUploadTooLarge),
              http::status::payload_too_large);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kQuotaExceeded),
              http::status::insufficient_storage);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kAlreadyExists), http::status::conflict);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kIncomplete), http::status::conflict);
    EXPECT_EQ(chunkyard::http::StatusFor(ErrorCode::kIoError),
              http::status::internal_server_error);
}

TEST(Responses, OutcomeBodyShapes) {
    using chunkyard::upload::UploadOutcome;
    EXPECT_EQ(chunkyard::http::OutcomeBody(UploadOutcome::Pending()), "{\"ok\":true}");
    EXPECT_EQ(chunkyard::http::OutcomeBody(UploadOutcome::Finished()),
              "{\"finished\":true,\"ok\":true}");
    EXPECT_EQ(chunkyard::http::OutcomeBody(UploadOutcome::Rejected(
                  {chunkyard::core::ErrorCode::kAlreadyExists, "Upload already exists"})),
              "{\"error\":\"Upload already exists\",\"ok\":false}");
}

TEST(Router, DefaultRoutesServeUploadEndpoints) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("chunkyard_routes_" + Poco::UUIDGenerator().createOne().toString());
    chunkyard::core::UploadConfig config;
    config.staging_root = root.string();
    auto uploads = std::make_shared<chunkyard::upload::UploadService>(config);

    chunkyard::http::Router router;
    chunkyard::http::RegisterDefaultRoutes(router, uploads);
    EXPECT_EQ(router.size(), 5u);

    chunkyard::http::RequestContext ctx{"req-3", "GET", "/", "test"};
    auto health = router.Route(ctx, MakeRequest(http::verb::get, "/healthz"));
    ASSERT_TRUE(health.ok());
    EXPECT_EQ(health.value().result(), http::status::ok);

    auto ready = router.Route(ctx, MakeRequest(http::verb::get, "/readyz"));
    ASSERT_TRUE(ready.ok());
    EXPECT_EQ(ready.value().result(), http::status::ok);
    EXPECT_TRUE(std::filesystem::is_directory(root));

    auto unknown = router.Route(
        ctx, MakeRequest(http::verb::get,
                         "/v1/uploads/" + Poco::UUIDGenerator().createRandom().toString()));
    ASSERT_TRUE(unknown.ok());
    EXPECT_EQ(unknown.value().result(), http::status::not_found);

    auto post = MakeRequest(http::verb::post, "/v1/uploads/chunks");
    post.set(http::field::content_type, "application/x-www-form-urlencoded");
    post.body() = "info=%7B%7D";
    post.prepare_payload();
    auto rejected = router.Route(ctx, post);
    ASSERT_TRUE(rejected.ok());
    EXPECT_EQ(rejected.value().result(), http::status::bad_request);
    EXPECT_EQ(rejected.value().body(),
              "{\"error\":\"Not a chunked upload request\",\"ok\":false}");

    std::filesystem::remove_all(root);
}
