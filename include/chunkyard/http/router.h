#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "chunkyard/core/result.h"
#include "chunkyard/http/request_context.h"

namespace chunkyard::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&, const HttpRequest&, const RouteParams&)>;

/// @brief Route table keyed by method and path template, e.g. "/v1/uploads/{upload_id}".
///
/// Templates are split into segments once, at registration. A path that matches a template
/// under another method yields 405 with an Allow header; any other miss yields 404.
class Router {
public:
    void Add(const std::string& method, const std::string& pattern, Handler handler);
    core::Result<HttpResponse> Route(const RequestContext& ctx, const HttpRequest& request) const;
    std::size_t size() const { return routes_.size(); }

    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);

private:
    using Segments = std::vector<std::string>;

    struct RouteEntry {
        std::string method;
        Segments segments;
        Handler handler;
    };

    static Segments SplitPath(const std::string& path);
    static bool MatchSegments(const Segments& pattern, const Segments& path,
                              RouteParams* out_params);

    std::vector<RouteEntry> routes_;
};

}  // namespace chunkyard::http
