#include "chunkyard/http/router.h"

#include <sstream>

#include "chunkyard/http/responses.h"

namespace chunkyard::http {

namespace {

bool IsParameter(const std::string& segment) {
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

}  // namespace

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, SplitPath(pattern), std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                         const HttpRequest& request) const {
    const auto target = std::string(request.target());
    const auto path = SplitPath(target.substr(0, target.find('?')));

    std::string allowed;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!MatchSegments(route.segments, path, &params)) {
            continue;
        }
        if (route.method == request.method_string()) {
            return route.handler(ctx, request, params);
        }
        allowed += allowed.empty() ? route.method : ", " + route.method;
    }

    if (!allowed.empty()) {
        auto response = JsonError(request.version(), "METHOD_NOT_ALLOWED", "method not allowed",
                                  ctx.request_id,
                                  boost::beast::http::status::method_not_allowed);
        response.set(boost::beast::http::field::allow, allowed);
        return response;
    }
    return JsonError(request.version(), "NOT_FOUND", "route not found", ctx.request_id,
                     boost::beast::http::status::not_found);
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    return MatchSegments(SplitPath(pattern), SplitPath(path), out_params);
}

Router::Segments Router::SplitPath(const std::string& path) {
    Segments segments;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            segments.push_back(item);
        }
    }
    return segments;
}

bool Router::MatchSegments(const Segments& pattern, const Segments& path,
                           RouteParams* out_params) {
    if (pattern.size() != path.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (IsParameter(pattern[i])) {
            if (out_params) {
                (*out_params)[pattern[i].substr(1, pattern[i].size() - 2)] = path[i];
            }
        } else if (pattern[i] != path[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace chunkyard::http
