#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "chunkyard/core/error.h"
#include "chunkyard/http/router.h"

namespace chunkyard::http {

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body);
HttpResponse JsonOk(int version, const std::string& body);
/// @brief Error envelope: {"error":{"code":..,"message":..,"request_id":..}}.
HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status);
/// @brief HTTP status used when a core error reaches the client.
boost::beast::http::status StatusFor(core::ErrorCode code);

}  // namespace chunkyard::http
