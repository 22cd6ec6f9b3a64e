#pragma once

#include <boost/asio/io_context.hpp>

#include "chunkyard/core/config.h"
#include "chunkyard/http/router.h"

namespace chunkyard::http {

/// @brief HTTP server bootstrapper (acceptor + per-connection sessions).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router);
    void Run();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
};

}  // namespace chunkyard::http
