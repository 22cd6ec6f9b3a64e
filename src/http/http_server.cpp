#include "chunkyard/http/http_server.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chunkyard/core/ids.h"
#include "chunkyard/core/logger.h"
#include "chunkyard/http/responses.h"
#include "chunkyard/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr auto kReadTimeout = std::chrono::seconds(60);

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const chunkyard::http::Router& router,
            const chunkyard::core::Config& config)
        : stream_(std::move(socket)), router_(router), config_(config) {}

    void Start() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::DoReadHeader, shared_from_this()));
    }

private:
    void DoReadHeader() {
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        stream_.expires_after(kReadTimeout);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                chunkyard::core::LogError("Read header failed: " + ec.message());
            }
            return;
        }

        ctx_ = chunkyard::http::RequestContext{};
        ctx_.request_id = chunkyard::core::GenerateRequestId();
        ctx_.started = std::chrono::steady_clock::now();
        ctx_.method = std::string(parser_->get().method_string());
        ctx_.target = std::string(parser_->get().target());
        ctx_.remote = GetRemoteAddress();
        if (const auto length = parser_->content_length()) {
            ctx_.body_bytes = *length;
        }

        if (parser_->is_done()) {
            return HandleRequest();
        }
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnReadBody, shared_from_this()));
    }

    void OnReadBody(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            auto response = chunkyard::http::JsonError(
                parser_->get().version(), "BODY_TOO_LARGE", "request body exceeds limit",
                ctx_.request_id, http::status::payload_too_large);
            response.keep_alive(false);
            return Send(std::move(response));
        }
        if (ec) {
            chunkyard::core::LogError("Read body failed: " + ec.message());
            return;
        }
        HandleRequest();
    }

    void HandleRequest() {
        chunkyard::http::HttpRequest request = parser_->release();

        auto result = router_.Route(ctx_, request);
        if (!result.ok()) {
            auto response = chunkyard::http::JsonError(
                request.version(), "INTERNAL", result.error().message, ctx_.request_id,
                http::status::internal_server_error);
            return Send(std::move(response));
        }
        auto response = std::move(result.value());
        response.keep_alive(request.keep_alive() && response.keep_alive());
        Send(std::move(response));
    }

    void Send(chunkyard::http::HttpResponse&& response) {
        response.set(http::field::server, "Chunkyard");
        response.set("X-Request-Id", ctx_.request_id);
        const auto latency = ctx_.ElapsedMs();
        chunkyard::core::AccessLogLine line;
        line.request_id = ctx_.request_id;
        line.method = ctx_.method;
        line.target = ctx_.target;
        line.remote = ctx_.remote;
        line.body_bytes = ctx_.body_bytes;
        line.status = response.result_int();
        line.latency_ms = latency;
        chunkyard::core::LogRequest(line);
        chunkyard::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<chunkyard::http::HttpResponse>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite, shared_from_this(),
                                                    sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<chunkyard::http::HttpResponse>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            chunkyard::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;

    const chunkyard::http::Router& router_;
    const chunkyard::core::Config& config_;

    chunkyard::http::RequestContext ctx_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, const chunkyard::http::Router& router,
             const chunkyard::core::Config& config)
        : ioc_(ioc), acceptor_(ioc), router_(router), config_(config) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            throw beast::system_error(ec);
        }
    }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            chunkyard::core::LogError("Accept failed: " + ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), router_, config_)->Start();
        }
        DoAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    const chunkyard::http::Router& router_;
    const chunkyard::core::Config& config_;
};

}  // namespace

namespace chunkyard::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router)
    : ioc_(ioc), config_(config), router_(std::move(router)) {}

void HttpServer::Run() {
    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_)->Run();
    core::LogInfo("listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port));
}

}  // namespace chunkyard::http
