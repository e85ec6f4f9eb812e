#include "transport/bridge_listener.hpp"

#include <sys/socket.h>

#include <utility>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "transport/websocket_transport.hpp"

namespace hostlink::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

void unblock(std::atomic<int>& fd) {
    const int handle = fd.load();
    if (handle >= 0) {
        ::shutdown(handle, SHUT_RDWR);
    }
}

// Runs one asynchronous step on a private context and gives up on it once
// the deadline passes. start receives the completion to invoke.
template <typename Start>
beast::error_code run_with_deadline(net::io_context& context, tcp::socket& socket,
                                    const std::chrono::milliseconds deadline, Start start) {
    bool finished = false;
    beast::error_code result;
    start([&](const beast::error_code& ec) {
        result = ec;
        finished = true;
    });
    context.run_for(deadline);
    if (!finished) {
        beast::error_code ignored;
        socket.close(ignored);
        // Let the cancelled handler run before its captures go out of scope.
        context.restart();
        context.run();
        context.restart();
        return net::error::make_error_code(net::error::timed_out);
    }
    context.restart();
    return result;
}

std::string path_of(const beast::string_view target) {
    const auto query = target.find('?');
    const auto path = query == beast::string_view::npos ? target : target.substr(0, query);
    return std::string(path.data(), path.size());
}

}  // namespace

http::response<http::string_body> make_health_response(
    const http::request<http::string_body>& request,
    const std::string& health_path,
    const protocol::HealthStatus& status) {
    http::response<http::string_body> response;
    response.version(request.version());
    response.keep_alive(false);
    response.set(http::field::server, std::string("hostlink/") + status.version);
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");

    if (request.method() == http::verb::options) {
        response.result(http::status::ok);
        response.prepare_payload();
        return response;
    }

    response.set(http::field::content_type, "application/json");
    if (request.method() == http::verb::get && path_of(request.target()) == health_path) {
        response.result(http::status::ok);
        response.body() = nlohmann::json(status).dump(2);
    } else {
        response.result(http::status::not_found);
        nlohmann::json body;
        body["error"] = "Not Found";
        body["availableEndpoints"] = nlohmann::json::array({health_path});
        response.body() = body.dump();
    }
    response.prepare_payload();
    return response;
}

BridgeListener::BridgeListener(ListenerOptions options, AcceptHandler on_accept,
                               HealthProvider health)
    : options_(std::move(options)),
      on_accept_(std::move(on_accept)),
      health_(std::move(health)),
      context_(std::make_shared<net::io_context>()) {}

BridgeListener::~BridgeListener() {
    stop();
}

core::errors::Result<std::unique_ptr<tcp::acceptor>> BridgeListener::bind(
    const std::uint16_t port, const std::string& purpose) {
    beast::error_code ec;
    const auto address = net::ip::make_address(options_.host, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Transport,
                           "Invalid listen address '" + options_.host + "'.", "bind_failed"};
    }

    auto acceptor = std::make_unique<tcp::acceptor>(*context_);
    const tcp::endpoint endpoint(address, port);
    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return BridgeError{ErrorCategory::Transport,
                           "Cannot listen for " + purpose + " on " + options_.host + ":" +
                               std::to_string(port) + ": " + ec.message(),
                           "bind_failed",
                           "Is another instance already using this port?"};
    }
    return acceptor;
}

core::errors::Status BridgeListener::start() {
    if (running_.load()) {
        return core::errors::ok();
    }

    auto websocket = bind(options_.websocket_port, "WebSocket");
    if (core::errors::is_error(websocket)) {
        return core::errors::get_error(websocket);
    }
    auto health = bind(options_.health_port, "health checks");
    if (core::errors::is_error(health)) {
        return core::errors::get_error(health);
    }

    websocket_acceptor_ = std::move(std::get<std::unique_ptr<tcp::acceptor>>(websocket));
    health_acceptor_ = std::move(std::get<std::unique_ptr<tcp::acceptor>>(health));
    websocket_port_.store(websocket_acceptor_->local_endpoint().port());
    health_port_.store(health_acceptor_->local_endpoint().port());

    running_.store(true);
    websocket_thread_ = std::thread([this]() { websocket_loop(); });
    health_thread_ = std::thread([this]() { health_loop(); });

    LOG_INFO("WebSocket listening on ws://" + options_.host + ":" +
             std::to_string(websocket_port()));
    LOG_INFO("Health endpoint at http://" + options_.host + ":" +
             std::to_string(health_port()) + options_.health_path);
    return core::errors::ok();
}

void BridgeListener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // shutdown() on a listening socket makes a blocked accept() return.
    if (websocket_acceptor_) {
        ::shutdown(websocket_acceptor_->native_handle(), SHUT_RDWR);
    }
    if (health_acceptor_) {
        ::shutdown(health_acceptor_->native_handle(), SHUT_RDWR);
    }
    unblock(websocket_pending_fd_);
    unblock(health_pending_fd_);

    if (websocket_thread_.joinable()) {
        websocket_thread_.join();
    }
    if (health_thread_.joinable()) {
        health_thread_.join();
    }

    beast::error_code ignored;
    websocket_acceptor_->close(ignored);
    health_acceptor_->close(ignored);
}

void BridgeListener::websocket_loop() {
    while (running_.load()) {
        // Each connection gets its own context; the transport runs it on
        // the connection's I/O thread.
        auto connection_context = std::make_shared<net::io_context>();
        tcp::socket socket(*connection_context);
        beast::error_code ec;
        websocket_acceptor_->accept(socket, ec);
        if (ec) {
            if (!running_.load()) {
                break;
            }
            LOG_WARN("WebSocket accept failed: " + ec.message());
            continue;
        }

        auto stream = std::make_unique<WebSocketTransport::Stream>(std::move(socket));
        websocket_pending_fd_.store(stream->next_layer().native_handle());
        if (!running_.load()) {
            websocket_pending_fd_.store(-1);
            break;
        }
        auto* raw_stream = stream.get();
        ec = run_with_deadline(*connection_context, raw_stream->next_layer(),
                               options_.handshake_timeout, [raw_stream](auto done) {
                                   raw_stream->async_accept(
                                       [done](const beast::error_code& accept_ec) {
                                           done(accept_ec);
                                       });
                               });
        websocket_pending_fd_.store(-1);
        if (ec) {
            LOG_WARN("WebSocket handshake failed: " + ec.message());
            continue;
        }

        LOG_INFO("Peer connected.");
        on_accept_(std::make_shared<WebSocketTransport>(connection_context, std::move(stream)));
    }
}

void BridgeListener::health_loop() {
    while (running_.load()) {
        net::io_context request_context;
        tcp::socket socket(request_context);
        beast::error_code ec;
        health_acceptor_->accept(socket, ec);
        if (ec) {
            if (!running_.load()) {
                break;
            }
            LOG_WARN("Health accept failed: " + ec.message());
            continue;
        }

        health_pending_fd_.store(socket.native_handle());
        if (running_.load()) {
            serve_health(request_context, socket);
        }
        health_pending_fd_.store(-1);
    }
}

void BridgeListener::serve_health(net::io_context& context, tcp::socket& socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    auto ec = run_with_deadline(context, socket, options_.health_read_timeout,
                                [&socket, &buffer, &request](auto done) {
                                    http::async_read(socket, buffer, request,
                                                     [done](const beast::error_code& read_ec,
                                                            std::size_t) { done(read_ec); });
                                });
    if (ec) {
        LOG_DEBUG("Health request read failed: " + ec.message());
        return;
    }

    auto response = make_health_response(request, options_.health_path, health_());
    http::write(socket, response, ec);
    if (ec) {
        LOG_DEBUG("Health response write failed: " + ec.message());
        return;
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
    LOG_DEBUG("Health check served (" + std::to_string(response.result_int()) + ").");
}

}  // namespace hostlink::transport
