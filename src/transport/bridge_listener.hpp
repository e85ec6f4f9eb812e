#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include "transport/transport.hpp"

namespace hostlink::transport {

struct ListenerOptions {
    std::string host = "127.0.0.1";
    std::uint16_t websocket_port = 8080;  // 0 picks a free port
    std::uint16_t health_port = 8081;     // 0 picks a free port
    std::string health_path = "/health";
    // A client that connects and then stalls is dropped after these.
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds health_read_timeout{2000};
};

using AcceptHandler = std::function<void(std::shared_ptr<Transport>)>;
using HealthProvider = std::function<protocol::HealthStatus()>;

// Builds the side-channel answer: 200 + health document on GET <path>,
// 200 with CORS headers on OPTIONS, 404 with the endpoint list otherwise.
boost::beast::http::response<boost::beast::http::string_body> make_health_response(
    const boost::beast::http::request<boost::beast::http::string_body>& request,
    const std::string& health_path,
    const protocol::HealthStatus& status);

// Accepting side of the bridge: one WebSocket acceptor handing handshaken
// connections to on_accept, and one HTTP acceptor serving the health
// endpoint. Each runs an accept loop on its own thread; the handshake or
// request read that follows an accept is bounded by a deadline.
class BridgeListener {
public:
    BridgeListener(ListenerOptions options, AcceptHandler on_accept, HealthProvider health);
    ~BridgeListener();

    BridgeListener(const BridgeListener&) = delete;
    BridgeListener& operator=(const BridgeListener&) = delete;

    core::errors::Status start();
    void stop();

    std::uint16_t websocket_port() const { return websocket_port_.load(); }
    std::uint16_t health_port() const { return health_port_.load(); }

private:
    core::errors::Result<std::unique_ptr<boost::asio::ip::tcp::acceptor>> bind(
        std::uint16_t port, const std::string& purpose);
    void websocket_loop();
    void health_loop();
    void serve_health(boost::asio::io_context& context, boost::asio::ip::tcp::socket& socket);

    ListenerOptions options_;
    AcceptHandler on_accept_;
    HealthProvider health_;

    std::shared_ptr<boost::asio::io_context> context_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> websocket_acceptor_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> health_acceptor_;
    std::atomic<std::uint16_t> websocket_port_{0};
    std::atomic<std::uint16_t> health_port_{0};

    // Sockets currently blocked in a handshake or request read, so stop()
    // can unblock them.
    std::atomic<int> websocket_pending_fd_{-1};
    std::atomic<int> health_pending_fd_{-1};

    std::atomic<bool> running_{false};
    std::thread websocket_thread_;
    std::thread health_thread_;
};

}  // namespace hostlink::transport
