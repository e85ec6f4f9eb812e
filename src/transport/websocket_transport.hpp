#pragma once

#include <atomic>
#include <deque>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>
#include "transport/transport.hpp"

namespace hostlink::transport {

// A Beast WebSocket stream driven from its own I/O thread.
//
// send_text() and receive() block their callers, but the stream itself is
// only touched by asynchronous operations on the I/O thread. Beast answers
// pings and close frames from inside a read; keeping every operation on one
// thread is what lets those control frames share the socket with our writes.
class WebSocketTransport : public Transport {
public:
    using Stream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    // Takes an already handshaken stream bound to context. The context must
    // have no other users: the transport runs it until destruction.
    WebSocketTransport(std::shared_ptr<boost::asio::io_context> context,
                       std::unique_ptr<Stream> stream);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    // Any number of threads; messages go out whole, in call order.
    core::errors::Status send_text(const std::string& text) override;
    // One reader at a time.
    core::errors::Result<Frame> receive() override;
    void abort() override;
    bool is_open() const override;

private:
    struct PendingWrite {
        std::string text;
        std::promise<core::errors::Status> done;
    };

    // I/O thread only.
    void start_write();
    void fail_writes(const core::errors::BridgeError& error);

    std::shared_ptr<boost::asio::io_context> context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::unique_ptr<Stream> stream_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::shared_ptr<PendingWrite>> writes_;
    std::atomic<bool> open_{true};
    std::atomic<bool> aborted_{false};
    std::thread io_thread_;
};

// Client side: resolve, TCP connect and WebSocket handshake, all under one
// deadline.
class WebSocketTransportFactory : public TransportFactory {
public:
    core::errors::Result<std::shared_ptr<Transport>> open(
        const Endpoint& endpoint, std::chrono::milliseconds timeout) override;
};

}  // namespace hostlink::transport
