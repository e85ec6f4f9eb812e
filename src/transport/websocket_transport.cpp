#include "transport/websocket_transport.hpp"

#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>
#include "core/config/bridge_config.hpp"

namespace hostlink::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

// Screenshots travel as base64 text, so allow large messages.
constexpr std::uint64_t kReadMessageMax = 64ull * 1024 * 1024;

void configure_stream(WebSocketTransport::Stream& stream) {
    stream.read_message_max(kReadMessageMax);
    stream.auto_fragment(false);
    stream.text(true);
}

}  // namespace

WebSocketTransport::WebSocketTransport(std::shared_ptr<net::io_context> context,
                                       std::unique_ptr<Stream> stream)
    : context_(std::move(context)),
      work_(net::make_work_guard(*context_)),
      stream_(std::move(stream)) {
    configure_stream(*stream_);
    io_thread_ = std::thread([this]() { context_->run(); });
}

WebSocketTransport::~WebSocketTransport() {
    abort();
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

core::errors::Status WebSocketTransport::send_text(const std::string& text) {
    if (!open_.load()) {
        return BridgeError{ErrorCategory::Transport, "Connection is not open.", "not_open"};
    }

    auto write = std::make_shared<PendingWrite>();
    write->text = text;
    auto done = write->done.get_future();
    net::post(*context_, [this, write]() {
        if (!open_.load()) {
            write->done.set_value(
                BridgeError{ErrorCategory::Transport, "Connection is not open.", "not_open"});
            return;
        }
        writes_.push_back(write);
        if (writes_.size() == 1) {
            start_write();
        }
    });
    return done.get();
}

void WebSocketTransport::start_write() {
    stream_->async_write(
        net::buffer(writes_.front()->text),
        [this](const beast::error_code& ec, std::size_t) {
            if (ec) {
                open_.store(false);
                fail_writes(BridgeError{ErrorCategory::Transport,
                                        "WebSocket write failed: " + ec.message(),
                                        "send_failed"});
                return;
            }
            auto finished = writes_.front();
            writes_.pop_front();
            finished->done.set_value(core::errors::ok());
            if (!writes_.empty()) {
                start_write();
            }
        });
}

void WebSocketTransport::fail_writes(const BridgeError& error) {
    for (const auto& write : writes_) {
        write->done.set_value(error);
    }
    writes_.clear();
}

core::errors::Result<Frame> WebSocketTransport::receive() {
    if (!open_.load()) {
        return BridgeError{ErrorCategory::Transport, "Connection is not open.", "not_open"};
    }

    std::promise<core::errors::Result<Frame>> promise;
    auto result = promise.get_future();
    net::post(*context_, [this, &promise]() {
        stream_->async_read_some(
            read_buffer_, 0, [this, &promise](const beast::error_code& ec, std::size_t) {
                if (ec) {
                    open_.store(false);
                    const std::string reason = ec == websocket::error::closed
                                                   ? "Connection closed by peer."
                                                   : "WebSocket read failed: " + ec.message();
                    promise.set_value(
                        BridgeError{ErrorCategory::Transport, reason, "receive_failed"});
                    return;
                }
                Frame frame;
                frame.data = beast::buffers_to_string(read_buffer_.data());
                frame.end_of_message = stream_->is_message_done();
                read_buffer_.consume(read_buffer_.size());
                promise.set_value(std::move(frame));
            });
    });
    return result.get();
}

void WebSocketTransport::abort() {
    open_.store(false);
    if (aborted_.exchange(true)) {
        return;
    }
    // Closing the socket completes any pending read or write with an error.
    net::post(*context_, [this]() {
        beast::error_code ignored;
        stream_->next_layer().shutdown(tcp::socket::shutdown_both, ignored);
        stream_->next_layer().close(ignored);
    });
}

bool WebSocketTransport::is_open() const {
    return open_.load();
}

core::errors::Result<std::shared_ptr<Transport>> WebSocketTransportFactory::open(
    const Endpoint& endpoint, const std::chrono::milliseconds timeout) {
    auto context = std::make_shared<net::io_context>();
    auto stream = std::make_unique<WebSocketTransport::Stream>(*context);

    beast::error_code ec;
    tcp::resolver resolver(*context);
    const auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        return BridgeError{ErrorCategory::Transport,
                           "Cannot resolve " + endpoint.host + ": " + ec.message(),
                           "connect_failed"};
    }

    stream->set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
        request.set(beast::http::field::user_agent,
                    std::string("hostlink/") + core::config::kBridgeVersion);
    }));

    const std::string host_header = endpoint.host + ":" + std::to_string(endpoint.port);
    bool finished = false;
    beast::error_code result_ec;
    auto* raw_stream = stream.get();
    net::async_connect(
        raw_stream->next_layer(), results,
        [&, raw_stream](const beast::error_code& connect_ec, const tcp::endpoint&) {
            if (connect_ec) {
                result_ec = connect_ec;
                finished = true;
                return;
            }
            raw_stream->async_handshake(host_header, endpoint.path,
                                        [&](const beast::error_code& handshake_ec) {
                                            result_ec = handshake_ec;
                                            finished = true;
                                        });
        });

    context->run_for(timeout);
    if (!finished) {
        beast::error_code ignored;
        raw_stream->next_layer().close(ignored);
        // Let the cancelled handlers run before their captures go out of scope.
        context->restart();
        context->run();
        return BridgeError{ErrorCategory::Transport,
                           "Timed out connecting to " + host_header + endpoint.path,
                           "connect_timeout",
                           "Is the peer listening on this port?"};
    }
    if (result_ec) {
        return BridgeError{ErrorCategory::Transport,
                           "Cannot connect to " + host_header + endpoint.path + ": " +
                               result_ec.message(),
                           "connect_failed"};
    }

    context->restart();
    return std::shared_ptr<Transport>(
        std::make_shared<WebSocketTransport>(std::move(context), std::move(stream)));
}

}  // namespace hostlink::transport
