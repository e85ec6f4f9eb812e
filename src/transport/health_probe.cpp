#include "transport/health_probe.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"

namespace hostlink::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

core::errors::Result<protocol::HealthStatus> parse_health_response(const unsigned status_code,
                                                                   const std::string& body) {
    if (status_code != 200) {
        return BridgeError{ErrorCategory::Gate,
                           "Health endpoint answered HTTP " + std::to_string(status_code) + ".",
                           "peer_unhealthy"};
    }

    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return BridgeError{ErrorCategory::Gate, "Health endpoint returned malformed JSON.",
                           "peer_unhealthy"};
    }

    auto status = protocol::decode_payload<protocol::HealthStatus>(document);
    if (core::errors::is_error(status)) {
        return BridgeError{ErrorCategory::Gate,
                           "Health document is incomplete: " +
                               core::errors::get_error(status).message,
                           "peer_unhealthy"};
    }
    if (!core::errors::get_value(status).healthy()) {
        return BridgeError{ErrorCategory::Gate,
                           "Peer reports status '" + core::errors::get_value(status).status +
                               "'.",
                           "peer_unhealthy"};
    }
    return status;
}

core::errors::Result<protocol::HealthStatus> HttpHealthProbe::probe(
    const Endpoint& endpoint, const std::chrono::milliseconds timeout) {
    net::io_context context;
    tcp::socket socket(context);

    beast::error_code ec;
    tcp::resolver resolver(context);
    const auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        return BridgeError{ErrorCategory::Gate,
                           "Cannot resolve " + endpoint.host + ": " + ec.message(),
                           "peer_unreachable"};
    }

    http::request<http::empty_body> request{http::verb::get, endpoint.path, 11};
    request.set(http::field::host, endpoint.host + ":" + std::to_string(endpoint.port));
    request.set(http::field::user_agent,
                std::string("hostlink/") + core::config::kBridgeVersion);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;

    enum class Stage { Connect, Exchange, Done };
    Stage stage = Stage::Connect;
    beast::error_code result_ec;

    net::async_connect(socket, results, [&](const beast::error_code& connect_ec,
                                            const tcp::endpoint&) {
        if (connect_ec) {
            result_ec = connect_ec;
            return;
        }
        stage = Stage::Exchange;
        http::async_write(socket, request, [&](const beast::error_code& write_ec, std::size_t) {
            if (write_ec) {
                result_ec = write_ec;
                return;
            }
            http::async_read(socket, buffer, response,
                             [&](const beast::error_code& read_ec, std::size_t) {
                                 result_ec = read_ec;
                                 if (!read_ec) {
                                     stage = Stage::Done;
                                 }
                             });
        });
    });

    // run_for() returns early once every handler has run; the context only
    // reports stopped() when the exchange finished (or failed) in time.
    context.run_for(timeout);
    if (!context.stopped()) {
        beast::error_code ignored;
        socket.close(ignored);
        context.restart();
        context.run();
        return BridgeError{ErrorCategory::Gate,
                           "Health probe timed out after " + std::to_string(timeout.count()) +
                               "ms.",
                           "gate_timeout"};
    }

    if (stage == Stage::Connect) {
        return BridgeError{ErrorCategory::Gate,
                           "Peer unreachable at " + endpoint.host + ":" +
                               std::to_string(endpoint.port) + ": " + result_ec.message(),
                           "peer_unreachable",
                           "Start the tool server before the host connects."};
    }
    if (stage != Stage::Done) {
        return BridgeError{ErrorCategory::Gate,
                           "Health exchange failed: " + result_ec.message(),
                           "peer_unhealthy"};
    }

    beast::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    return parse_health_response(response.result_int(), response.body());
}

}  // namespace hostlink::transport
