#include "server/tool_server.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"

namespace hostlink::server {

using protocol::MessageKind;

const std::vector<std::string>& tool_names() {
    static const std::vector<std::string> names = {
        "execute_editor_command",
        "get_editor_state",
        "get_logs",
        "get_object_details",
        "take_screenshot",
        "manipulate_scene",
        "manage_assets",
    };
    return names;
}

ToolServer::ToolServer(const core::config::BridgeConfig& config)
    : config_(config),
      started_at_(std::chrono::steady_clock::now()),
      supervisor_(bridge::SupervisorOptions::from_config(config, bridge::PeerRole::Accepting)),
      router_(supervisor_),
      correlator_(router_, protocol::RequestTable(config.command_timeout,
                                                  config.long_command_timeout)),
      log_buffer_(config.log_capacity),
      collector_(router_, log_buffer_),
      service_(correlator_, supervisor_, log_buffer_, config.default_log_count) {
    router_.on(MessageKind::Hello,
               [this](const protocol::Envelope& envelope) { on_hello(envelope); });

    router_.on(MessageKind::Ping, [this](const protocol::Envelope& envelope) {
        const auto sent = router_.send(MessageKind::Pong, envelope.payload);
        if (core::errors::is_error(sent)) {
            LOG_DEBUG("Pong not sent: " + core::errors::get_error(sent).message);
        }
    });

    // Heartbeats are originated by the host; an unsolicited pong is harmless.
    router_.on(MessageKind::Pong, [](const protocol::Envelope&) {});
}

ToolServer::~ToolServer() {
    stop();
    supervisor_.shutdown();
}

core::errors::Status ToolServer::start() {
    if (listener_) {
        return core::errors::ok();
    }

    transport::ListenerOptions options;
    options.host = config_.host;
    options.websocket_port = config_.websocket_port;
    options.health_port = config_.health_port;
    options.health_path = config_.health_path;
    options.handshake_timeout = config_.connect_timeout;
    options.health_read_timeout = config_.health_probe_timeout;

    auto listener = std::make_unique<transport::BridgeListener>(
        options, [this](std::shared_ptr<transport::Transport> transport) { adopt(transport); },
        [this]() { return health(); });
    const auto started = listener->start();
    if (core::errors::is_error(started)) {
        return started;
    }
    bound_websocket_port_.store(listener->websocket_port());
    bound_health_port_.store(listener->health_port());
    listener_ = std::move(listener);
    return core::errors::ok();
}

void ToolServer::stop() {
    if (listener_) {
        listener_->stop();
        listener_.reset();
    }
    bound_websocket_port_.store(0);
    bound_health_port_.store(0);
}

void ToolServer::adopt(std::shared_ptr<transport::Transport> transport) {
    const auto adopted = supervisor_.accept(std::move(transport));
    if (core::errors::is_error(adopted)) {
        LOG_WARN("Connection rejected: " + core::errors::get_error(adopted).message);
    }
}

void ToolServer::on_hello(const protocol::Envelope& envelope) {
    auto hello = protocol::decode_payload<protocol::HelloPayload>(envelope.payload);
    if (core::errors::is_error(hello)) {
        LOG_WARN("Malformed hello: " + core::errors::get_error(hello).message);
        return;
    }
    const auto& peer = core::errors::get_value(hello);
    LOG_INFO("Host identified: " + (peer.client.empty() ? std::string("unknown") : peer.client) +
             " " + peer.version + " on " + peer.platform);

    protocol::WelcomePayload welcome;
    welcome.server_version = config_.version;
    welcome.features = tool_names();
    welcome.timestamp = core::time::format_iso8601(std::chrono::system_clock::now());
    const auto sent = router_.send(MessageKind::Welcome, welcome);
    if (core::errors::is_error(sent)) {
        LOG_WARN("Welcome not sent: " + core::errors::get_error(sent).message);
    }
}

protocol::HealthStatus ToolServer::health() const {
    protocol::HealthStatus status;
    status.status = "healthy";
    status.version = config_.version;
    status.websocket_port = websocket_port();
    status.health_port = health_port();
    status.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                std::chrono::steady_clock::now() - started_at_)
                                .count();
    status.connected = supervisor_.is_usable();
    status.timestamp = core::time::format_iso8601(std::chrono::system_clock::now());
    return status;
}

std::uint16_t ToolServer::websocket_port() const {
    const auto bound = bound_websocket_port_.load();
    return bound != 0 ? bound : config_.websocket_port;
}

std::uint16_t ToolServer::health_port() const {
    const auto bound = bound_health_port_.load();
    return bound != 0 ? bound : config_.health_port;
}

}  // namespace hostlink::server
