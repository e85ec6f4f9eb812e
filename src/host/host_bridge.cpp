#include "host/host_bridge.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/payloads.hpp"

namespace hostlink::host {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bridge::SupervisorOptions host_options(const core::config::BridgeConfig& config,
                                       bridge::ClockFn clock) {
    auto options = bridge::SupervisorOptions::from_config(config, bridge::PeerRole::Initiating);
    if (clock) {
        options.clock = std::move(clock);
    }
    return options;
}

}  // namespace

HostBridge::HostBridge(const core::config::BridgeConfig& config,
                       std::shared_ptr<transport::TransportFactory> factory,
                       std::shared_ptr<transport::HealthProbe> probe,
                       bridge::ClockFn clock)
    : table_(config.command_timeout, config.long_command_timeout),
      supervisor_(host_options(config, std::move(clock)), std::move(factory), std::move(probe)),
      router_(supervisor_),
      log_buffer_(config.log_capacity),
      forwarder_(router_, log_buffer_) {
    for (const auto& route : table_.routes()) {
        router_.on(route.request, [this, route](const protocol::Envelope& envelope) {
            handle_command(route, envelope);
        });
    }

    router_.on(protocol::MessageKind::Pong,
               [this](const protocol::Envelope&) { supervisor_.record_pong(); });

    router_.on(protocol::MessageKind::Ping, [this](const protocol::Envelope& envelope) {
        const auto sent = router_.send(protocol::MessageKind::Pong, envelope.payload);
        if (core::errors::is_error(sent)) {
            LOG_DEBUG("Pong not sent: " + core::errors::get_error(sent).message);
        }
    });

    router_.on(protocol::MessageKind::Welcome, [](const protocol::Envelope& envelope) {
        auto welcome = protocol::decode_payload<protocol::WelcomePayload>(envelope.payload);
        if (core::errors::is_error(welcome)) {
            LOG_WARN("Malformed welcome: " + core::errors::get_error(welcome).message);
            return;
        }
        const auto& payload = core::errors::get_value(welcome);
        LOG_INFO("Tool server " + payload.server_version + " offers " +
                 std::to_string(payload.features.size()) + " tools");
    });
}

HostBridge::~HostBridge() {
    shutdown();
}

void HostBridge::register_command(const protocol::MessageKind kind, CommandHandler handler) {
    std::lock_guard<std::mutex> lock(commands_mutex_);
    commands_[kind] = std::move(handler);
}

void HostBridge::start() {
    forwarder_.attach();
    supervisor_.connect();
}

void HostBridge::pump(const bridge::Clock::time_point now) {
    if (busy_.load()) {
        return;
    }
    dispatch_.run_pending();
    supervisor_.tick(now);
}

void HostBridge::set_busy(const bool busy) {
    const bool was_busy = busy_.exchange(busy);
    if (was_busy != busy) {
        LOG_INFO(busy ? "Host busy; bridge paused" : "Host ready; bridge resumed");
    }
}

void HostBridge::shutdown() {
    forwarder_.detach();
    supervisor_.shutdown();
    dispatch_.close();
}

void HostBridge::handle_command(const protocol::RequestRoute& route,
                                const protocol::Envelope& envelope) {
    // Refusals go through the queue too, so replies of one kind leave in the
    // order their commands arrived.
    const auto request_kind = route.request;
    const auto reply_kind = route.reply;
    dispatch_.submit(
        [this, request_kind, name = envelope.kind, payload = envelope.payload]() {
            return run_command(request_kind, name, payload);
        },
        [this, reply_kind](const WorkResult& result) { reply(reply_kind, result); });
}

WorkResult HostBridge::run_command(const protocol::MessageKind kind, const std::string& name,
                                   const json& payload) {
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(commands_mutex_);
        const auto it = commands_.find(kind);
        if (it != commands_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        return BridgeError{ErrorCategory::Input, "unsupported command: " + name,
                           "unsupported_command"};
    }
    return handler(payload);
}

void HostBridge::reply(const protocol::MessageKind kind, const WorkResult& result) {
    json payload;
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_WARN(protocol::to_string(kind) + " failed: " + error.message);
        payload = json{{"error", error.message}};
    } else {
        payload = core::errors::get_value(result);
    }

    const auto sent = router_.send(kind, std::move(payload));
    if (core::errors::is_error(sent)) {
        LOG_WARN("Could not send " + protocol::to_string(kind) + ": " +
                 core::errors::get_error(sent).message);
    }
}

}  // namespace hostlink::host
