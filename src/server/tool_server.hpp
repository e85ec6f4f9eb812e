#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "bridge/connection_supervisor.hpp"
#include "bridge/log_relay.hpp"
#include "bridge/message_router.hpp"
#include "bridge/request_correlator.hpp"
#include "core/config/bridge_config.hpp"
#include "server/tool_service.hpp"
#include "transport/bridge_listener.hpp"

namespace hostlink::server {

// Names advertised in welcome and listed by tools/list.
const std::vector<std::string>& tool_names();

// The accepting peer: listener, passive supervisor, router, correlator, the
// host log buffer and the caller-facing ToolService, wired together.
class ToolServer {
public:
    explicit ToolServer(const core::config::BridgeConfig& config);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    // Binds the WebSocket and health ports.
    core::errors::Status start();
    void stop();

    // Takes over a freshly accepted connection; a previous one is dropped.
    void adopt(std::shared_ptr<transport::Transport> transport);

    protocol::HealthStatus health() const;

    ToolService& tools() { return service_; }
    bridge::ConnectionSupervisor& supervisor() { return supervisor_; }
    bridge::MessageRouter& router() { return router_; }
    bridge::RequestCorrelator& correlator() { return correlator_; }
    bridge::LogBuffer& logs() { return log_buffer_; }

    std::uint16_t websocket_port() const;
    std::uint16_t health_port() const;

private:
    void on_hello(const protocol::Envelope& envelope);

    core::config::BridgeConfig config_;
    std::chrono::steady_clock::time_point started_at_;

    bridge::ConnectionSupervisor supervisor_;
    bridge::MessageRouter router_;
    bridge::RequestCorrelator correlator_;
    bridge::LogBuffer log_buffer_;
    bridge::LogCollector collector_;
    ToolService service_;
    std::unique_ptr<transport::BridgeListener> listener_;
    std::atomic<std::uint16_t> bound_websocket_port_{0};
    std::atomic<std::uint16_t> bound_health_port_{0};
};

}  // namespace hostlink::server
