#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "bridge/connection_supervisor.hpp"
#include "bridge/log_relay.hpp"
#include "bridge/message_router.hpp"
#include "core/config/bridge_config.hpp"
#include "host/privileged_dispatch.hpp"
#include "protocol/request_table.hpp"

namespace hostlink::host {

// Runs on the privileged context. Returning an error (or throwing) makes the
// reply carry {error}; the connection stays up either way.
using CommandHandler = std::function<WorkResult(const nlohmann::json& payload)>;

// The initiating peer as embedded in a host application.
//
// Commands arrive on the receive thread, are queued on PrivilegedDispatch,
// and are answered from the privileged context once pump() has run them.
class HostBridge {
public:
    HostBridge(const core::config::BridgeConfig& config,
               std::shared_ptr<transport::TransportFactory> factory,
               std::shared_ptr<transport::HealthProbe> probe,
               bridge::ClockFn clock = nullptr);
    ~HostBridge();

    HostBridge(const HostBridge&) = delete;
    HostBridge& operator=(const HostBridge&) = delete;

    // Replaces any earlier handler; an empty handler unregisters the kind.
    // The handler in place when a command runs is the one that answers it.
    void register_command(protocol::MessageKind kind, CommandHandler handler);

    // Starts log forwarding and the first connection attempt.
    void start();

    // One iteration of the host's scheduling loop: run queued privileged work,
    // then drive reconnects and heartbeats. Does nothing while busy.
    void pump(bridge::Clock::time_point now);

    // The host is compiling or otherwise unable to do privileged work.
    void set_busy(bool busy);
    bool busy() const { return busy_.load(); }

    void shutdown();

    bridge::ConnectionSupervisor& supervisor() { return supervisor_; }
    bridge::MessageRouter& router() { return router_; }
    PrivilegedDispatch& dispatch() { return dispatch_; }
    bridge::LogBuffer& logs() { return log_buffer_; }
    const protocol::RequestTable& table() const { return table_; }

private:
    void handle_command(const protocol::RequestRoute& route, const protocol::Envelope& envelope);
    WorkResult run_command(protocol::MessageKind kind, const std::string& name,
                           const nlohmann::json& payload);
    void reply(protocol::MessageKind kind, const WorkResult& result);

    protocol::RequestTable table_;
    bridge::ConnectionSupervisor supervisor_;
    bridge::MessageRouter router_;
    PrivilegedDispatch dispatch_;
    bridge::LogBuffer log_buffer_;
    bridge::HostLogForwarder forwarder_;

    std::mutex commands_mutex_;
    std::map<protocol::MessageKind, CommandHandler> commands_;

    std::atomic<bool> busy_{false};
};

}  // namespace hostlink::host
