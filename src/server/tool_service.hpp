#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "bridge/connection_supervisor.hpp"
#include "bridge/log_relay.hpp"
#include "bridge/request_correlator.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/payloads.hpp"

namespace hostlink::server {

// One operation per command kind, for external callers of the tool server.
// Arguments are validated first; then a disconnected peer fails fast with
// peer_not_connected before anything is queued.
class ToolService {
public:
    ToolService(bridge::RequestCorrelator& correlator, bridge::ConnectionSupervisor& supervisor,
                const bridge::LogBuffer& logs, std::size_t default_log_count = 100);

    // {result, executionTime: "<n>ms", status: "success"}
    core::errors::Result<nlohmann::json> execute_command(const std::string& code);

    // Only the "Raw" format exists.
    core::errors::Result<nlohmann::json> get_state(const std::string& format = "Raw");

    core::errors::Result<nlohmann::json> get_object_details(const std::string& object_name);

    core::errors::Result<protocol::ScreenshotPayload> take_screenshot();

    core::errors::Result<nlohmann::json> manipulate_scene(const std::string& action,
                                                          const std::string& name,
                                                          const nlohmann::json& details);

    core::errors::Result<nlohmann::json> manage_assets(const std::string& action,
                                                       const std::optional<std::string>& filter);

    // Served from the local buffer; works while disconnected.
    core::errors::Result<nlohmann::json> get_logs(const nlohmann::json& arguments);

    bool peer_connected() const;

private:
    core::errors::Status require_peer() const;

    bridge::RequestCorrelator& correlator_;
    bridge::ConnectionSupervisor& supervisor_;
    const bridge::LogBuffer& logs_;
    std::size_t default_log_count_;
};

}  // namespace hostlink::server
