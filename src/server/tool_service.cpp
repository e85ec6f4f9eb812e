#include "server/tool_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace hostlink::server {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::MessageKind;

namespace {

const char* const kSceneActions[] = {"create_game_object", "delete_game_object",
                                     "set_transform", "manage_component"};
const char* const kAssetActions[] = {"search", "refresh"};

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](const unsigned char c) { return std::isspace(c) != 0; });
}

template <std::size_t N>
bool one_of(const std::string& value, const char* const (&options)[N]) {
    return std::find_if(std::begin(options), std::end(options),
                        [&](const char* option) { return value == option; }) !=
           std::end(options);
}

template <std::size_t N>
std::string join(const char* const (&options)[N]) {
    std::string joined;
    for (const char* option : options) {
        joined += joined.empty() ? option : std::string(", ") + option;
    }
    return joined;
}

BridgeError missing(const std::string& name) {
    return BridgeError{ErrorCategory::Input, "The " + name + " parameter is required.",
                       "missing_argument"};
}

BridgeError invalid(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "invalid_argument"};
}

}  // namespace

ToolService::ToolService(bridge::RequestCorrelator& correlator,
                         bridge::ConnectionSupervisor& supervisor, const bridge::LogBuffer& logs,
                         const std::size_t default_log_count)
    : correlator_(correlator),
      supervisor_(supervisor),
      logs_(logs),
      default_log_count_(default_log_count) {}

bool ToolService::peer_connected() const {
    return supervisor_.is_usable();
}

core::errors::Status ToolService::require_peer() const {
    if (!peer_connected()) {
        return BridgeError{ErrorCategory::Transport, "Host is not connected.",
                           "peer_not_connected",
                           "Start the host application with the bridge enabled."};
    }
    return core::errors::ok();
}

core::errors::Result<json> ToolService::execute_command(const std::string& code) {
    if (code.empty() || is_blank(code)) {
        return BridgeError{ErrorCategory::Input,
                           "The code parameter is required and cannot be empty.",
                           "missing_argument"};
    }
    if (const auto peer = require_peer(); core::errors::is_error(peer)) {
        return core::errors::get_error(peer);
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = correlator_.request(MessageKind::ExecuteCommand,
                                      protocol::ExecuteCommandPayload{code});
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count();

    json response;
    response["result"] = core::errors::get_value(result);
    response["executionTime"] = std::to_string(elapsed) + "ms";
    response["status"] = "success";
    return response;
}

core::errors::Result<json> ToolService::get_state(const std::string& format) {
    if (format != "Raw") {
        return invalid("Invalid format: \"" + format + "\". Valid formats are: Raw");
    }
    if (const auto peer = require_peer(); core::errors::is_error(peer)) {
        return core::errors::get_error(peer);
    }
    return correlator_.request(MessageKind::GetState, json::object());
}

core::errors::Result<json> ToolService::get_object_details(const std::string& object_name) {
    if (object_name.empty()) {
        return missing("objectName");
    }
    if (const auto peer = require_peer(); core::errors::is_error(peer)) {
        return core::errors::get_error(peer);
    }
    return correlator_.request(MessageKind::GetObjectDetails,
                               protocol::ObjectDetailsRequest{object_name});
}

core::errors::Result<protocol::ScreenshotPayload> ToolService::take_screenshot() {
    if (const auto peer = require_peer(); core::errors::is_error(peer)) {
        return core::errors::get_error(peer);
    }
    auto result = correlator_.request(MessageKind::TakeScreenshot, json::object());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return protocol::decode_payload<protocol::ScreenshotPayload>(core::errors::get_value(result));
}

core::errors::Result<json> ToolService::manipulate_scene(const std::string& action,
                                                         const std::string& name,
                                                         const json& details) {
    if (action.empty()) {
        return missing("action");
    }
    if (!one_of(action, kSceneActions)) {
        return invalid("Unknown action '" + action + "'. Valid actions are: " +
                       join(kSceneActions));
    }
    if (name.empty()) {
        return missing("name");
    }
    if (!details.is_null() && !details.is_object()) {
        return invalid("'details' must be an object.");
    }
    if (const auto peer = require_peer(); core::errors::is_error(peer)) {
        return core::errors::get_error(peer);
    }

    protocol::ManipulateScenePayload payload;
    payload.action = action;
    payload.name = name;
    payload.details = details.is_null() ? json::object() : details;
    return correlator_.request(MessageKind::ManipulateScene, payload);
}

core::errors::Result<json> ToolService::manage_assets(const std::string& action,
                                                      const std::optional<std::string>& filter) {
    if (action.empty()) {
        return missing("action");
    }
    if (!one_of(action, kAssetActions)) {
        return invalid("Unknown action '" + action + "'. Valid actions are: " +
                       join(kAssetActions));
    }
    if (action == "search" && filter.value_or("").empty()) {
        return BridgeError{ErrorCategory::Input, "'filter' is required for search action.",
                           "missing_argument"};
    }
    if (const auto peer = require_peer(); core::errors::is_error(peer)) {
        return core::errors::get_error(peer);
    }

    protocol::ManageAssetsPayload payload;
    payload.action = action;
    payload.filter = filter;
    return correlator_.request(MessageKind::ManageAssets, payload);
}

core::errors::Result<json> ToolService::get_logs(const json& arguments) {
    auto query = bridge::parse_log_query(arguments, default_log_count_);
    if (core::errors::is_error(query)) {
        return core::errors::get_error(query);
    }
    return bridge::query_logs(logs_, core::errors::get_value(query));
}

}  // namespace hostlink::server
