#include "server/mcp_stdio_server.hpp"

#include <chrono>
#include <exception>
#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace hostlink::server {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

json rpc_result(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json rpc_error(const json& id, const int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json text_content(const std::string& text) {
    return json{{"type", "text"}, {"text", text}};
}

std::string dump_text(const json& value, const int indent = -1) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

json tool_success(const json& value) {
    return json{{"content", json::array({text_content(dump_text(value, 2))})},
                {"isError", false}};
}

json tool_failure(const BridgeError& error) {
    const json body{{"error", error.message}, {"code", error.code}, {"status", "error"}};
    return json{{"content", json::array({text_content(dump_text(body, 2))})}, {"isError", true}};
}

json schema(json properties, const std::vector<std::string>& required) {
    json result{{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) {
        result["required"] = required;
    }
    return result;
}

std::string image_mime_type(const std::string& format) {
    if (format == "png") {
        return "image/png";
    }
    if (format == "ppm") {
        return "image/x-portable-pixmap";
    }
    return "image/jpeg";
}

BridgeError invalid_params(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "invalid_params"};
}

// Absent or null reads as empty so ToolService reports the missing argument;
// a value of the wrong type is a malformed call.
core::errors::Result<std::string> string_argument(const json& arguments, const char* name) {
    const auto it = arguments.find(name);
    if (it == arguments.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return invalid_params(std::string("'") + name + "' must be a string.");
    }
    return it->get<std::string>();
}

}  // namespace

McpStdioServer::McpStdioServer(ToolService& tools, std::string version)
    : tools_(tools), version_(std::move(version)) {}

McpStdioServer::~McpStdioServer() {
    reap(true);
}

json McpStdioServer::tool_definitions() {
    json tools = json::array();

    tools.push_back(
        {{"name", "execute_editor_command"},
         {"description",
          "Execute code inside the host application's editor context and return its result."},
         {"inputSchema",
          schema({{"code", {{"type", "string"}, {"description", "The code to execute."}}}},
                 {"code"})}});

    tools.push_back(
        {{"name", "get_editor_state"},
         {"description", "Retrieve the current state of the host editor: scene hierarchy, "
                         "selection, play mode and project information."},
         {"inputSchema",
          schema({{"format",
                   {{"type", "string"}, {"enum", {"Raw"}}, {"description", "Output format."}}}},
                 {})}});

    tools.push_back(
        {{"name", "get_logs"},
         {"description", "Retrieve and filter log records forwarded by the host."},
         {"inputSchema",
          schema({{"types",
                   {{"type", "array"},
                    {"items",
                     {{"type", "string"},
                      {"enum", {"Log", "Warning", "Error", "Exception", "Assert"}}}}}},
                  {"count", {{"type", "integer"}, {"minimum", 1}, {"maximum", 1000}}},
                  {"fields",
                   {{"type", "array"},
                    {"items",
                     {{"type", "string"},
                      {"enum", {"message", "stackTrace", "severity", "timestamp"}}}}}},
                  {"messageContains", {{"type", "string"}}},
                  {"stackTraceContains", {{"type", "string"}}},
                  {"timestampAfter", {{"type", "string"}, {"format", "date-time"}}},
                  {"timestampBefore", {{"type", "string"}, {"format", "date-time"}}}},
                 {})}});

    tools.push_back(
        {{"name", "get_object_details"},
         {"description", "Inspect one scene object: transform, components and properties."},
         {"inputSchema",
          schema({{"objectName",
                   {{"type", "string"}, {"description", "Name of the object to inspect."}}}},
                 {"objectName"})}});

    tools.push_back({{"name", "take_screenshot"},
                     {"description", "Capture the host's current view as a JPEG image."},
                     {"inputSchema", schema(json::object(), {})}});

    tools.push_back(
        {{"name", "manipulate_scene"},
         {"description", "Create or delete objects, set transforms, or manage components."},
         {"inputSchema",
          schema({{"action",
                   {{"type", "string"},
                    {"enum",
                     {"create_game_object", "delete_game_object", "set_transform",
                      "manage_component"}}}},
                  {"name", {{"type", "string"}}},
                  {"details", {{"type", "object"}}}},
                 {"action", "name"})}});

    tools.push_back(
        {{"name", "manage_assets"},
         {"description", "Search for assets or refresh the asset database."},
         {"inputSchema",
          schema({{"action", {{"type", "string"}, {"enum", json::array({"search", "refresh"})}}},
                  {"filter",
                   {{"type", "string"},
                    {"description", "Search filter. Required when action is 'search'."}}}},
                 {"action"})}});

    return tools;
}

core::errors::Result<json> McpStdioServer::call_tool(const std::string& name,
                                                     const json& arguments) {
    if (!arguments.is_object()) {
        return invalid_params("Tool arguments must be an object.");
    }

    const auto finish = [](const core::errors::Result<json>& result) -> json {
        if (core::errors::is_error(result)) {
            return tool_failure(core::errors::get_error(result));
        }
        return tool_success(core::errors::get_value(result));
    };

    if (name == "execute_editor_command") {
        auto code = string_argument(arguments, "code");
        if (core::errors::is_error(code)) {
            return core::errors::get_error(code);
        }
        return finish(tools_.execute_command(core::errors::get_value(code)));
    }

    if (name == "get_editor_state") {
        auto format = string_argument(arguments, "format");
        if (core::errors::is_error(format)) {
            return core::errors::get_error(format);
        }
        const auto& value = core::errors::get_value(format);
        return finish(tools_.get_state(value.empty() ? "Raw" : value));
    }

    if (name == "get_logs") {
        return finish(tools_.get_logs(arguments));
    }

    if (name == "get_object_details") {
        auto object_name = string_argument(arguments, "objectName");
        if (core::errors::is_error(object_name)) {
            return core::errors::get_error(object_name);
        }
        return finish(tools_.get_object_details(core::errors::get_value(object_name)));
    }

    if (name == "take_screenshot") {
        const auto screenshot = tools_.take_screenshot();
        if (core::errors::is_error(screenshot)) {
            return tool_failure(core::errors::get_error(screenshot));
        }
        const auto& payload = core::errors::get_value(screenshot);
        const json image{{"type", "image"},
                         {"data", payload.base64},
                         {"mimeType", image_mime_type(payload.format)}};
        return json{{"content", json::array({image})}, {"isError", false}};
    }

    if (name == "manipulate_scene") {
        auto action = string_argument(arguments, "action");
        if (core::errors::is_error(action)) {
            return core::errors::get_error(action);
        }
        auto object_name = string_argument(arguments, "name");
        if (core::errors::is_error(object_name)) {
            return core::errors::get_error(object_name);
        }
        const auto details = arguments.find("details");
        return finish(tools_.manipulate_scene(core::errors::get_value(action),
                                              core::errors::get_value(object_name),
                                              details == arguments.end() ? json() : *details));
    }

    if (name == "manage_assets") {
        auto action = string_argument(arguments, "action");
        if (core::errors::is_error(action)) {
            return core::errors::get_error(action);
        }
        auto filter = string_argument(arguments, "filter");
        if (core::errors::is_error(filter)) {
            return core::errors::get_error(filter);
        }
        std::optional<std::string> filter_value;
        if (!core::errors::get_value(filter).empty()) {
            filter_value = core::errors::get_value(filter);
        }
        return finish(tools_.manage_assets(core::errors::get_value(action), filter_value));
    }

    return BridgeError{ErrorCategory::Input, "Unknown tool: " + name, "unknown_tool"};
}

json McpStdioServer::handle_initialize(const json& params) const {
    if (params.is_object() && params.contains("clientInfo")) {
        LOG_INFO("Tool client connected: " + params["clientInfo"].dump());
    }
    return json{{"protocolVersion", kProtocolVersion},
                {"capabilities", {{"tools", json::object()}}},
                {"serverInfo", {{"name", "hostlink"}, {"version", version_}}}};
}

json McpStdioServer::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return rpc_error(id, kInvalidParams, "tools/call requires a string 'name'.");
    }
    const auto name = params["name"].get<std::string>();
    const auto arguments_it = params.find("arguments");
    const json arguments = (arguments_it == params.end() || arguments_it->is_null())
                               ? json::object()
                               : *arguments_it;

    LOG_DEBUG("tools/call " + name);
    auto result = call_tool(name, arguments);
    if (core::errors::is_error(result)) {
        return rpc_error(id, kInvalidParams, core::errors::get_error(result).message);
    }
    return rpc_result(id, core::errors::get_value(result));
}

json McpStdioServer::handle_request(const json& request, bool& should_respond) {
    should_respond = true;
    if (!request.is_object()) {
        return rpc_error(nullptr, kInvalidRequest, "Request must be a JSON object.");
    }

    const auto id_it = request.find("id");
    const bool is_notification = id_it == request.end();
    const json id = is_notification ? json(nullptr) : *id_it;
    should_respond = !is_notification;

    const auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
        should_respond = true;
        return rpc_error(id, kInvalidRequest, "Request has no method.");
    }
    const auto method = method_it->get<std::string>();
    const auto params_it = request.find("params");
    const json params = params_it == request.end() ? json::object() : *params_it;

    if (method == "initialize") {
        return rpc_result(id, handle_initialize(params));
    }
    if (method == "notifications/initialized") {
        should_respond = false;
        return json();
    }
    if (method == "ping") {
        return rpc_result(id, json::object());
    }
    if (method == "tools/list") {
        return rpc_result(id, json{{"tools", tool_definitions()}});
    }
    if (method == "tools/call") {
        return handle_tools_call(id, params);
    }
    return rpc_error(id, kMethodNotFound, "Method not found: " + method);
}

json McpStdioServer::handle_line(const std::string& line, bool& should_respond) {
    const auto request = json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        should_respond = true;
        return rpc_error(nullptr, kParseError, "Parse error");
    }
    return handle_request(request, should_respond);
}

int McpStdioServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        const auto request = json::parse(line, nullptr, false);
        bool concurrent = false;
        if (!request.is_discarded() && request.is_object() && request.contains("id")) {
            const auto method_it = request.find("method");
            concurrent = method_it != request.end() && method_it->is_string() &&
                         method_it->get<std::string>() == "tools/call";
        }
        if (concurrent) {
            reap(false);
            calls_.push_back(std::async(std::launch::async, [this, request, &out]() {
                bool should_respond = true;
                json response;
                try {
                    response = handle_request(request, should_respond);
                } catch (const std::exception& e) {
                    LOG_ERROR(std::string("tools/call failed: ") + e.what());
                    response = rpc_error(request["id"], kInternalError, e.what());
                    should_respond = true;
                }
                if (should_respond) {
                    write_line(out, response);
                }
            }));
            continue;
        }

        bool should_respond = true;
        json response;
        try {
            response = handle_line(line, should_respond);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Request failed: ") + e.what());
            const json id = request.is_object() && request.contains("id") ? request["id"] : json();
            response = rpc_error(id, kInternalError, e.what());
            should_respond = true;
        }
        if (should_respond) {
            write_line(out, response);
        }
    }

    reap(true);
    return 0;
}

void McpStdioServer::write_line(std::ostream& out, const json& message) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out << dump_text(message) << '\n';
    out.flush();
}

void McpStdioServer::reap(const bool wait_all) {
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (wait_all ||
            it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            try {
                it->get();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("tools/call worker failed: ") + e.what());
            }
            it = calls_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace hostlink::server
