#pragma once

#include <future>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "server/tool_service.hpp"

namespace hostlink::server {

// Line-delimited JSON-RPC 2.0 on a pair of streams, exposing ToolService as
// MCP tools. tools/call requests run concurrently; everything else is
// answered inline. Output lines never interleave.
class McpStdioServer {
public:
    explicit McpStdioServer(ToolService& tools, std::string version = core::config::kBridgeVersion);
    ~McpStdioServer();

    McpStdioServer(const McpStdioServer&) = delete;
    McpStdioServer& operator=(const McpStdioServer&) = delete;

    // Serves until the input stream ends, then waits for in-flight calls.
    int run(std::istream& in, std::ostream& out);

    // should_respond is false for notifications.
    nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond);
    nlohmann::json handle_line(const std::string& line, bool& should_respond);

    // The tools/call result body: {content: [...], isError}.
    // Fails with unknown_tool or invalid_params when the call itself is malformed.
    core::errors::Result<nlohmann::json> call_tool(const std::string& name,
                                                   const nlohmann::json& arguments);

    static nlohmann::json tool_definitions();

private:
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);

    void write_line(std::ostream& out, const nlohmann::json& message);
    void reap(bool wait_all);

    ToolService& tools_;
    std::string version_;

    std::mutex out_mutex_;
    std::vector<std::future<void>> calls_;
};

}  // namespace hostlink::server
