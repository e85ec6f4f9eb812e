#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/mcp_stdio_server.hpp"
#include "server/tool_server.hpp"

int main(int argc, char* argv[]) {
    using hostlink::core::logging::Logger;
    using hostlink::core::logging::LogLevel;

    // 1. Tag every log line with this process's identity
    Logger::get().set_session_id(hostlink::core::config::generate_session_id("server"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = hostlink::app::cli::parse_and_validate(argc, argv);
    if (hostlink::core::errors::is_error(parsed)) {
        const auto& err = hostlink::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = hostlink::core::errors::get_value(parsed);
    if (config.verbose) {
        Logger::get().set_min_level(LogLevel::DEBUG);
    }

    // 3. Bind the WebSocket and health endpoints
    hostlink::server::ToolServer server(config);
    auto started = server.start();
    if (hostlink::core::errors::is_error(started)) {
        const auto& err = hostlink::core::errors::get_error(started);
        LOG_ERROR("Failed to start tool server [" + err.code + "]: " + err.message);
        return 3;
    }
    LOG_INFO("hostlink " + config.version + " listening on ws://" + config.host + ":" +
             std::to_string(server.websocket_port()) + ", health on http://" + config.host + ":" +
             std::to_string(server.health_port()) + config.health_path);

    // 4. Serve tool calls on stdio until the client goes away
    std::ios::sync_with_stdio(false);
    hostlink::server::McpStdioServer stdio(server.tools(), config.version);
    const int exit_code = stdio.run(std::cin, std::cout);

    LOG_INFO("Tool client disconnected, shutting down.");
    server.stop();
    return exit_code;
}
