#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "host/demo_scene.hpp"
#include "host/host_bridge.hpp"
#include "transport/health_probe.hpp"
#include "transport/websocket_transport.hpp"

namespace {

std::atomic<bool> g_running{true};

extern "C" void handle_signal(int) {
    g_running.store(false);
}

}  // namespace

int main(int argc, char* argv[]) {
    using hostlink::core::logging::Logger;
    using hostlink::core::logging::LogLevel;

    // 1. Tag every log line with this process's identity
    Logger::get().set_session_id(hostlink::core::config::generate_session_id("host"));

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

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // 3. Wire the bridge to the in-memory scene
    hostlink::host::HostBridge bridge(config,
                                      std::make_shared<hostlink::transport::WebSocketTransportFactory>(),
                                      std::make_shared<hostlink::transport::HttpHealthProbe>());
    hostlink::host::DemoScene scene;
    scene.install(bridge);

    LOG_INFO("Demo host connecting to ws://" + config.host + ":" +
             std::to_string(config.websocket_port) + config.websocket_path);
    bridge.start();

    // 4. The host's scheduling loop is the privileged context
    constexpr auto kPumpInterval = std::chrono::milliseconds(100);
    while (g_running.load()) {
        bridge.pump(hostlink::bridge::Clock::now());
        std::this_thread::sleep_for(kPumpInterval);
    }

    LOG_INFO("Demo host shutting down.");
    bridge.shutdown();
    return 0;
}
