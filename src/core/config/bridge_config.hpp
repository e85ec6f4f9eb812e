#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hostlink::core::config {

inline constexpr const char* kBridgeVersion = "0.2.0";

// Every tunable of both peers. Defaults are the protocol's reference values.
struct BridgeConfig {
    std::string host = "127.0.0.1";
    std::uint16_t websocket_port = 8080;
    std::uint16_t health_port = 8081;
    std::string websocket_path = "/";
    std::string health_path = "/health";

    std::chrono::milliseconds health_probe_timeout{2000};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds reconnect_interval{5000};
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds heartbeat_timeout{20000};

    std::chrono::milliseconds command_timeout{30000};
    std::chrono::milliseconds long_command_timeout{60000};

    std::size_t log_capacity = 1000;
    std::size_t default_log_count = 100;

    std::string version = kBridgeVersion;
    bool verbose = false;
};

}  // namespace hostlink::core::config
