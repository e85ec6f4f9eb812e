#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace hostlink::app::cli {

    using namespace hostlink::core::errors;
    using hostlink::core::config::BridgeConfig;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> health_port;
            std::optional<std::string> log_capacity;
            bool verbose = false;
        };

        // Exception-free integer parsing with inclusive bounds
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min || value > max) {
                return BridgeError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    } // namespace

    Result<BridgeConfig> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--health-port") {
                if (i + 1 < args.size()) raw.health_port = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --health-port", "missing_value"};
            } else if (args[i] == "--log-capacity") {
                if (i + 1 < args.size()) raw.log_capacity = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --log-capacity", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                   "Supported flags: --host, --port, --health-port, --log-capacity, --verbose."};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        BridgeConfig config;
        config.verbose = raw.verbose;

        if (raw.host) {
            if (raw.host->empty()) {
                return BridgeError{ErrorCategory::Input, "--host cannot be empty", "missing_value"};
            }
            config.host = raw.host.value();
        }

        if (raw.port) {
            auto port = parse_bounded("--port", raw.port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.websocket_port = static_cast<std::uint16_t>(get_value(port));
        }

        if (raw.health_port) {
            auto port = parse_bounded("--health-port", raw.health_port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.health_port = static_cast<std::uint16_t>(get_value(port));
        }

        if (config.websocket_port == config.health_port) {
            return BridgeError{ErrorCategory::Input, "--port and --health-port must differ", "bounds_error"};
        }

        if (raw.log_capacity) {
            auto capacity = parse_bounded("--log-capacity", raw.log_capacity.value(), 1, 100000);
            if (is_error(capacity)) return get_error(capacity);
            config.log_capacity = get_value(capacity);
        }

        return config;
    }

} // namespace hostlink::app::cli
