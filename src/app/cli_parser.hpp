#pragma once
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace hostlink::app::cli {
    // Starts from the defaults in BridgeConfig and applies the given flags.
    hostlink::core::errors::Result<hostlink::core::config::BridgeConfig> parse_and_validate(int argc, char* argv[]);
}
