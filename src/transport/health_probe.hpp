#pragma once

#include "transport/transport.hpp"

namespace hostlink::transport {

// Plain HTTP GET against the peer's health endpoint. The connection is used
// once and closed; it never carries bridge traffic.
class HttpHealthProbe : public HealthProbe {
public:
    core::errors::Result<protocol::HealthStatus> probe(
        const Endpoint& endpoint, std::chrono::milliseconds timeout) override;
};

// Interprets a health response. Exposed for tests.
core::errors::Result<protocol::HealthStatus> parse_health_response(unsigned status_code,
                                                                   const std::string& body);

}  // namespace hostlink::transport
