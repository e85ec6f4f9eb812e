#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "protocol/payloads.hpp"

namespace hostlink::transport {

    struct Endpoint {
        std::string host = "127.0.0.1";
        std::uint16_t port = 0;
        std::string path = "/";
    };

    // One transport-level text frame. A message may span several frames;
    // end_of_message marks the last one.
    struct Frame {
        std::string data;
        bool end_of_message = true;
    };

    // A single open, text-framed, full-duplex connection.
    // receive() may run on one thread while send_text() runs on another;
    // callers serialize send_text() among themselves.
    class Transport {
    public:
        virtual ~Transport() = default;

        virtual core::errors::Status send_text(const std::string& text) = 0;

        // Blocks until a frame arrives or the connection fails.
        virtual core::errors::Result<Frame> receive() = 0;

        // Immediate, non-graceful teardown. Unblocks a pending receive().
        virtual void abort() = 0;

        virtual bool is_open() const = 0;
    };

    class TransportFactory {
    public:
        virtual ~TransportFactory() = default;

        virtual core::errors::Result<std::shared_ptr<Transport>> open(
            const Endpoint& endpoint, std::chrono::milliseconds timeout) = 0;
    };

    // Out-of-band status probe against the peer's side channel.
    // Error codes: peer_unreachable, peer_unhealthy, gate_timeout.
    class HealthProbe {
    public:
        virtual ~HealthProbe() = default;

        virtual core::errors::Result<protocol::HealthStatus> probe(
            const Endpoint& endpoint, std::chrono::milliseconds timeout) = 0;
    };

} // namespace hostlink::transport
