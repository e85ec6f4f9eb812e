#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "bridge/connection_supervisor.hpp"
#include "protocol/envelope.hpp"

namespace hostlink::bridge {

using EnvelopeHandler = std::function<void(const protocol::Envelope& envelope)>;

// Frames in, envelopes out. Partial frames are stitched into one message
// before decoding; a malformed message or a kind nobody handles is logged and
// dropped without touching the connection.
class MessageRouter {
public:
    explicit MessageRouter(ConnectionSupervisor& supervisor);
    ~MessageRouter();

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    // Registering the same kind again replaces the previous handler.
    void on(const std::string& kind, EnvelopeHandler handler);
    void on(protocol::MessageKind kind, EnvelopeHandler handler);
    void off(const std::string& kind);

    void on_frame(std::uint64_t generation, const transport::Frame& frame);

    core::errors::Status send(protocol::MessageKind kind,
                              nlohmann::json payload = nlohmann::json::object());
    core::errors::Status send(const protocol::Envelope& envelope);

    ConnectionSupervisor& supervisor() { return supervisor_; }

    std::size_t decode_failures() const { return decode_failures_.load(); }
    std::size_t unhandled_messages() const { return unhandled_messages_.load(); }

private:
    void dispatch(const std::string& text);

    ConnectionSupervisor& supervisor_;

    std::mutex handlers_mutex_;
    std::map<std::string, EnvelopeHandler> handlers_;

    std::mutex partial_mutex_;
    std::uint64_t partial_generation_ = 0;
    std::string partial_;

    std::atomic<std::size_t> decode_failures_{0};
    std::atomic<std::size_t> unhandled_messages_{0};
};

}  // namespace hostlink::bridge
