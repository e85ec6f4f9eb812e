#include "bridge/message_router.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace hostlink::bridge {

MessageRouter::MessageRouter(ConnectionSupervisor& supervisor) : supervisor_(supervisor) {
    supervisor_.set_frame_handler(
        [this](const std::uint64_t generation, const transport::Frame& frame) {
            on_frame(generation, frame);
        });
}

MessageRouter::~MessageRouter() {
    supervisor_.set_frame_handler(nullptr);
}

void MessageRouter::on(const std::string& kind, EnvelopeHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[kind] = std::move(handler);
}

void MessageRouter::on(const protocol::MessageKind kind, EnvelopeHandler handler) {
    on(protocol::to_string(kind), std::move(handler));
}

void MessageRouter::off(const std::string& kind) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(kind);
}

void MessageRouter::on_frame(const std::uint64_t generation, const transport::Frame& frame) {
    std::string message;
    {
        std::lock_guard<std::mutex> lock(partial_mutex_);
        if (partial_generation_ != generation) {
            // Leftovers of a connection that is gone.
            partial_.clear();
            partial_generation_ = generation;
        }
        partial_ += frame.data;
        if (!frame.end_of_message) {
            return;
        }
        message.swap(partial_);
    }
    dispatch(message);
}

void MessageRouter::dispatch(const std::string& text) {
    auto decoded = protocol::decode_envelope(text);
    if (core::errors::is_error(decoded)) {
        decode_failures_.fetch_add(1);
        LOG_WARN("Dropping malformed message: " + core::errors::get_error(decoded).message);
        return;
    }
    const auto& envelope = core::errors::get_value(decoded);

    EnvelopeHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        const auto it = handlers_.find(envelope.kind);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        unhandled_messages_.fetch_add(1);
        LOG_WARN("Ignoring message of unhandled kind '" + envelope.kind + "'");
        return;
    }

    try {
        handler(envelope);
    } catch (const std::exception& e) {
        LOG_ERROR("Handler for '" + envelope.kind + "' failed: " + e.what());
    }
}

core::errors::Status MessageRouter::send(const protocol::MessageKind kind, nlohmann::json payload) {
    return send(protocol::make_envelope(kind, std::move(payload)));
}

core::errors::Status MessageRouter::send(const protocol::Envelope& envelope) {
    return supervisor_.send(protocol::encode_envelope(envelope));
}

}  // namespace hostlink::bridge
