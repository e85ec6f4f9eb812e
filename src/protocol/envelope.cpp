#include "protocol/envelope.hpp"

#include <array>
#include <utility>

namespace hostlink::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

struct KindName {
    MessageKind kind;
    const char* name;
};

constexpr std::array<KindName, 17> kKindNames = {{
    {MessageKind::Hello, "hello"},
    {MessageKind::Welcome, "welcome"},
    {MessageKind::Ping, "ping"},
    {MessageKind::Pong, "pong"},
    {MessageKind::ExecuteCommand, "executeCommand"},
    {MessageKind::CommandResult, "commandResult"},
    {MessageKind::GetState, "getState"},
    {MessageKind::State, "state"},
    {MessageKind::GetObjectDetails, "getObjectDetails"},
    {MessageKind::ObjectDetails, "objectDetails"},
    {MessageKind::TakeScreenshot, "takeScreenshot"},
    {MessageKind::Screenshot, "screenshot"},
    {MessageKind::ManipulateScene, "manipulateScene"},
    {MessageKind::SceneManipulationResult, "sceneManipulationResult"},
    {MessageKind::ManageAssets, "manageAssets"},
    {MessageKind::AssetManagementResult, "assetManagementResult"},
    {MessageKind::Log, "log"},
}};

}  // namespace

std::string to_string(const MessageKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

MessageKind parse_message_kind(const std::string& name) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            return entry.kind;
        }
    }
    return MessageKind::Unknown;
}

Envelope make_envelope(const MessageKind kind, json payload) {
    Envelope envelope;
    envelope.kind = to_string(kind);
    envelope.payload = std::move(payload);
    return envelope;
}

std::string encode_envelope(const Envelope& envelope) {
    json wire;
    wire["kind"] = envelope.kind;
    wire["payload"] = envelope.payload;
    // Host strings are not guaranteed UTF-8; invalid bytes become U+FFFD.
    return wire.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<Envelope> decode_envelope(const std::string& text) {
    json wire = json::parse(text, nullptr, false);
    if (wire.is_discarded()) {
        return BridgeError{ErrorCategory::Protocol, "Frame is not valid JSON.",
                           "invalid_envelope"};
    }
    if (!wire.is_object()) {
        return BridgeError{ErrorCategory::Protocol, "Envelope must be a JSON object.",
                           "invalid_envelope"};
    }

    const auto kind_it = wire.find("kind");
    if (kind_it == wire.end() || !kind_it->is_string() ||
        kind_it->get_ref<const std::string&>().empty()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Envelope is missing a string 'kind'.",
                           "invalid_envelope"};
    }

    Envelope envelope;
    envelope.kind = kind_it->get<std::string>();
    const auto payload_it = wire.find("payload");
    if (payload_it != wire.end() && !payload_it->is_null()) {
        envelope.payload = std::move(*payload_it);
    }
    return envelope;
}

}  // namespace hostlink::protocol
