#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace hostlink::protocol {

// Every kind either peer knows how to route. Kinds outside this list still
// travel and route by name; they map to Unknown.
enum class MessageKind {
    Hello,
    Welcome,
    Ping,
    Pong,
    ExecuteCommand,
    CommandResult,
    GetState,
    State,
    GetObjectDetails,
    ObjectDetails,
    TakeScreenshot,
    Screenshot,
    ManipulateScene,
    SceneManipulationResult,
    ManageAssets,
    AssetManagementResult,
    Log,
    Unknown
};

std::string to_string(MessageKind kind);
MessageKind parse_message_kind(const std::string& name);

// The wire unit: {"kind": "...", "payload": {...}}. The payload stays an
// opaque JSON tree until the handler that owns the kind decodes it.
struct Envelope {
    std::string kind;
    nlohmann::json payload = nlohmann::json::object();

    MessageKind type() const { return parse_message_kind(kind); }
};

Envelope make_envelope(MessageKind kind, nlohmann::json payload = nlohmann::json::object());

std::string encode_envelope(const Envelope& envelope);
core::errors::Result<Envelope> decode_envelope(const std::string& text);

}  // namespace hostlink::protocol
