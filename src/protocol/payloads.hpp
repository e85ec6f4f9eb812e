#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace hostlink::protocol {

    // hello: sent by the initiating peer right after the transport opens
    struct HelloPayload {
        std::string client;
        std::string version;
        std::string platform;
        std::string timestamp;
    };

    // welcome: advisory answer to hello
    struct WelcomePayload {
        std::string server_version;
        std::vector<std::string> features;
        std::string timestamp;
    };

    // ping / pong
    struct PingPayload {
        std::int64_t timestamp = 0;
    };

    struct ExecuteCommandPayload {
        std::string code;
    };

    struct ObjectDetailsRequest {
        std::string object_name;
    };

    struct ManipulateScenePayload {
        std::string action;   // create_game_object, delete_game_object, set_transform, manage_component
        std::string name;
        nlohmann::json details = nlohmann::json::object();
    };

    struct ManageAssetsPayload {
        std::string action;   // search, refresh
        std::optional<std::string> filter;
    };

    // screenshot reply body
    struct ScreenshotPayload {
        std::string base64;
        std::string format = "jpg";
    };

    // Side-channel health document
    struct HealthStatus {
        std::string status;
        std::string version;
        std::uint16_t websocket_port = 0;
        std::uint16_t health_port = 0;
        std::int64_t uptime_seconds = 0;
        bool connected = false;
        std::string timestamp;

        bool healthy() const { return status == "healthy"; }
    };

    void to_json(nlohmann::json& j, const HelloPayload& p);
    void from_json(const nlohmann::json& j, HelloPayload& p);
    void to_json(nlohmann::json& j, const WelcomePayload& p);
    void from_json(const nlohmann::json& j, WelcomePayload& p);
    void to_json(nlohmann::json& j, const PingPayload& p);
    void from_json(const nlohmann::json& j, PingPayload& p);
    void to_json(nlohmann::json& j, const ExecuteCommandPayload& p);
    void from_json(const nlohmann::json& j, ExecuteCommandPayload& p);
    void to_json(nlohmann::json& j, const ObjectDetailsRequest& p);
    void from_json(const nlohmann::json& j, ObjectDetailsRequest& p);
    void to_json(nlohmann::json& j, const ManipulateScenePayload& p);
    void from_json(const nlohmann::json& j, ManipulateScenePayload& p);
    void to_json(nlohmann::json& j, const ManageAssetsPayload& p);
    void from_json(const nlohmann::json& j, ManageAssetsPayload& p);
    void to_json(nlohmann::json& j, const ScreenshotPayload& p);
    void from_json(const nlohmann::json& j, ScreenshotPayload& p);
    void to_json(nlohmann::json& j, const HealthStatus& p);
    void from_json(const nlohmann::json& j, HealthStatus& p);

    // Lazily decodes a payload into the structure owned by its handler.
    template <typename T>
    core::errors::Result<T> decode_payload(const nlohmann::json& payload) {
        try {
            return payload.get<T>();
        } catch (const nlohmann::json::exception& e) {
            return core::errors::BridgeError{core::errors::ErrorCategory::Protocol,
                                             std::string("Payload does not match schema: ") +
                                                 e.what(),
                                             "invalid_payload"};
        }
    }

} // namespace hostlink::protocol
