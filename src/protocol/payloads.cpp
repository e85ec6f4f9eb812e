#include "protocol/payloads.hpp"

namespace hostlink::protocol {

using nlohmann::json;

void to_json(json& j, const HelloPayload& p) {
    j = json{{"client", p.client},
             {"version", p.version},
             {"platform", p.platform},
             {"timestamp", p.timestamp}};
}

void from_json(const json& j, HelloPayload& p) {
    p.client = j.value("client", std::string());
    j.at("version").get_to(p.version);
    p.platform = j.value("platform", std::string());
    p.timestamp = j.value("timestamp", std::string());
}

void to_json(json& j, const WelcomePayload& p) {
    j = json{{"serverVersion", p.server_version},
             {"features", p.features},
             {"timestamp", p.timestamp}};
}

void from_json(const json& j, WelcomePayload& p) {
    j.at("serverVersion").get_to(p.server_version);
    p.features = j.value("features", std::vector<std::string>());
    p.timestamp = j.value("timestamp", std::string());
}

void to_json(json& j, const PingPayload& p) {
    j = json{{"timestamp", p.timestamp}};
}

void from_json(const json& j, PingPayload& p) {
    p.timestamp = j.value("timestamp", static_cast<std::int64_t>(0));
}

void to_json(json& j, const ExecuteCommandPayload& p) {
    j = json{{"code", p.code}};
}

void from_json(const json& j, ExecuteCommandPayload& p) {
    j.at("code").get_to(p.code);
}

void to_json(json& j, const ObjectDetailsRequest& p) {
    j = json{{"objectName", p.object_name}};
}

void from_json(const json& j, ObjectDetailsRequest& p) {
    j.at("objectName").get_to(p.object_name);
}

void to_json(json& j, const ManipulateScenePayload& p) {
    j = json{{"action", p.action}, {"name", p.name}, {"details", p.details}};
}

void from_json(const json& j, ManipulateScenePayload& p) {
    j.at("action").get_to(p.action);
    j.at("name").get_to(p.name);
    const auto details = j.find("details");
    p.details = (details != j.end() && !details->is_null()) ? *details : json::object();
}

void to_json(json& j, const ManageAssetsPayload& p) {
    j = json{{"action", p.action}};
    if (p.filter.has_value()) {
        j["filter"] = p.filter.value();
    }
}

void from_json(const json& j, ManageAssetsPayload& p) {
    j.at("action").get_to(p.action);
    const auto filter = j.find("filter");
    if (filter != j.end() && !filter->is_null()) {
        p.filter = filter->get<std::string>();
    } else {
        p.filter.reset();
    }
}

void to_json(json& j, const ScreenshotPayload& p) {
    j = json{{"base64", p.base64}, {"format", p.format}};
}

void from_json(const json& j, ScreenshotPayload& p) {
    j.at("base64").get_to(p.base64);
    p.format = j.value("format", std::string("jpg"));
}

void to_json(json& j, const HealthStatus& p) {
    j = json{{"status", p.status},
             {"version", p.version},
             {"websocketPort", p.websocket_port},
             {"healthPort", p.health_port},
             {"uptimeSeconds", p.uptime_seconds},
             {"connected", p.connected},
             {"timestamp", p.timestamp}};
}

void from_json(const json& j, HealthStatus& p) {
    j.at("status").get_to(p.status);
    p.version = j.value("version", std::string());
    p.websocket_port = j.value("websocketPort", static_cast<std::uint16_t>(0));
    p.health_port = j.value("healthPort", static_cast<std::uint16_t>(0));
    p.uptime_seconds = j.value("uptimeSeconds", static_cast<std::int64_t>(0));
    p.connected = j.value("connected", false);
    p.timestamp = j.value("timestamp", std::string());
}

}  // namespace hostlink::protocol
