#include "host/demo_scene.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>
#include <utility>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"
#include "host/host_bridge.hpp"
#include "protocol/payloads.hpp"

namespace hostlink::host {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr int kImageSize = 32;
constexpr double kWorldExtent = 16.0;

BridgeError failed(const std::string& message) {
    return BridgeError{ErrorCategory::Handler, message, "handler_failed"};
}

std::string base64_encode(const std::string& data) {
    using namespace boost::archive::iterators;
    using Encoder = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
    std::string encoded(Encoder(data.begin()), Encoder(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

std::string asset_guid(const std::string& path) {
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(path);
    return out.str();
}

json vector_json(const std::array<double, 3>& v) {
    return json{{"x", v[0]}, {"y", v[1]}, {"z", v[2]}};
}

// Accepts {x, y, z} with any subset of the axes; a missing key leaves target alone.
core::errors::Status read_vector(const json& details, const char* key,
                                 std::array<double, 3>& target) {
    const auto it = details.find(key);
    if (it == details.end() || it->is_null()) {
        return core::errors::ok();
    }
    if (!it->is_object()) {
        return failed(std::string("'") + key + "' must be an object with x, y and z.");
    }
    const char* axes[] = {"x", "y", "z"};
    for (int i = 0; i < 3; ++i) {
        const auto axis = it->find(axes[i]);
        if (axis == it->end()) {
            continue;
        }
        if (!axis->is_number()) {
            return failed(std::string("'") + key + "." + axes[i] + "' must be a number.");
        }
        target[i] = axis->get<double>();
    }
    return core::errors::ok();
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

}  // namespace

DemoScene::DemoScene() {
    create("Main Camera").components.insert("Camera");
    auto& light = create("Directional Light");
    light.components.insert("Light");
    light.rotation = {50.0, -30.0, 0.0};
    light.position = {0.0, 3.0, 0.0};
    auto& ground = create("Ground");
    ground.components.insert("MeshRenderer");
    ground.scale = {10.0, 1.0, 10.0};

    assets_ = {"Assets/Materials/Ground.mat", "Assets/Prefabs/Player.prefab",
               "Assets/Scenes/DemoScene.unity", "Assets/Scripts/PlayerController.cs",
               "Assets/Textures/Grid.png"};
}

SceneObject& DemoScene::create(const std::string& name) {
    auto& object = objects_[name];
    object = SceneObject{};
    object.name = name;
    object.instance_id = next_instance_id_++;
    return object;
}

SceneObject* DemoScene::find(const std::string& name) {
    const auto it = objects_.find(name);
    return it == objects_.end() ? nullptr : &it->second;
}

json DemoScene::describe(const SceneObject& object) const {
    return json{{"name", object.name},
                {"instanceId", object.instance_id},
                {"active", object.active},
                {"parent", object.parent.empty() ? json() : json(object.parent)},
                {"transform",
                 {{"position", vector_json(object.position)},
                  {"rotation", vector_json(object.rotation)},
                  {"scale", vector_json(object.scale)}}},
                {"components", object.components}};
}

bool DemoScene::playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_;
}

std::size_t DemoScene::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

// Line-oriented console: log/warn/error <text>, list, select <name>, play, stop.
// The result of the last line is returned.
WorkResult DemoScene::execute_command(const json& payload) {
    auto decoded = protocol::decode_payload<protocol::ExecuteCommandPayload>(payload);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }

    std::istringstream lines(core::errors::get_value(decoded).code);
    std::string line;
    json result;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const auto space = line.find(' ');
        const auto verb = line.substr(0, space);
        const auto argument = space == std::string::npos ? std::string() : trim(line.substr(space));

        if (verb == "log") {
            LOG_INFO(argument);
            result = argument;
        } else if (verb == "warn") {
            LOG_WARN(argument);
            result = argument;
        } else if (verb == "error") {
            LOG_ERROR(argument);
            result = argument;
        } else if (verb == "list") {
            std::lock_guard<std::mutex> lock(mutex_);
            result = json::array();
            for (const auto& entry : objects_) {
                result.push_back(entry.first);
            }
        } else if (verb == "select") {
            std::lock_guard<std::mutex> lock(mutex_);
            if (find(argument) == nullptr) {
                return failed("GameObject '" + argument + "' not found");
            }
            selected_ = argument;
            result = argument;
        } else if (verb == "play" || verb == "stop") {
            std::lock_guard<std::mutex> lock(mutex_);
            playing_ = verb == "play";
            result = playing_;
        } else {
            return failed("Unknown command: " + verb);
        }
    }
    return result;
}

WorkResult DemoScene::get_state(const json&) {
    std::lock_guard<std::mutex> lock(mutex_);
    json hierarchy = json::array();
    for (const auto& entry : objects_) {
        hierarchy.push_back(json{{"name", entry.second.name},
                                 {"instanceId", entry.second.instance_id},
                                 {"active", entry.second.active},
                                 {"parent", entry.second.parent}});
    }
    return json{{"activeScene", "DemoScene"},
                {"playMode", playing_},
                {"selectedObjects", selected_.empty() ? json::array() : json::array({selected_})},
                {"sceneHierarchy", hierarchy},
                {"projectName", "hostlink-demo"},
                {"timestamp", core::time::format_iso8601(std::chrono::system_clock::now())}};
}

WorkResult DemoScene::get_object_details(const json& payload) {
    auto decoded = protocol::decode_payload<protocol::ObjectDetailsRequest>(payload);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    const auto& name = core::errors::get_value(decoded).object_name;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto* object = find(name);
    if (object == nullptr) {
        return failed("GameObject '" + name + "' not found");
    }
    return describe(*object);
}

// P6 pixmap, top-down over x/z: grey floor, one white pixel per active object.
std::string DemoScene::render_top_down() const {
    std::string pixels(kImageSize * kImageSize * 3, static_cast<char>(64));
    for (const auto& entry : objects_) {
        const auto& object = entry.second;
        if (!object.active) {
            continue;
        }
        const auto to_pixel = [](const double world) {
            const double normalized = (world + kWorldExtent) / (2.0 * kWorldExtent);
            return static_cast<int>(std::floor(normalized * kImageSize));
        };
        const int px = to_pixel(object.position[0]);
        const int py = kImageSize - 1 - to_pixel(object.position[2]);
        if (px < 0 || px >= kImageSize || py < 0 || py >= kImageSize) {
            continue;
        }
        const auto offset = static_cast<std::size_t>((py * kImageSize + px) * 3);
        pixels[offset] = pixels[offset + 1] = pixels[offset + 2] = static_cast<char>(255);
    }
    std::ostringstream image;
    image << "P6\n" << kImageSize << " " << kImageSize << "\n255\n" << pixels;
    return image.str();
}

WorkResult DemoScene::take_screenshot(const json&) {
    std::string image;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        image = render_top_down();
    }
    protocol::ScreenshotPayload screenshot;
    screenshot.base64 = base64_encode(image);
    screenshot.format = "ppm";
    return json(screenshot);
}

WorkResult DemoScene::manipulate_scene(const json& payload) {
    auto decoded = protocol::decode_payload<protocol::ManipulateScenePayload>(payload);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    const auto& request = core::errors::get_value(decoded);
    const auto& details = request.details;

    std::lock_guard<std::mutex> lock(mutex_);
    if (request.action == "create_game_object") {
        SceneObject candidate;
        const std::pair<const char*, std::array<double, 3>*> fields[] = {
            {"position", &candidate.position},
            {"rotation", &candidate.rotation},
            {"scale", &candidate.scale}};
        for (const auto& field : fields) {
            const auto read = read_vector(details, field.first, *field.second);
            if (core::errors::is_error(read)) {
                return core::errors::get_error(read);
            }
        }
        auto& object = create(request.name);
        object.position = candidate.position;
        object.rotation = candidate.rotation;
        object.scale = candidate.scale;
        const auto parent = details.find("parent");
        if (parent != details.end() && parent->is_string() && find(parent->get<std::string>())) {
            object.parent = parent->get<std::string>();
        }
        const auto components = details.find("components");
        if (components != details.end() && components->is_array()) {
            for (const auto& component : *components) {
                if (component.is_string()) {
                    object.components.insert(component.get<std::string>());
                }
            }
        }
        return json{{"message", "Created GameObject '" + object.name + "'"},
                    {"instanceId", object.instance_id}};
    }

    auto* object = find(request.name);
    if (object == nullptr) {
        return failed("GameObject '" + request.name + "' not found");
    }

    if (request.action == "delete_game_object") {
        objects_.erase(request.name);
        for (auto& entry : objects_) {
            if (entry.second.parent == request.name) {
                entry.second.parent.clear();
            }
        }
        if (selected_ == request.name) {
            selected_.clear();
        }
        return json{{"message", "Deleted GameObject '" + request.name + "'"}};
    }

    if (request.action == "set_transform") {
        auto updated = *object;
        const std::pair<const char*, std::array<double, 3>*> fields[] = {
            {"newPosition", &updated.position},
            {"newRotation", &updated.rotation},
            {"newScale", &updated.scale}};
        for (const auto& field : fields) {
            const auto read = read_vector(details, field.first, *field.second);
            if (core::errors::is_error(read)) {
                return core::errors::get_error(read);
            }
        }
        *object = updated;
        return json{{"message", "Updated transform for '" + object->name + "'"}};
    }

    if (request.action == "manage_component") {
        const auto component = details.value("componentName", std::string());
        if (component.empty()) {
            return failed("Component name required");
        }
        const auto action = details.value("componentAction", std::string());
        if (action == "add") {
            object->components.insert(component);
            return json{{"message", "Added component '" + component + "' to '" + object->name + "'"}};
        }
        if (action == "remove") {
            if (object->components.erase(component) == 0) {
                return failed("Component '" + component + "' not found on '" + object->name + "'");
            }
            return json{{"message",
                         "Removed component '" + component + "' from '" + object->name + "'"}};
        }
        return failed("Invalid component action");
    }

    return failed("Unknown action: " + request.action);
}

WorkResult DemoScene::manage_assets(const json& payload) {
    auto decoded = protocol::decode_payload<protocol::ManageAssetsPayload>(payload);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    const auto& request = core::errors::get_value(decoded);

    if (request.action == "refresh") {
        return json{{"message", "Asset database refreshed"}};
    }
    if (request.action != "search") {
        return failed("Unknown action: " + request.action);
    }

    const auto filter = request.filter.value_or("");
    std::lock_guard<std::mutex> lock(mutex_);
    json results = json::array();
    for (const auto& path : assets_) {
        if (path.find(filter) != std::string::npos) {
            results.push_back(json{{"guid", asset_guid(path)}, {"path", path}});
        }
    }
    return json{{"count", results.size()}, {"results", results}};
}

void DemoScene::install(HostBridge& bridge) {
    using protocol::MessageKind;
    bridge.register_command(MessageKind::ExecuteCommand,
                            [this](const json& payload) { return execute_command(payload); });
    bridge.register_command(MessageKind::GetState,
                            [this](const json& payload) { return get_state(payload); });
    bridge.register_command(MessageKind::GetObjectDetails,
                            [this](const json& payload) { return get_object_details(payload); });
    bridge.register_command(MessageKind::TakeScreenshot,
                            [this](const json& payload) { return take_screenshot(payload); });
    bridge.register_command(MessageKind::ManipulateScene,
                            [this](const json& payload) { return manipulate_scene(payload); });
    bridge.register_command(MessageKind::ManageAssets,
                            [this](const json& payload) { return manage_assets(payload); });
}

}  // namespace hostlink::host
