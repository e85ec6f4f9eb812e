#pragma once

#include <array>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "host/privileged_dispatch.hpp"

namespace hostlink::host {

class HostBridge;

struct SceneObject {
    std::string name;
    std::string parent;
    std::array<double, 3> position{0.0, 0.0, 0.0};
    std::array<double, 3> rotation{0.0, 0.0, 0.0};
    std::array<double, 3> scale{1.0, 1.0, 1.0};
    std::set<std::string> components{"Transform"};
    bool active = true;
    int instance_id = 0;
};

// A small editor stand-in: a flat list of named objects plus an asset list.
// Every handler runs on the privileged context and answers one command kind.
class DemoScene {
public:
    DemoScene();

    WorkResult execute_command(const nlohmann::json& payload);
    WorkResult get_state(const nlohmann::json& payload);
    WorkResult get_object_details(const nlohmann::json& payload);
    WorkResult take_screenshot(const nlohmann::json& payload);
    WorkResult manipulate_scene(const nlohmann::json& payload);
    WorkResult manage_assets(const nlohmann::json& payload);

    // Registers one handler per command kind on the bridge.
    void install(HostBridge& bridge);

    bool playing() const;
    std::size_t object_count() const;

private:
    SceneObject& create(const std::string& name);
    SceneObject* find(const std::string& name);
    nlohmann::json describe(const SceneObject& object) const;
    std::string render_top_down() const;

    mutable std::mutex mutex_;
    std::map<std::string, SceneObject> objects_;
    std::set<std::string> assets_;
    std::string selected_;
    bool playing_ = false;
    int next_instance_id_ = 1000;
};

}  // namespace hostlink::host
