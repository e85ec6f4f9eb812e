#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"
#include "fake_transport.hpp"
#include "host/demo_scene.hpp"
#include "host/host_bridge.hpp"
#include "server/tool_server.hpp"
#include "transport/health_probe.hpp"
#include "transport/websocket_transport.hpp"

namespace {

using namespace std::chrono_literals;
using hostlink::core::config::BridgeConfig;
using hostlink::core::errors::get_error;
using hostlink::core::errors::get_value;
using hostlink::core::errors::is_error;
using hostlink::host::DemoScene;
using hostlink::host::HostBridge;
using hostlink::server::ToolServer;
using hostlink::testing::wait_until;
using nlohmann::json;

BridgeConfig loopback_config() {
    BridgeConfig config;
    config.websocket_port = 0;
    config.health_port = 0;
    config.reconnect_interval = 200ms;
    config.command_timeout = 5000ms;
    return config;
}

// A tool server and a demo host talking over real loopback sockets. The host
// loop pumps on its own thread the way an editor's update callback would.
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<ToolServer>(loopback_config());
        const auto started = server_->start();
        ASSERT_FALSE(is_error(started)) << get_error(started).message;

        auto host_config = loopback_config();
        host_config.websocket_port = server_->websocket_port();
        host_config.health_port = server_->health_port();
        host_ = std::make_unique<HostBridge>(
            host_config, std::make_shared<hostlink::transport::WebSocketTransportFactory>(),
            std::make_shared<hostlink::transport::HttpHealthProbe>());
        scene_.install(*host_);
        host_->start();

        pumping_.store(true);
        pump_thread_ = std::thread([this] {
            while (pumping_.load()) {
                host_->pump(std::chrono::steady_clock::now());
                std::this_thread::sleep_for(5ms);
            }
        });

        ASSERT_TRUE(wait_until([this] { return server_->tools().peer_connected(); }, 5000ms));
    }

    void TearDown() override {
        pumping_.store(false);
        if (pump_thread_.joinable()) {
            pump_thread_.join();
        }
        if (host_) {
            host_->shutdown();
        }
        if (server_) {
            server_->stop();
        }
    }

    DemoScene scene_;
    std::unique_ptr<ToolServer> server_;
    std::unique_ptr<HostBridge> host_;
    std::atomic<bool> pumping_{false};
    std::thread pump_thread_;
};

TEST_F(EndToEndTest, HealthReportsConnectedHost) {
    const auto status = hostlink::transport::HttpHealthProbe().probe(
        {"127.0.0.1", server_->health_port(), "/health"}, 2000ms);

    ASSERT_FALSE(is_error(status)) << get_error(status).message;
    EXPECT_TRUE(get_value(status).connected);
    EXPECT_EQ(get_value(status).websocket_port, server_->websocket_port());
}

TEST_F(EndToEndTest, StateAndObjectRoundTrips) {
    auto& tools = server_->tools();

    const auto state = tools.get_state();
    ASSERT_FALSE(is_error(state)) << get_error(state).message;
    EXPECT_EQ(get_value(state)["activeScene"], "DemoScene");

    const auto created = tools.manipulate_scene(
        "create_game_object", "Cube", json{{"position", {{"x", 2.0}, {"y", 0.5}, {"z", -1.0}}}});
    ASSERT_FALSE(is_error(created)) << get_error(created).message;
    EXPECT_EQ(get_value(created)["message"], "Created GameObject 'Cube'");

    const auto details = tools.get_object_details("Cube");
    ASSERT_FALSE(is_error(details)) << get_error(details).message;
    EXPECT_EQ(get_value(details)["transform"]["position"]["x"], 2.0);

    const auto missing = tools.get_object_details("Ghost");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).message, "GameObject 'Ghost' not found");
    EXPECT_TRUE(tools.peer_connected());
}

TEST_F(EndToEndTest, ScreenshotTravelsAsBase64) {
    const auto screenshot = server_->tools().take_screenshot();

    ASSERT_FALSE(is_error(screenshot)) << get_error(screenshot).message;
    EXPECT_EQ(get_value(screenshot).format, "ppm");
    EXPECT_EQ(get_value(screenshot).base64.substr(0, 16), "UDYKMzIgMzIKMjU1");
}

TEST_F(EndToEndTest, HostLogsReachTheServer) {
    const auto executed = server_->tools().execute_command("warn low disk space");
    ASSERT_FALSE(is_error(executed)) << get_error(executed).message;
    EXPECT_EQ(get_value(executed)["result"], "low disk space");

    ASSERT_TRUE(wait_until([this] {
        const auto logs = server_->tools().get_logs(
            json{{"types", json::array({"Warning"})}, {"messageContains", "low disk space"}});
        return !is_error(logs) && get_value(logs).size() == 1;
    }));
}

TEST_F(EndToEndTest, HostReconnectsAfterServerDropsIt) {
    const auto attempts = host_->supervisor().connection_attempts();

    server_->supervisor().disconnect(hostlink::core::errors::BridgeError{
        hostlink::core::errors::ErrorCategory::Transport, "test drop", "connection_lost"});

    ASSERT_TRUE(wait_until(
        [&] {
            return host_->supervisor().connection_attempts() > attempts &&
                   server_->tools().peer_connected();
        },
        5000ms));
    const auto state = server_->tools().get_state();
    EXPECT_FALSE(is_error(state));
}

}  // namespace
