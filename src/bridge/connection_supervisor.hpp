#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/payloads.hpp"
#include "transport/transport.hpp"

namespace hostlink::bridge {

enum class ConnectionState { Idle, HealthChecking, Connecting, Handshaking, Open, Closing, Failed };

std::string to_string(ConnectionState state);

// Initiating peers dial out, gate on health, send hello and run the
// heartbeat. Accepting peers adopt connections handed to them and stay
// passive on heartbeats.
enum class PeerRole { Initiating, Accepting };

using Clock = std::chrono::steady_clock;
using ClockFn = std::function<Clock::time_point()>;

struct SupervisorOptions {
    PeerRole role = PeerRole::Initiating;
    transport::Endpoint websocket_endpoint;
    transport::Endpoint health_endpoint;

    std::chrono::milliseconds health_probe_timeout{2000};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds reconnect_interval{5000};
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds heartbeat_timeout{20000};

    // Identity carried in hello. The timestamp is filled in at send time.
    protocol::HelloPayload hello;

    ClockFn clock = [] { return Clock::now(); };

    static SupervisorOptions from_config(const core::config::BridgeConfig& config,
                                         PeerRole role);
};

using FrameHandler = std::function<void(std::uint64_t generation, const transport::Frame& frame)>;
using DisconnectListener = std::function<void(const core::errors::BridgeError& reason)>;

// Owns the one logical connection of a peer and its lifecycle:
//
//   Idle -> HealthChecking -> Connecting -> Handshaking -> Open
//   Open -> Closing -> Failed -> Idle   (heartbeat timeout, send/receive failure)
//
// Every accepted or opened transport gets a new generation number. Work tied
// to a connection (its receive loop, its frames) carries that number, so a
// late failure of an old connection never tears down a newer one.
//
// Thread safety: all public methods may be called from any thread. Frames are
// delivered to the frame handler on the connection's receive thread, in
// arrival order.
class ConnectionSupervisor {
public:
    // Initiating role.
    ConnectionSupervisor(SupervisorOptions options,
                         std::shared_ptr<transport::TransportFactory> factory,
                         std::shared_ptr<transport::HealthProbe> probe);
    // Accepting role.
    explicit ConnectionSupervisor(SupervisorOptions options);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Starts one connection attempt on a background thread. While an attempt
    // is in flight every caller receives the same future; while Open the
    // future is already satisfied.
    std::shared_future<core::errors::Status> connect();

    // Accepting role: adopts a handshaken transport, replacing any previous one.
    core::errors::Status accept(std::shared_ptr<transport::Transport> transport);

    // Aborts the current transport (no close handshake) and notifies the
    // disconnect listeners with the reason.
    void disconnect(const core::errors::BridgeError& reason);

    // Reconnect and heartbeat cadence. Call on a fixed schedule.
    void tick(Clock::time_point now);

    // Writes one complete text frame. Writes are serialized. A failed write
    // forces a disconnect and is reported as send_failed.
    core::errors::Status send(const std::string& text);

    void record_pong();

    void set_frame_handler(FrameHandler handler);
    std::size_t add_disconnect_listener(DisconnectListener listener);
    void remove_disconnect_listener(std::size_t id);

    ConnectionState state() const;
    bool is_usable() const;
    std::optional<core::errors::BridgeError> last_error() const;
    std::size_t connection_attempts() const { return connection_attempts_.load(); }
    std::uint64_t generation() const;
    PeerRole role() const { return options_.role; }

    // Tears down the connection and joins every thread this object started.
    // Owners call it before destroying whatever the handlers reference.
    void shutdown();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_future<core::errors::Status> connect_at(Clock::time_point now);
    void run_attempt(std::shared_ptr<std::promise<core::errors::Status>> promise);
    void fail_attempt(const std::shared_ptr<std::promise<core::errors::Status>>& promise,
                      const core::errors::BridgeError& error);
    core::errors::Status send_hello(const std::shared_ptr<transport::Transport>& transport);
    bool disconnect_generation(std::uint64_t generation, const core::errors::BridgeError& reason);
    void notify_disconnect(const core::errors::BridgeError& reason);
    void read_loop(std::uint64_t generation, std::shared_ptr<transport::Transport> transport);
    bool spawn(std::function<void()> body);

    SupervisorOptions options_;
    std::shared_ptr<transport::TransportFactory> factory_;
    std::shared_ptr<transport::HealthProbe> probe_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Idle;
    std::shared_ptr<transport::Transport> transport_;
    std::uint64_t generation_ = 0;
    std::optional<Clock::time_point> last_attempt_;
    Clock::time_point last_pong_{};
    Clock::time_point last_ping_{};
    std::optional<core::errors::BridgeError> last_error_;
    std::shared_future<core::errors::Status> pending_connect_;
    bool shutting_down_ = false;

    std::atomic<std::size_t> connection_attempts_{0};

    std::mutex send_mutex_;

    std::mutex listeners_mutex_;
    FrameHandler frame_handler_;
    std::size_t next_listener_id_ = 1;
    std::vector<std::pair<std::size_t, DisconnectListener>> disconnect_listeners_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    bool workers_closed_ = false;
};

}  // namespace hostlink::bridge
