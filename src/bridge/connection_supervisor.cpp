#include "bridge/connection_supervisor.hpp"

#include <exception>
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"
#include "protocol/envelope.hpp"

namespace hostlink::bridge {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using core::errors::Status;

namespace {

std::string platform_name() {
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "macos";
#elif defined(_WIN32)
    return "windows";
#else
    return "unknown";
#endif
}

std::shared_future<Status> ready(Status status) {
    std::promise<Status> promise;
    promise.set_value(std::move(status));
    return promise.get_future().share();
}

std::string describe(const transport::Endpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port) + endpoint.path;
}

}  // namespace

std::string to_string(const ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:
            return "Idle";
        case ConnectionState::HealthChecking:
            return "HealthChecking";
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Handshaking:
            return "Handshaking";
        case ConnectionState::Open:
            return "Open";
        case ConnectionState::Closing:
            return "Closing";
        case ConnectionState::Failed:
            return "Failed";
        default:
            return "Unknown";
    }
}

SupervisorOptions SupervisorOptions::from_config(const core::config::BridgeConfig& config,
                                                 const PeerRole role) {
    SupervisorOptions options;
    options.role = role;
    options.websocket_endpoint = {config.host, config.websocket_port, config.websocket_path};
    options.health_endpoint = {config.host, config.health_port, config.health_path};
    options.health_probe_timeout = config.health_probe_timeout;
    options.connect_timeout = config.connect_timeout;
    options.reconnect_interval = config.reconnect_interval;
    options.heartbeat_interval = config.heartbeat_interval;
    options.heartbeat_timeout = config.heartbeat_timeout;
    options.hello.client = "hostlink";
    options.hello.version = config.version;
    options.hello.platform = platform_name();
    return options;
}

ConnectionSupervisor::ConnectionSupervisor(SupervisorOptions options,
                                           std::shared_ptr<transport::TransportFactory> factory,
                                           std::shared_ptr<transport::HealthProbe> probe)
    : options_(std::move(options)), factory_(std::move(factory)), probe_(std::move(probe)) {}

ConnectionSupervisor::ConnectionSupervisor(SupervisorOptions options)
    : options_(std::move(options)) {
    options_.role = PeerRole::Accepting;
}

ConnectionSupervisor::~ConnectionSupervisor() {
    shutdown();
}

std::shared_future<Status> ConnectionSupervisor::connect() {
    return connect_at(options_.clock());
}

std::shared_future<Status> ConnectionSupervisor::connect_at(const Clock::time_point now) {
    if (options_.role != PeerRole::Initiating || !factory_) {
        return ready(BridgeError{ErrorCategory::Internal,
                                 "Only the initiating peer opens connections.",
                                 "invalid_role"});
    }

    auto promise = std::make_shared<std::promise<Status>>();
    std::shared_future<Status> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return ready(BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.",
                                     "shutdown"});
        }
        switch (state_) {
            case ConnectionState::Open:
                return ready(core::errors::ok());
            case ConnectionState::HealthChecking:
            case ConnectionState::Connecting:
            case ConnectionState::Handshaking:
                return pending_connect_;
            case ConnectionState::Closing:
            case ConnectionState::Failed:
                return ready(BridgeError{ErrorCategory::Transport,
                                         "Previous connection is still being torn down.",
                                         "connection_closing"});
            case ConnectionState::Idle:
                break;
        }

        // Claim the attempt before anything can block.
        state_ = ConnectionState::HealthChecking;
        last_attempt_ = now;
        pending_connect_ = promise->get_future().share();
        future = pending_connect_;
    }

    if (!spawn([this, promise]() { run_attempt(promise); })) {
        fail_attempt(promise, BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.",
                                          "shutdown"});
    }
    return future;
}

void ConnectionSupervisor::run_attempt(std::shared_ptr<std::promise<Status>> promise) {
    if (probe_) {
        LOG_DEBUG("Health check against " + describe(options_.health_endpoint));
        const auto health = probe_->probe(options_.health_endpoint, options_.health_probe_timeout);
        if (core::errors::is_error(health)) {
            fail_attempt(promise, core::errors::get_error(health));
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            promise->set_value(BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.",
                                           "shutdown"});
            return;
        }
        state_ = ConnectionState::Connecting;
    }

    connection_attempts_.fetch_add(1);
    auto opened = factory_->open(options_.websocket_endpoint, options_.connect_timeout);
    if (core::errors::is_error(opened)) {
        fail_attempt(promise, core::errors::get_error(opened));
        return;
    }
    auto transport = std::get<std::shared_ptr<transport::Transport>>(std::move(opened));

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            generation = ++generation_;
            transport_ = transport;
            state_ = ConnectionState::Handshaking;
        }
    }
    if (generation == 0) {
        transport->abort();
        promise->set_value(BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.",
                                       "shutdown"});
        return;
    }

    if (!spawn([this, generation, transport]() { read_loop(generation, transport); })) {
        disconnect_generation(generation, BridgeError{ErrorCategory::Internal,
                                                      "Supervisor is shutting down.", "shutdown"});
        promise->set_value(BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.",
                                       "shutdown"});
        return;
    }

    const auto hello = send_hello(transport);
    if (core::errors::is_error(hello)) {
        disconnect_generation(generation, core::errors::get_error(hello));
        promise->set_value(core::errors::get_error(hello));
        return;
    }

    bool opened_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == generation && state_ == ConnectionState::Handshaking) {
            state_ = ConnectionState::Open;
            last_pong_ = options_.clock();
            last_ping_ = last_pong_;
            last_error_.reset();
            opened_now = true;
        }
    }
    if (!opened_now) {
        promise->set_value(BridgeError{ErrorCategory::Transport,
                                       "Connection dropped during handshake.",
                                       "connection_lost"});
        return;
    }

    LOG_INFO("Connected to " + describe(options_.websocket_endpoint));
    promise->set_value(core::errors::ok());
}

void ConnectionSupervisor::fail_attempt(const std::shared_ptr<std::promise<Status>>& promise,
                                        const BridgeError& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Failed;
        last_error_ = error;
        state_ = ConnectionState::Idle;
    }
    LOG_WARN("Connection attempt failed [" + error.code + "]: " + error.message);
    promise->set_value(error);
}

Status ConnectionSupervisor::send_hello(const std::shared_ptr<transport::Transport>& transport) {
    auto hello = options_.hello;
    hello.timestamp = core::time::format_iso8601(std::chrono::system_clock::now());
    const auto text =
        protocol::encode_envelope(protocol::make_envelope(protocol::MessageKind::Hello, hello));

    std::lock_guard<std::mutex> lock(send_mutex_);
    return transport->send_text(text);
}

core::errors::Status ConnectionSupervisor::accept(std::shared_ptr<transport::Transport> transport) {
    if (!transport) {
        return BridgeError{ErrorCategory::Internal, "Cannot adopt a null transport.",
                           "invalid_argument"};
    }

    std::uint64_t previous = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transport_) {
            previous = generation_;
        }
    }
    if (previous != 0) {
        disconnect_generation(previous, BridgeError{ErrorCategory::Transport,
                                                    "Replaced by a newer connection.",
                                                    "connection_replaced"});
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            generation = ++generation_;
            transport_ = transport;
            state_ = ConnectionState::Open;
            last_pong_ = options_.clock();
            last_ping_ = last_pong_;
            last_error_.reset();
        }
    }
    if (generation == 0) {
        transport->abort();
        return BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.", "shutdown"};
    }

    if (!spawn([this, generation, transport]() { read_loop(generation, transport); })) {
        disconnect_generation(generation, BridgeError{ErrorCategory::Internal,
                                                      "Supervisor is shutting down.", "shutdown"});
        return BridgeError{ErrorCategory::Internal, "Supervisor is shutting down.", "shutdown"};
    }
    return core::errors::ok();
}

void ConnectionSupervisor::disconnect(const BridgeError& reason) {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
    }
    disconnect_generation(generation, reason);
}

bool ConnectionSupervisor::disconnect_generation(const std::uint64_t generation,
                                                 const BridgeError& reason) {
    std::shared_ptr<transport::Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !transport_) {
            return false;
        }
        state_ = ConnectionState::Closing;
        transport = std::move(transport_);
        transport_.reset();
    }

    transport->abort();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Failed;
        last_error_ = reason;
        pending_connect_ = std::shared_future<Status>();
        state_ = ConnectionState::Idle;
    }

    LOG_WARN("Disconnected [" + reason.code + "]: " + reason.message);
    notify_disconnect(reason);
    return true;
}

void ConnectionSupervisor::notify_disconnect(const BridgeError& reason) {
    std::vector<DisconnectListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& entry : disconnect_listeners_) {
            listeners.push_back(entry.second);
        }
    }
    for (const auto& listener : listeners) {
        listener(reason);
    }
}

void ConnectionSupervisor::tick(const Clock::time_point now) {
    if (options_.role != PeerRole::Initiating) {
        return;
    }

    enum class Action { None, Connect, Ping, Expire };
    Action action = Action::None;
    std::uint64_t generation = 0;
    Clock::duration silence{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        generation = generation_;
        if (state_ == ConnectionState::Idle) {
            if (!last_attempt_.has_value() ||
                now - last_attempt_.value() >= options_.reconnect_interval) {
                action = Action::Connect;
            }
        } else if (state_ == ConnectionState::Open) {
            silence = now - last_pong_;
            if (silence > options_.heartbeat_timeout) {
                action = Action::Expire;
            } else if (now - last_ping_ >= options_.heartbeat_interval) {
                last_ping_ = now;
                action = Action::Ping;
            }
        }
    }

    switch (action) {
        case Action::Connect:
            connect_at(now);
            break;
        case Action::Expire: {
            const auto millis =
                std::chrono::duration_cast<std::chrono::milliseconds>(silence).count();
            disconnect_generation(
                generation,
                BridgeError{ErrorCategory::Timeout,
                            "No pong received for " + std::to_string(millis) + "ms.",
                            "heartbeat_timeout"});
            break;
        }
        case Action::Ping: {
            protocol::PingPayload ping;
            ping.timestamp = core::time::now_unix_ms();
            const auto sent = send(protocol::encode_envelope(
                protocol::make_envelope(protocol::MessageKind::Ping, ping)));
            if (core::errors::is_error(sent)) {
                LOG_DEBUG("Heartbeat ping not sent: " + core::errors::get_error(sent).message);
            }
            break;
        }
        case Action::None:
            break;
    }
}

Status ConnectionSupervisor::send(const std::string& text) {
    std::shared_ptr<transport::Transport> transport;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool writable =
            state_ == ConnectionState::Open || state_ == ConnectionState::Handshaking;
        if (!writable || !transport_) {
            return BridgeError{ErrorCategory::Transport, "Connection is not open.", "not_open"};
        }
        transport = transport_;
        generation = generation_;
    }

    Status result;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        result = transport->send_text(text);
    }
    if (core::errors::is_error(result)) {
        const auto error = core::errors::get_error(result);
        disconnect_generation(generation, error);
        return BridgeError{ErrorCategory::Transport, "Send failed: " + error.message,
                           "send_failed"};
    }
    return result;
}

void ConnectionSupervisor::record_pong() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_pong_ = options_.clock();
}

void ConnectionSupervisor::set_frame_handler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    frame_handler_ = std::move(handler);
}

std::size_t ConnectionSupervisor::add_disconnect_listener(DisconnectListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const std::size_t id = next_listener_id_++;
    disconnect_listeners_.emplace_back(id, std::move(listener));
    return id;
}

void ConnectionSupervisor::remove_disconnect_listener(const std::size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (auto it = disconnect_listeners_.begin(); it != disconnect_listeners_.end(); ++it) {
        if (it->first == id) {
            disconnect_listeners_.erase(it);
            return;
        }
    }
}

ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionSupervisor::is_usable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::Open && transport_ && transport_->is_open();
}

std::optional<BridgeError> ConnectionSupervisor::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::uint64_t ConnectionSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

void ConnectionSupervisor::read_loop(const std::uint64_t generation,
                                     std::shared_ptr<transport::Transport> transport) {
    while (true) {
        auto frame = transport->receive();
        if (core::errors::is_error(frame)) {
            disconnect_generation(generation, core::errors::get_error(frame));
            return;
        }

        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            handler = frame_handler_;
        }
        if (!handler) {
            continue;
        }
        try {
            handler(generation, core::errors::get_value(frame));
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Frame handler failed: ") + e.what());
        }
    }
}

bool ConnectionSupervisor::spawn(std::function<void()> body) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (workers_closed_) {
            return false;
        }
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(it->thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        workers_.push_back(Worker{std::thread([body = std::move(body), done]() {
                                      body();
                                      done->store(true);
                                  }),
                                  done});
    }
    for (auto& thread : finished) {
        thread.join();
    }
    return true;
}

void ConnectionSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
    }

    disconnect(BridgeError{ErrorCategory::Internal, "Supervisor shut down.", "shutdown"});

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_closed_ = true;
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.get_id() == std::this_thread::get_id()) {
            worker.thread.detach();
        } else if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace hostlink::bridge
