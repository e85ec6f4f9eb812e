#pragma once
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hostlink::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // One entry of the process-wide log stream, as seen by listeners.
    struct LogEvent {
        LogLevel level;
        std::string message;
        std::chrono::system_clock::time_point time;
    };

    using LogListener = std::function<void(const LogEvent&)>;

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // stdout belongs to the stdio tool protocol, so the default sink is stderr.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        std::size_t add_listener(LogListener listener) {
            std::lock_guard<std::mutex> lock(mutex_);
            const std::size_t id = next_listener_id_++;
            listeners_.emplace_back(id, std::move(listener));
            return id;
        }

        void remove_listener(std::size_t id) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                if (it->first == id) {
                    listeners_.erase(it);
                    return;
                }
            }
        }

        void log(LogLevel level, const std::string& message) {
            LogEvent event{level, message, std::chrono::system_clock::now()};
            std::vector<LogListener> listeners;
            {
                std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
                if (level < min_level_) {
                    return;
                }

                *out_ << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;

                listeners.reserve(listeners_.size());
                for (const auto& entry : listeners_) {
                    listeners.push_back(entry.second);
                }
            }

            // A listener that logs (or fails while forwarding) must not feed
            // its own output back into the listeners.
            thread_local bool in_listener = false;
            if (in_listener) {
                return;
            }
            struct ListenerScope {
                bool& flag;
                ~ListenerScope() { flag = false; }
            };
            in_listener = true;
            ListenerScope scope{in_listener};
            for (const auto& listener : listeners) {
                try {
                    listener(event);
                } catch (const std::exception& e) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    *out_ << "[" << level_to_string(LogLevel::ERROR) << "] "
                          << "Log listener failed: " << e.what() << std::endl;
                }
            }
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cerr;
        std::size_t next_listener_id_ = 1;
        std::vector<std::pair<std::size_t, LogListener>> listeners_;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) hostlink::core::logging::Logger::get().log(hostlink::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  hostlink::core::logging::Logger::get().log(hostlink::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  hostlink::core::logging::Logger::get().log(hostlink::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) hostlink::core::logging::Logger::get().log(hostlink::core::logging::LogLevel::ERROR, msg)

} // namespace hostlink::core::logging
