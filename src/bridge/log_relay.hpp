#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge/message_router.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/log_record.hpp"

namespace hostlink::bridge {

// Fixed-capacity ring of log records; the oldest record goes first.
class LogBuffer {
public:
    explicit LogBuffer(std::size_t capacity = 1000);

    void append(protocol::LogRecord record);
    std::vector<protocol::LogRecord> snapshot() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    void clear();

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<protocol::LogRecord> records_;
};

inline constexpr std::size_t kMaxLogCount = 1000;

struct LogQuery {
    std::set<protocol::Severity> severities;  // empty: every severity
    std::optional<std::string> message_contains;
    std::optional<std::string> stack_trace_contains;
    std::optional<std::chrono::system_clock::time_point> timestamp_after;   // inclusive
    std::optional<std::chrono::system_clock::time_point> timestamp_before;  // inclusive
    std::size_t count = 100;  // most recent N after filtering
    std::vector<std::string> fields;  // empty: every field
};

// Reads the get_logs tool arguments:
//   types, count, fields, messageContains, stackTraceContains,
//   timestampAfter, timestampBefore
core::errors::Result<LogQuery> parse_log_query(const nlohmann::json& arguments,
                                               std::size_t default_count = 100);

std::vector<protocol::LogRecord> filter_logs(const std::vector<protocol::LogRecord>& records,
                                             const LogQuery& query);

nlohmann::json project_logs(const std::vector<protocol::LogRecord>& records,
                            const std::vector<std::string>& fields);

nlohmann::json query_logs(const LogBuffer& buffer, const LogQuery& query);

// Host side: mirrors every process log event into a local buffer and, while
// the connection is usable, pushes it to the peer as a `log` envelope.
// Forwarding never logs: a failed push must not produce another event to
// forward.
class HostLogForwarder {
public:
    HostLogForwarder(MessageRouter& router, LogBuffer& buffer);
    ~HostLogForwarder();

    HostLogForwarder(const HostLogForwarder&) = delete;
    HostLogForwarder& operator=(const HostLogForwarder&) = delete;

    void attach();
    void detach();

    void forward(const core::logging::LogEvent& event);

    std::size_t forwarded() const;
    std::size_t failed() const;

private:
    MessageRouter& router_;
    LogBuffer& buffer_;
    mutable std::mutex mutex_;
    std::optional<std::size_t> listener_id_;
    std::size_t forwarded_ = 0;
    std::size_t failed_ = 0;
};

protocol::Severity severity_for(core::logging::LogLevel level);

// Tool-server side: stores every inbound `log` envelope.
class LogCollector {
public:
    LogCollector(MessageRouter& router, LogBuffer& buffer);
    ~LogCollector();

    LogCollector(const LogCollector&) = delete;
    LogCollector& operator=(const LogCollector&) = delete;

private:
    MessageRouter& router_;
    LogBuffer& buffer_;
};

}  // namespace hostlink::bridge
