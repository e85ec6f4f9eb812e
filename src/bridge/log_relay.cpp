#include "bridge/log_relay.hpp"

#include <algorithm>
#include <utility>
#include "core/time/timestamps.hpp"

namespace hostlink::bridge {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

const std::vector<std::string> kLogFields = {"message", "stackTrace", "severity", "timestamp"};

BridgeError invalid_argument(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "invalid_argument"};
}

core::errors::Result<std::optional<std::string>> optional_string(const json& arguments,
                                                                 const char* name) {
    const auto it = arguments.find(name);
    if (it == arguments.end() || it->is_null()) {
        return std::optional<std::string>();
    }
    if (!it->is_string()) {
        return invalid_argument(std::string("'") + name + "' must be a string.");
    }
    return std::optional<std::string>(it->get<std::string>());
}

core::errors::Result<std::optional<std::chrono::system_clock::time_point>> optional_time(
    const json& arguments, const char* name) {
    auto text = optional_string(arguments, name);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    const auto& value = core::errors::get_value(text);
    if (!value.has_value() || value->empty()) {
        return std::optional<std::chrono::system_clock::time_point>();
    }
    const auto parsed = core::time::parse_iso8601(value.value());
    if (!parsed.has_value()) {
        return invalid_argument(std::string("'") + name + "' is not an ISO-8601 timestamp: " +
                                value.value());
    }
    return parsed;
}

}  // namespace

// 1. Ring buffer

LogBuffer::LogBuffer(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void LogBuffer::append(protocol::LogRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<protocol::LogRecord> LogBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<protocol::LogRecord>(records_.begin(), records_.end());
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// 2. Query

core::errors::Result<LogQuery> parse_log_query(const json& arguments,
                                               const std::size_t default_count) {
    LogQuery query;
    query.count = default_count;
    if (arguments.is_null()) {
        return query;
    }
    if (!arguments.is_object()) {
        return invalid_argument("Log query arguments must be an object.");
    }

    if (const auto types = arguments.find("types"); types != arguments.end() && !types->is_null()) {
        if (!types->is_array()) {
            return invalid_argument("'types' must be an array of severities.");
        }
        for (const auto& type : *types) {
            const auto severity = type.is_string()
                                      ? protocol::parse_severity(type.get<std::string>())
                                      : std::optional<protocol::Severity>();
            if (!severity.has_value()) {
                return invalid_argument("Unknown log type " + type.dump() +
                                        "; expected Log, Warning, Error, Exception or Assert.");
            }
            query.severities.insert(severity.value());
        }
    }

    if (const auto count = arguments.find("count"); count != arguments.end() && !count->is_null()) {
        if (!count->is_number_integer()) {
            return invalid_argument("'count' must be an integer.");
        }
        const auto value = count->get<long long>();
        if (value < 1 || value > static_cast<long long>(kMaxLogCount)) {
            return invalid_argument("'count' must be between 1 and " +
                                    std::to_string(kMaxLogCount) + ".");
        }
        query.count = static_cast<std::size_t>(value);
    }

    if (const auto fields = arguments.find("fields");
        fields != arguments.end() && !fields->is_null()) {
        if (!fields->is_array()) {
            return invalid_argument("'fields' must be an array of field names.");
        }
        for (const auto& field : *fields) {
            if (!field.is_string() || std::find(kLogFields.begin(), kLogFields.end(),
                                                field.get<std::string>()) == kLogFields.end()) {
                return invalid_argument("Unknown log field " + field.dump() +
                                        "; expected message, stackTrace, severity or timestamp.");
            }
            query.fields.push_back(field.get<std::string>());
        }
    }

    auto message = optional_string(arguments, "messageContains");
    if (core::errors::is_error(message)) {
        return core::errors::get_error(message);
    }
    auto stack_trace = optional_string(arguments, "stackTraceContains");
    if (core::errors::is_error(stack_trace)) {
        return core::errors::get_error(stack_trace);
    }
    // An empty needle filters nothing.
    if (core::errors::get_value(message).value_or("") != "") {
        query.message_contains = core::errors::get_value(message);
    }
    if (core::errors::get_value(stack_trace).value_or("") != "") {
        query.stack_trace_contains = core::errors::get_value(stack_trace);
    }

    auto after = optional_time(arguments, "timestampAfter");
    if (core::errors::is_error(after)) {
        return core::errors::get_error(after);
    }
    auto before = optional_time(arguments, "timestampBefore");
    if (core::errors::is_error(before)) {
        return core::errors::get_error(before);
    }
    query.timestamp_after = core::errors::get_value(after);
    query.timestamp_before = core::errors::get_value(before);

    return query;
}

std::vector<protocol::LogRecord> filter_logs(const std::vector<protocol::LogRecord>& records,
                                             const LogQuery& query) {
    std::vector<protocol::LogRecord> matched;
    for (const auto& record : records) {
        if (!query.severities.empty() && query.severities.count(record.severity) == 0) {
            continue;
        }
        if (query.message_contains.has_value() &&
            record.message.find(query.message_contains.value()) == std::string::npos) {
            continue;
        }
        if (query.stack_trace_contains.has_value() &&
            record.stack_trace.find(query.stack_trace_contains.value()) == std::string::npos) {
            continue;
        }
        if (query.timestamp_after.has_value() || query.timestamp_before.has_value()) {
            // Records with an unreadable timestamp pass the range filters.
            const auto when = core::time::parse_iso8601(record.timestamp);
            if (when.has_value()) {
                if (query.timestamp_after.has_value() &&
                    when.value() < query.timestamp_after.value()) {
                    continue;
                }
                if (query.timestamp_before.has_value() &&
                    when.value() > query.timestamp_before.value()) {
                    continue;
                }
            }
        }
        matched.push_back(record);
    }

    if (matched.size() > query.count) {
        matched.erase(matched.begin(),
                      matched.begin() + static_cast<std::ptrdiff_t>(matched.size() - query.count));
    }
    return matched;
}

json project_logs(const std::vector<protocol::LogRecord>& records,
                  const std::vector<std::string>& fields) {
    json result = json::array();
    for (const auto& record : records) {
        json full = record;
        if (fields.empty()) {
            result.push_back(std::move(full));
            continue;
        }
        json selected = json::object();
        for (const auto& field : fields) {
            selected[field] = full.at(field);
        }
        result.push_back(std::move(selected));
    }
    return result;
}

json query_logs(const LogBuffer& buffer, const LogQuery& query) {
    return project_logs(filter_logs(buffer.snapshot(), query), query.fields);
}

// 3. Host-side forwarding

protocol::Severity severity_for(const core::logging::LogLevel level) {
    switch (level) {
        case core::logging::LogLevel::WARN:
            return protocol::Severity::Warning;
        case core::logging::LogLevel::ERROR:
            return protocol::Severity::Error;
        case core::logging::LogLevel::DEBUG:
        case core::logging::LogLevel::INFO:
        default:
            return protocol::Severity::Log;
    }
}

HostLogForwarder::HostLogForwarder(MessageRouter& router, LogBuffer& buffer)
    : router_(router), buffer_(buffer) {}

HostLogForwarder::~HostLogForwarder() {
    detach();
}

void HostLogForwarder::attach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener_id_.has_value()) {
        return;
    }
    listener_id_ = core::logging::Logger::get().add_listener(
        [this](const core::logging::LogEvent& event) { forward(event); });
}

void HostLogForwarder::detach() {
    std::optional<std::size_t> id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id.swap(listener_id_);
    }
    if (id.has_value()) {
        core::logging::Logger::get().remove_listener(id.value());
    }
}

void HostLogForwarder::forward(const core::logging::LogEvent& event) {
    protocol::LogRecord record;
    record.message = event.message;
    record.severity = severity_for(event.level);
    record.timestamp = core::time::format_iso8601(event.time);
    buffer_.append(record);

    if (!router_.supervisor().is_usable()) {
        return;
    }
    // A failed send already tears the connection down inside the supervisor.
    const auto sent = router_.send(protocol::MessageKind::Log, record);
    std::lock_guard<std::mutex> lock(mutex_);
    if (core::errors::is_error(sent)) {
        ++failed_;
    } else {
        ++forwarded_;
    }
}

std::size_t HostLogForwarder::forwarded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forwarded_;
}

std::size_t HostLogForwarder::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

// 4. Tool-server side collection

LogCollector::LogCollector(MessageRouter& router, LogBuffer& buffer)
    : router_(router), buffer_(buffer) {
    router_.on(protocol::MessageKind::Log, [this](const protocol::Envelope& envelope) {
        auto record = protocol::decode_payload<protocol::LogRecord>(envelope.payload);
        if (core::errors::is_error(record)) {
            LOG_WARN("Dropping log record: " + core::errors::get_error(record).message);
            return;
        }
        buffer_.append(std::get<protocol::LogRecord>(std::move(record)));
    });
}

LogCollector::~LogCollector() {
    router_.off(protocol::to_string(protocol::MessageKind::Log));
}

}  // namespace hostlink::bridge
