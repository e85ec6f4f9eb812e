#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hostlink::protocol {

    enum class Severity {
        Log,
        Warning,
        Error,
        Exception,
        Assert
    };

    inline std::string to_string(const Severity severity) {
        switch (severity) {
            case Severity::Log:
                return "Log";
            case Severity::Warning:
                return "Warning";
            case Severity::Error:
                return "Error";
            case Severity::Exception:
                return "Exception";
            case Severity::Assert:
                return "Assert";
            default:
                return "Log";
        }
    }

    inline std::optional<Severity> parse_severity(const std::string& name) {
        if (name == "Log") return Severity::Log;
        if (name == "Warning") return Severity::Warning;
        if (name == "Error") return Severity::Error;
        if (name == "Exception") return Severity::Exception;
        if (name == "Assert") return Severity::Assert;
        return std::nullopt;
    }

    // One host log event as carried by a `log` envelope.
    // timestamp is ISO-8601 text, kept verbatim so a malformed value from the
    // peer is still stored and shown.
    struct LogRecord {
        std::string message;
        std::string stack_trace;
        Severity severity = Severity::Log;
        std::string timestamp;
    };

    inline void to_json(nlohmann::json& j, const LogRecord& record) {
        j = nlohmann::json{{"message", record.message},
                           {"stackTrace", record.stack_trace},
                           {"severity", to_string(record.severity)},
                           {"timestamp", record.timestamp}};
    }

    // Unknown severity names degrade to Log rather than rejecting the record.
    inline void from_json(const nlohmann::json& j, LogRecord& record) {
        j.at("message").get_to(record.message);
        record.stack_trace = j.value("stackTrace", std::string());
        record.severity =
            parse_severity(j.value("severity", std::string("Log"))).value_or(Severity::Log);
        record.timestamp = j.value("timestamp", std::string());
    }

} // namespace hostlink::protocol
