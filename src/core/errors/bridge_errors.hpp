#pragma once
#include <string>
#include <variant>

namespace hostlink::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Gate,       // E.g., Health probe says the peer is unreachable or unhealthy
        Transport,  // E.g., Socket connect, send or receive failed
        Protocol,   // E.g., Malformed envelope or payload
        Timeout,    // E.g., No reply arrived before the deadline
        Handler,    // E.g., The peer's command handler reported an error
        Input,      // E.g., Caller passed an empty object name
        Internal    // E.g., C++ logic bug or shutdown in progress
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the caller
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // For operations that either succeed with nothing to report or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Gate:
                return "gate";
            case ErrorCategory::Transport:
                return "transport";
            case ErrorCategory::Protocol:
                return "protocol";
            case ErrorCategory::Timeout:
                return "timeout";
            case ErrorCategory::Handler:
                return "handler";
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace hostlink::core::errors
