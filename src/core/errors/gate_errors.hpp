#pragma once
#include <string>
#include <variant>

namespace hookgate::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., operator passed an invalid CLI flag
        Configuration,  // E.g., a rule pattern does not compile, a state header is malformed
        Envelope,       // E.g., the host sent an event we cannot parse
        Persistence,    // E.g., the loop state could not be written durably
        Internal        // E.g., C++ logic bug
    };

    // The standardized error payload
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

    // Result<void> stand-in for operations that only succeed or fail.
    struct Ok {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:         return "input";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Envelope:      return "envelope";
            case ErrorCategory::Persistence:   return "persistence";
            case ErrorCategory::Internal:      return "internal";
            default: return "unknown";
        }
    }

} // namespace hookgate::core::errors
