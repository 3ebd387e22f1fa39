#pragma once
#include <string>
#include <variant>

namespace station::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,           // E.g., Operator provided an invalid CLI flag
        Step,            // E.g., A step raised or reported its own failure
        Infrastructure,  // E.g., Console disconnected while a prompt was pending
        Secret,          // E.g., A step asked for a secret nobody declared
        Internal         // E.g., C++ logic bug or parsing failure
    };

    // The standardized error payload
    struct StationError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a StationError.
    template <typename T>
    using Result = std::variant<T, StationError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<StationError>(result);
    }

    template <typename T>
    const StationError& get_error(const Result<T>& result) {
        return std::get<StationError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline bool is_infrastructure(const StationError& error) {
        return error.category == ErrorCategory::Infrastructure;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:          return "input";
            case ErrorCategory::Step:           return "step";
            case ErrorCategory::Infrastructure: return "infrastructure";
            case ErrorCategory::Secret:         return "secret";
            case ErrorCategory::Internal:       return "internal";
            default: return "unknown";
        }
    }

} // namespace station::core::errors
