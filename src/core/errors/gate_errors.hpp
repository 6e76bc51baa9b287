#pragma once
#include <string>
#include <variant>

namespace cmdgate::core::errors {

    // 1. Typed rejection categories
    enum class ErrorCategory {
        InputShape,    // Empty, too long, or carries a null byte
        Injection,     // Shell metacharacter present
        Traversal,     // ".." somewhere in a path
        Policy,        // Command not in the allow-set, or explicitly denied
        Format,        // Malformed flag name
        PlatformPath,  // Device name, UNC, ADS, illegal char, trailing dot/space
        Config,        // Allow/deny list or command-line configuration is invalid
        Internal       // I/O failure while reading configuration
    };

    // The standardized rejection payload
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. A Result holds either the accepted value of type T, OR a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

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
            case ErrorCategory::InputShape:   return "input_shape";
            case ErrorCategory::Injection:    return "injection";
            case ErrorCategory::Traversal:    return "traversal";
            case ErrorCategory::Policy:       return "policy";
            case ErrorCategory::Format:       return "format";
            case ErrorCategory::PlatformPath: return "platform_path";
            case ErrorCategory::Config:       return "config";
            case ErrorCategory::Internal:     return "internal";
            default: return "unknown";
        }
    }

} // namespace cmdgate::core::errors
