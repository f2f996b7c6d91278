#pragma once
#include <string>
#include <variant>

namespace hookguard::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Config,       // E.g., patterns.yaml missing, unparseable or off-schema
        RulePattern,  // E.g., a single rule whose regex does not compile
        Io,           // E.g., the audit log cannot be opened for append
        Payload,      // E.g., the host sent malformed JSON or an unknown tool
        Input,        // E.g., an invalid CLI flag
        Internal      // E.g., matching raised an unexpected error
    };

    // The standardized error payload
    struct GuardError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";              // Helpful tips for the user
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a GuardError.
    template <typename T>
    using Result = std::variant<T, GuardError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GuardError>(result);
    }

    template <typename T>
    const GuardError& get_error(const Result<T>& result) {
        return std::get<GuardError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Config:      return "config";
            case ErrorCategory::RulePattern: return "rule_pattern";
            case ErrorCategory::Io:          return "io";
            case ErrorCategory::Payload:     return "payload";
            case ErrorCategory::Input:       return "input";
            case ErrorCategory::Internal:    return "internal";
            default:                         return "unknown";
        }
    }

} // namespace hookguard::core::errors
