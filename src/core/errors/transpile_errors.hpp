#pragma once
#include <string>
#include <variant>

namespace transpiler::core::errors {

    // 1. Typed error categories, one per failure class a caller can see
    enum class ErrorCategory {
        Input,                // E.g., missing python_code or wrong argument type
        UnknownTool,          // Tool name not exposed by this server
        UnsupportedLanguage,  // Target language not in the registry
        IO,                   // Workspace could not be created or written
        Timeout,              // External process exceeded the time budget
        Execution,            // External process exited non-zero
        Cancelled,            // Caller aborted the request
        Internal              // Contract violation or unexpected exception
    };

    // The standardized error payload
    struct TranspileError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a TranspileError.
    template <typename T>
    using Result = std::variant<T, TranspileError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TranspileError>(result);
    }

    template <typename T>
    const TranspileError& get_error(const Result<T>& result) {
        return std::get<TranspileError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Name reported to the protocol caller in the "error" field
    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "InvalidArgument";
            case ErrorCategory::UnknownTool:
                return "UnknownTool";
            case ErrorCategory::UnsupportedLanguage:
                return "UnsupportedLanguage";
            case ErrorCategory::IO:
                return "IOFault";
            case ErrorCategory::Timeout:
                return "Timeout";
            case ErrorCategory::Execution:
                return "ToolFailure";
            case ErrorCategory::Cancelled:
                return "Cancelled";
            case ErrorCategory::Internal:
                return "InternalError";
            default:
                return "InternalError";
        }
    }

} // namespace transpiler::core::errors
