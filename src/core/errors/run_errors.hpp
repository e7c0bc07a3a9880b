#pragma once
#include <string>
#include <variant>

namespace coderunner::core::errors {

    // 1. Typed error categories, one per failure class of a run
    enum class ErrorCategory {
        Input,     // E.g., unparseable message or unsupported language
        Busy,      // E.g., a run request while another run is active
        Build,     // E.g., the compiler exited non-zero
        Spawn,     // E.g., interpreter not found on PATH
        Timeout,   // E.g., the program exceeded its wall-clock budget
        Internal   // E.g., scratch directory or pipe creation failed
    };

    // The standardized error payload
    struct RunError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a RunError.
    template <typename T>
    using Result = std::variant<T, RunError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RunError>(result);
    }

    template <typename T>
    const RunError& get_error(const Result<T>& result) {
        return std::get<RunError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Busy:     return "busy";
            case ErrorCategory::Build:    return "build";
            case ErrorCategory::Spawn:    return "spawn";
            case ErrorCategory::Timeout:  return "timeout";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace coderunner::core::errors
