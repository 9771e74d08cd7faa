#pragma once
#include <string>
#include <variant>

namespace toolguard::core::errors {

    enum class ErrorCategory {
        Input,      // Invalid configuration or arguments
        Execution,  // The tool itself reported a failure
        Timeout,    // A deadline fired (per-attempt or caller)
        Cancelled,  // The caller's context was cancelled
        Admission,  // Bulkhead or circuit breaker refused the call
        Internal
    };

    struct Error {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        int attempts = 0;  // Attempts made before this error surfaced
    };

    // Stable error codes callers can match on.
    namespace codes {
        inline constexpr const char* kCircuitOpen = "circuit_open";
        inline constexpr const char* kContextCancelled = "context_cancelled";
        inline constexpr const char* kDeadlineExceeded = "deadline_exceeded";
        inline constexpr const char* kAttemptTimeout = "attempt_timeout";
        inline constexpr const char* kToolFailed = "tool_failed";
        inline constexpr const char* kInvalidConfig = "invalid_config";
    }  // namespace codes

    // A Result holds either a value of type T or an Error.
    template <typename T>
    using Result = std::variant<T, Error>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<Error>(result);
    }

    template <typename T>
    const Error& get_error(const Result<T>& result) {
        return std::get<Error>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline Error circuit_open_error(const std::string& tool_name) {
        return Error{ErrorCategory::Admission,
                     "Circuit breaker is open for tool: " + tool_name,
                     codes::kCircuitOpen,
                     "The tool failed repeatedly; calls resume after the cooldown."};
    }

    inline Error cancelled_error() {
        return Error{ErrorCategory::Cancelled, "Context cancelled.",
                     codes::kContextCancelled};
    }

    inline Error deadline_exceeded_error() {
        return Error{ErrorCategory::Timeout, "Context deadline exceeded.",
                     codes::kDeadlineExceeded};
    }

    // True when the error came from a cancelled or expired context rather than
    // from the tool's own logic.
    inline bool is_context_error(const Error& error) {
        return error.code == codes::kContextCancelled ||
               error.code == codes::kDeadlineExceeded ||
               error.code == codes::kAttemptTimeout;
    }

    // Exhaustion error: keeps the last attempt's code and category so callers
    // can still tell a cancellation from a tool failure.
    inline Error wrap_with_attempts(Error last, const std::string& tool_name,
                                    const int attempts) {
        last.message = "Tool " + tool_name + " failed after " +
                       std::to_string(attempts) + " attempt(s): " + last.message;
        last.attempts = attempts;
        return last;
    }

}  // namespace toolguard::core::errors
