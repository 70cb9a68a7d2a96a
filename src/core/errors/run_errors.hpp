#pragma once
#include <optional>
#include <string>
#include <variant>

namespace sandrun::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., unknown plan id or malformed CLI flag
        Execution,  // E.g., a sandbox unit exited non-zero
        Storage,    // E.g., run store or blob store write failed
        Policy,     // E.g., GPU requested or a key escapes the storage root
        Internal    // E.g., logic bug or parsing failure
    };

    // Failure taxonomy surfaced on the terminal `error` event.
    enum class FailureKind {
        RunTimeout,
        GpuRequested,
        ExecutionError,
        UnexpectedError,
        PlanNotFound
    };

    inline std::string to_code(const FailureKind kind) {
        switch (kind) {
            case FailureKind::RunTimeout:
                return "run_timeout";
            case FailureKind::GpuRequested:
                return "gpu_requested";
            case FailureKind::ExecutionError:
                return "execution_error";
            case FailureKind::PlanNotFound:
                return "plan_not_found";
            case FailureKind::UnexpectedError:
            default:
                return "unexpected_error";
        }
    }

    // The standardized error payload
    struct RunError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        // Set only by the sandbox boundary; everything else is unclassified.
        std::optional<FailureKind> failure = std::nullopt;
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a RunError.
    template <typename T>
    using Result = std::variant<T, RunError>;

    // Placeholder value for operations that only succeed or fail.
    struct Ok {};

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

    inline FailureKind failure_of(const RunError& error) {
        return error.failure.value_or(FailureKind::UnexpectedError);
    }

} // namespace sandrun::core::errors
