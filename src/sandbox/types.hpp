#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace coderun::sandbox {

enum class ErrorKind {
    kValidationError,
    kSecurityViolation,
    kBackendUnavailable,
    kTimedOut,
    kResourceExceeded,
    kRuntimeFailure
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kValidationError: return "ValidationError";
        case ErrorKind::kSecurityViolation: return "SecurityViolation";
        case ErrorKind::kBackendUnavailable: return "BackendUnavailable";
        case ErrorKind::kTimedOut: return "TimedOut";
        case ErrorKind::kResourceExceeded: return "ResourceExceeded";
        case ErrorKind::kRuntimeFailure: return "RuntimeFailure";
    }
    return "Unknown";
}

struct ExecutionRequest {
    std::string language;
    std::string code;
    std::string stdin_data;
};

struct ExecutionResult {
    bool success = false;
    std::string language;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<int> exit_code;
    double duration_s = 0.0;
    std::optional<ErrorKind> error_kind;
    std::string error;
    std::string backend;
};

// What a backend observed, before it is mapped onto ExecutionResult.
struct RawOutcome {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    bool timed_out = false;
    bool resource_exceeded = false;
    std::chrono::milliseconds duration{0};
    // Non-empty when the execution environment could not be started.
    std::string launch_error;
};

}  // namespace coderun::sandbox
