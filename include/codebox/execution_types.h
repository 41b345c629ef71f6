// execution_types.h - Request, limits and outcome types shared by the pipeline
#pragma once

#include "api_export.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

// The single guest language accepted by the validator
constexpr const char* kSupportedLanguage = "python";

/**
 * Error classification carried by every failed outcome or rejection.
 */
enum class ErrorKind {
    RejectedRequest,          // oversized, too many lines, unsupported language, bad timeout
    SecurityViolation,        // attempted use of a capability outside the allowlist
    Timeout,                  // wall-clock deadline or CPU-time ceiling reached
    ResourceLimitExceeded,    // memory ceiling breached
    GuestRuntimeError,        // guest code raised
    InternalFormattingError,  // formatter fallback, never propagated
    InternalError             // host-side failure (worker missing, spawn failure, protocol)
};

CODEBOX_API const char* GetErrorKindName(ErrorKind kind);
CODEBOX_API std::optional<ErrorKind> ParseErrorKind(const std::string& name);

/**
 * Executor state machine: Idle -> Running -> {Completed, TimedOut, Faulted, LimitExceeded}
 */
enum class ExecutionState {
    Idle,
    Running,
    Completed,
    TimedOut,
    Faulted,
    LimitExceeded
};

CODEBOX_API const char* GetExecutionStateName(ExecutionState state);
CODEBOX_API std::optional<ExecutionState> ParseExecutionState(const std::string& name);
CODEBOX_API bool IsTerminal(ExecutionState state);

struct ExecutionRequest {
    std::string source_code;
    std::optional<int> timeout_seconds;
    std::string guest_language = kSupportedLanguage;
};

/**
 * Process-wide ceilings. Loaded once by SandboxConfig and never mutated per request.
 */
struct ExecutionLimits {
    int max_timeout_seconds = 30;
    int default_timeout_seconds = 30;
    size_t max_memory_mb = 1024;          // 0 disables the memory ceiling
    size_t max_output_chars = 10000;
    size_t max_source_bytes = 10000;
    size_t max_source_lines = 200;
    size_t max_variable_chars = 500;
    size_t max_variables = 50;
    size_t max_artifacts = 10;
    size_t max_artifact_bytes = 2 * 1024 * 1024;
    int startup_timeout_seconds = 30;     // worker spawn + namespace build
    int kill_grace_ms = 500;              // reap wait after SIGKILL
    int max_open_files = 64;
};

struct ExecutionError {
    ErrorKind kind = ErrorKind::GuestRuntimeError;
    std::string message;
    std::string exception_type;  // guest exception class, when there is one
};

struct ExtractedVariable {
    std::string name;
    std::string type_tag;
    std::string value;           // bounded str() rendering
    bool truncated = false;
};

struct CapturedArtifact {
    std::string kind = "matplotlib";
    std::string encoding = "png";
    std::string label;
    size_t size_bytes = 0;       // size of the base64 payload
    std::string data;            // base64
};

struct ReferencedModule {
    int line = 0;
    std::string statement;
    std::string module;
};

struct ExecutionOutcome {
    bool success = false;
    ExecutionState state = ExecutionState::Idle;
    std::string output;
    std::string error_output;
    bool output_truncated = false;
    std::optional<ExecutionError> error;
    double elapsed_seconds = 0.0;
    int timeout_seconds = 0;

    std::vector<ExtractedVariable> variables;
    size_t variables_omitted = 0;       // bindings beyond max_variables
    std::vector<CapturedArtifact> artifacts;
    size_t artifacts_dropped = 0;       // figures beyond count or size caps
    std::vector<ReferencedModule> referenced_modules;

    // Set when a ceiling could not be enforced on this host
    bool degraded = false;
    std::vector<std::string> degraded_guarantees;
};

struct RejectedRequest {
    ErrorKind kind = ErrorKind::RejectedRequest;
    std::string reason;
};

} // namespace codebox
