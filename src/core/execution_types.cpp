// execution_types.cpp - Names for error kinds and executor states
#include "codebox/execution_types.h"

namespace codebox {

namespace {

struct KindName {
    ErrorKind kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {ErrorKind::RejectedRequest, "RejectedRequest"},
    {ErrorKind::SecurityViolation, "SecurityViolation"},
    {ErrorKind::Timeout, "Timeout"},
    {ErrorKind::ResourceLimitExceeded, "ResourceLimitExceeded"},
    {ErrorKind::GuestRuntimeError, "GuestRuntimeError"},
    {ErrorKind::InternalFormattingError, "InternalFormattingError"},
    {ErrorKind::InternalError, "InternalError"},
};

struct StateName {
    ExecutionState state;
    const char* name;
};

constexpr StateName kStateNames[] = {
    {ExecutionState::Idle, "Idle"},
    {ExecutionState::Running, "Running"},
    {ExecutionState::Completed, "Completed"},
    {ExecutionState::TimedOut, "TimedOut"},
    {ExecutionState::Faulted, "Faulted"},
    {ExecutionState::LimitExceeded, "LimitExceeded"},
};

} // anonymous namespace

const char* GetErrorKindName(ErrorKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "Unknown";
}

std::optional<ErrorKind> ParseErrorKind(const std::string& name) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) return entry.kind;
    }
    return std::nullopt;
}

const char* GetExecutionStateName(ExecutionState state) {
    for (const auto& entry : kStateNames) {
        if (entry.state == state) return entry.name;
    }
    return "Unknown";
}

std::optional<ExecutionState> ParseExecutionState(const std::string& name) {
    for (const auto& entry : kStateNames) {
        if (name == entry.name) return entry.state;
    }
    return std::nullopt;
}

bool IsTerminal(ExecutionState state) {
    return state != ExecutionState::Idle && state != ExecutionState::Running;
}

} // namespace codebox
