// wire_format.h - JSON messages exchanged between the host and a worker process
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

/**
 * Control channel protocol (fd 3 of the worker, newline-delimited JSON):
 *
 *   host   -> worker : WorkerRequest, then half-close
 *   worker -> host   : {"event":"ready", ...}   namespace built, deadline may be armed
 *   worker -> host   : {"event":"result", ...}  terminal state of the guest run
 *
 * Guest code shares the worker process and can write to fd 3. Every worker
 * message therefore carries the request's channel token, which only the host
 * and the worker's C++ side ever hold. A message without it did not come from
 * the worker.
 */
constexpr int kControlFd = 3;

struct WorkerRequest {
    std::string source_code;
    int timeout_seconds = 1;
    ExecutionLimits limits;
    std::vector<std::string> disabled_modules;
    std::string channel_token;
};

struct WorkerReady {
    std::vector<std::string> degraded_guarantees;
    std::vector<std::string> unavailable_modules;
};

struct WorkerResult {
    ExecutionState state = ExecutionState::Faulted;
    std::optional<ExecutionError> error;
    std::vector<ExtractedVariable> variables;
    size_t variables_omitted = 0;
    std::vector<CapturedArtifact> artifacts;
    size_t artifacts_dropped = 0;
    std::vector<std::string> degraded_guarantees;
};

CODEBOX_API void to_json(nlohmann::json& j, const ExecutionLimits& limits);
CODEBOX_API void from_json(const nlohmann::json& j, ExecutionLimits& limits);
CODEBOX_API void to_json(nlohmann::json& j, const ExecutionError& error);
CODEBOX_API void from_json(const nlohmann::json& j, ExecutionError& error);
CODEBOX_API void to_json(nlohmann::json& j, const ExtractedVariable& variable);
CODEBOX_API void from_json(const nlohmann::json& j, ExtractedVariable& variable);
CODEBOX_API void to_json(nlohmann::json& j, const CapturedArtifact& artifact);
CODEBOX_API void from_json(const nlohmann::json& j, CapturedArtifact& artifact);
CODEBOX_API void to_json(nlohmann::json& j, const ReferencedModule& module);
CODEBOX_API void to_json(nlohmann::json& j, const WorkerRequest& request);
CODEBOX_API void from_json(const nlohmann::json& j, WorkerRequest& request);

// 32 hex characters from std::random_device, fresh for every request
CODEBOX_API std::string GenerateChannelToken();

// Encoders produce one line without the trailing newline
CODEBOX_API std::string EncodeReady(const WorkerReady& ready, const std::string& token);
CODEBOX_API std::string EncodeResult(const WorkerResult& result, const std::string& token);

/**
 * A decoded control message. Exactly one of ready/result is set when valid.
 */
struct ControlMessage {
    std::optional<WorkerReady> ready;
    std::optional<WorkerResult> result;
};

// Returns nullopt (and logs) when the line is not a well-formed message or
// does not carry expected_token
CODEBOX_API std::optional<ControlMessage> DecodeControlMessage(const std::string& line,
                                                               const std::string& expected_token);

} // namespace codebox
