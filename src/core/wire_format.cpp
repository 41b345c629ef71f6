// wire_format.cpp - Host/worker JSON messages
#include "codebox/wire_format.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <random>

namespace codebox {

using json = nlohmann::json;

void to_json(json& j, const ExecutionLimits& limits) {
    j = json{
        {"max_timeout_seconds", limits.max_timeout_seconds},
        {"default_timeout_seconds", limits.default_timeout_seconds},
        {"max_memory_mb", limits.max_memory_mb},
        {"max_output_chars", limits.max_output_chars},
        {"max_source_bytes", limits.max_source_bytes},
        {"max_source_lines", limits.max_source_lines},
        {"max_variable_chars", limits.max_variable_chars},
        {"max_variables", limits.max_variables},
        {"max_artifacts", limits.max_artifacts},
        {"max_artifact_bytes", limits.max_artifact_bytes},
        {"startup_timeout_seconds", limits.startup_timeout_seconds},
        {"kill_grace_ms", limits.kill_grace_ms},
        {"max_open_files", limits.max_open_files}
    };
}

void from_json(const json& j, ExecutionLimits& limits) {
    // Missing keys keep their defaults so older config files still load
    limits.max_timeout_seconds = j.value("max_timeout_seconds", limits.max_timeout_seconds);
    limits.default_timeout_seconds = j.value("default_timeout_seconds", limits.default_timeout_seconds);
    limits.max_memory_mb = j.value("max_memory_mb", limits.max_memory_mb);
    limits.max_output_chars = j.value("max_output_chars", limits.max_output_chars);
    limits.max_source_bytes = j.value("max_source_bytes", limits.max_source_bytes);
    limits.max_source_lines = j.value("max_source_lines", limits.max_source_lines);
    limits.max_variable_chars = j.value("max_variable_chars", limits.max_variable_chars);
    limits.max_variables = j.value("max_variables", limits.max_variables);
    limits.max_artifacts = j.value("max_artifacts", limits.max_artifacts);
    limits.max_artifact_bytes = j.value("max_artifact_bytes", limits.max_artifact_bytes);
    limits.startup_timeout_seconds = j.value("startup_timeout_seconds", limits.startup_timeout_seconds);
    limits.kill_grace_ms = j.value("kill_grace_ms", limits.kill_grace_ms);
    limits.max_open_files = j.value("max_open_files", limits.max_open_files);
}

void to_json(json& j, const ExecutionError& error) {
    j = json{
        {"kind", GetErrorKindName(error.kind)},
        {"message", error.message},
        {"exception_type", error.exception_type}
    };
}

void from_json(const json& j, ExecutionError& error) {
    const auto kind = ParseErrorKind(j.at("kind").get<std::string>());
    error.kind = kind.value_or(ErrorKind::InternalError);
    error.message = j.value("message", std::string());
    error.exception_type = j.value("exception_type", std::string());
}

void to_json(json& j, const ExtractedVariable& variable) {
    j = json{
        {"name", variable.name},
        {"type", variable.type_tag},
        {"value", variable.value},
        {"truncated", variable.truncated}
    };
}

void from_json(const json& j, ExtractedVariable& variable) {
    variable.name = j.at("name").get<std::string>();
    variable.type_tag = j.value("type", std::string());
    variable.value = j.value("value", std::string());
    variable.truncated = j.value("truncated", false);
}

void to_json(json& j, const CapturedArtifact& artifact) {
    j = json{
        {"kind", artifact.kind},
        {"encoding", artifact.encoding},
        {"label", artifact.label},
        {"size_bytes", artifact.size_bytes},
        {"data", artifact.data}
    };
}

void from_json(const json& j, CapturedArtifact& artifact) {
    artifact.kind = j.value("kind", std::string("matplotlib"));
    artifact.encoding = j.value("encoding", std::string("png"));
    artifact.label = j.value("label", std::string());
    artifact.data = j.value("data", std::string());
    artifact.size_bytes = j.value("size_bytes", artifact.data.size());
}

void to_json(json& j, const ReferencedModule& module) {
    j = json{
        {"line", module.line},
        {"statement", module.statement},
        {"module", module.module}
    };
}

void to_json(json& j, const WorkerRequest& request) {
    j = json{
        {"source_code", request.source_code},
        {"timeout_seconds", request.timeout_seconds},
        {"limits", request.limits},
        {"disabled_modules", request.disabled_modules},
        {"channel_token", request.channel_token}
    };
}

void from_json(const json& j, WorkerRequest& request) {
    request.source_code = j.at("source_code").get<std::string>();
    request.timeout_seconds = j.at("timeout_seconds").get<int>();
    if (j.contains("limits")) {
        request.limits = j.at("limits").get<ExecutionLimits>();
    }
    request.disabled_modules = j.value("disabled_modules", std::vector<std::string>{});
    request.channel_token = j.at("channel_token").get<std::string>();
}

std::string GenerateChannelToken() {
    static const char kHex[] = "0123456789abcdef";
    std::random_device rd;
    std::string token;
    token.reserve(32);
    for (int i = 0; i < 4; ++i) {
        uint32_t bits = rd();
        for (int j = 0; j < 8; ++j) {
            token.push_back(kHex[bits & 0xF]);
            bits >>= 4;
        }
    }
    return token;
}

std::string EncodeReady(const WorkerReady& ready, const std::string& token) {
    json message{
        {"event", "ready"},
        {"token", token},
        {"degraded", ready.degraded_guarantees},
        {"unavailable_modules", ready.unavailable_modules}
    };
    return message.dump();
}

std::string EncodeResult(const WorkerResult& result, const std::string& token) {
    json message{
        {"event", "result"},
        {"token", token},
        {"state", GetExecutionStateName(result.state)},
        {"error", nullptr},
        {"variables", result.variables},
        {"variables_omitted", result.variables_omitted},
        {"artifacts", result.artifacts},
        {"artifacts_dropped", result.artifacts_dropped},
        {"degraded", result.degraded_guarantees}
    };
    if (result.error) {
        message["error"] = *result.error;
    }
    // Guest text may hold invalid UTF-8; replace rather than throw
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<ControlMessage> DecodeControlMessage(const std::string& line,
                                                   const std::string& expected_token) {
    try {
        json message = json::parse(line);
        if (!message.is_object() || !message.contains("token") ||
            !message["token"].is_string() || message["token"].get<std::string>() != expected_token) {
            spdlog::error("Worker message without a valid channel token");
            return std::nullopt;
        }
        const std::string event = message.at("event").get<std::string>();

        ControlMessage decoded;
        if (event == "ready") {
            WorkerReady ready;
            ready.degraded_guarantees = message.value("degraded", std::vector<std::string>{});
            ready.unavailable_modules = message.value("unavailable_modules", std::vector<std::string>{});
            decoded.ready = std::move(ready);
            return decoded;
        }

        if (event == "result") {
            WorkerResult result;
            const auto state = ParseExecutionState(message.at("state").get<std::string>());
            if (!state || !IsTerminal(*state)) {
                spdlog::error("Worker reported a non-terminal state: {}", message.at("state").dump());
                return std::nullopt;
            }
            result.state = *state;
            if (message.contains("error") && !message["error"].is_null()) {
                result.error = message["error"].get<ExecutionError>();
            }
            result.variables = message.value("variables", std::vector<ExtractedVariable>{});
            result.variables_omitted = message.value("variables_omitted", size_t{0});
            result.artifacts = message.value("artifacts", std::vector<CapturedArtifact>{});
            result.artifacts_dropped = message.value("artifacts_dropped", size_t{0});
            result.degraded_guarantees = message.value("degraded", std::vector<std::string>{});
            decoded.result = std::move(result);
            return decoded;
        }

        spdlog::error("Unknown worker event: {}", event);
        return std::nullopt;

    } catch (const json::exception& e) {
        spdlog::error("Malformed worker message: {}", e.what());
        return std::nullopt;
    }
}

} // namespace codebox
