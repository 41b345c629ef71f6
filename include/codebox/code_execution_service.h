// code_execution_service.h - validate, execute, extract and format one request
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include "executor.h"
#include "request_validator.h"
#include "response_formatter.h"
#include "telemetry.h"
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace codebox {

class SandboxConfig;

struct ExecutionResponse {
    std::variant<ExecutionOutcome, RejectedRequest> result;
    std::string summary;
    nlohmann::json structured;
    std::vector<std::string> warnings;      // validator warnings (e.g. timeout clamped)
    std::vector<std::string> suggestions;   // advisory hints for the caller

    bool IsRejected() const { return std::holds_alternative<RejectedRequest>(result); }
    bool IsSuccess() const {
        return !IsRejected() && std::get<ExecutionOutcome>(result).success;
    }
    const ExecutionOutcome& Outcome() const { return std::get<ExecutionOutcome>(result); }
    const RejectedRequest& Rejection() const { return std::get<RejectedRequest>(result); }
};

/**
 * CodeExecutionService - the request pipeline.
 *
 * Validation happens first and rejected requests never reach the backend.
 * Execute is thread-safe: every call gets its own worker and namespace, and
 * only the telemetry counters are shared. The destructor blocks until every
 * ExecuteAsync task has finished with the service.
 */
class CODEBOX_API CodeExecutionService {
public:
    CodeExecutionService(const ExecutionLimits& limits, std::unique_ptr<ExecutionBackend> backend);
    CodeExecutionService(const ExecutionLimits& limits, std::vector<std::string> fast_reject_patterns,
                         std::unique_ptr<ExecutionBackend> backend);
    ~CodeExecutionService();

    CodeExecutionService(const CodeExecutionService&) = delete;
    CodeExecutionService& operator=(const CodeExecutionService&) = delete;

    // Worker-process backend wired from configuration
    static std::unique_ptr<CodeExecutionService> Create(const SandboxConfig& config);

    ExecutionResponse Execute(const ExecutionRequest& request);
    std::future<ExecutionResponse> ExecuteAsync(ExecutionRequest request);

    Telemetry& GetTelemetry() { return telemetry_; }
    const ExecutionLimits& GetLimits() const { return limits_; }
    const ExecutionBackend& GetBackend() const { return *backend_; }

private:
    ExecutionOutcome RunBackend(const ExecutionRequest& request, int timeout_seconds);
    void ReleaseAsyncTask();

    const ExecutionLimits limits_;
    const RequestValidator validator_;
    const ResponseFormatter formatter_{};
    std::unique_ptr<ExecutionBackend> backend_;
    Telemetry telemetry_;

    // In-flight ExecuteAsync tasks
    std::mutex async_mutex_;
    std::condition_variable async_done_;
    size_t async_tasks_ = 0;
};

} // namespace codebox
