// code_execution_service.cpp - Request pipeline
#include "codebox/code_execution_service.h"
#include "codebox/module_scanner.h"
#include "codebox/sandbox_config.h"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace codebox {

CodeExecutionService::CodeExecutionService(const ExecutionLimits& limits,
                                           std::unique_ptr<ExecutionBackend> backend)
    : CodeExecutionService(limits, RequestValidator::DefaultFastRejectPatterns(), std::move(backend))
{
}

CodeExecutionService::CodeExecutionService(const ExecutionLimits& limits,
                                           std::vector<std::string> fast_reject_patterns,
                                           std::unique_ptr<ExecutionBackend> backend)
    : limits_(limits)
    , validator_(limits, std::move(fast_reject_patterns))
    , backend_(std::move(backend))
{
    if (!backend_) {
        throw std::invalid_argument("CodeExecutionService requires an execution backend");
    }
    spdlog::debug("Code execution service using backend '{}'", backend_->GetName());
}

CodeExecutionService::~CodeExecutionService() {
    std::unique_lock<std::mutex> lock(async_mutex_);
    if (async_tasks_ > 0) {
        spdlog::debug("Waiting for {} asynchronous request(s)", async_tasks_);
    }
    async_done_.wait(lock, [this] { return async_tasks_ == 0; });
}

std::unique_ptr<CodeExecutionService> CodeExecutionService::Create(const SandboxConfig& config) {
    WorkerExecutorOptions options;
    options.worker_path = config.GetWorkerPath();
    options.disabled_modules = config.GetDisabledModules();
    options.worker_log_file = config.GetLogging().worker_file;

    auto backend = std::make_unique<WorkerProcessExecutor>(config.GetLimits(), std::move(options));
    return std::make_unique<CodeExecutionService>(config.GetLimits(), config.GetFastRejectPatterns(),
                                                  std::move(backend));
}

ExecutionOutcome CodeExecutionService::RunBackend(const ExecutionRequest& request, int timeout_seconds) {
    try {
        return backend_->Run(request, timeout_seconds);
    } catch (const std::exception& e) {
        spdlog::error("Execution backend '{}' failed: {}", backend_->GetName(), e.what());
        ExecutionOutcome outcome;
        outcome.state = ExecutionState::Faulted;
        outcome.timeout_seconds = timeout_seconds;
        outcome.error = ExecutionError{ErrorKind::InternalError,
                                       std::string("Execution backend failed: ") + e.what(), ""};
        return outcome;
    }
}

ExecutionResponse CodeExecutionService::Execute(const ExecutionRequest& request) {
    ExecutionResponse response;

    const ValidationResult validation = validator_.Validate(request);
    response.warnings = validation.warnings;
    response.suggestions = validation.suggestions;

    if (!validation.ok) {
        RejectedRequest rejection{validation.kind, validation.reason};
        telemetry_.RecordRejection(rejection);

        FormattedResponse formatted = formatter_.FormatRejection(rejection);
        response.summary = std::move(formatted.summary);
        response.structured = std::move(formatted.structured);
        response.result = std::move(rejection);
        return response;
    }

    for (const auto& warning : validation.warnings) {
        spdlog::info("Request adjusted: {}", warning);
    }

    ExecutionOutcome outcome = RunBackend(request, validation.effective_timeout);
    outcome.timeout_seconds = validation.effective_timeout;
    outcome.referenced_modules = ScanReferencedModules(request.source_code);

    // success and error are mutually exclusive; a failure always names its kind
    if (outcome.success && (outcome.error || outcome.state != ExecutionState::Completed)) {
        outcome.success = false;
    }
    if (!outcome.success && !outcome.error) {
        if (outcome.state == ExecutionState::Completed) {
            outcome.state = ExecutionState::Faulted;
        }
        outcome.error = ExecutionError{ErrorKind::InternalError, "Execution ended without a result", ""};
    }
    if (!IsTerminal(outcome.state)) {
        outcome.state = ExecutionState::Faulted;
    }
    outcome.degraded = !outcome.degraded_guarantees.empty();

    telemetry_.RecordOutcome(outcome);

    FormattedResponse formatted = formatter_.Format(outcome, request.source_code);
    response.summary = std::move(formatted.summary);
    response.structured = std::move(formatted.structured);
    if (!response.warnings.empty() && response.structured.is_object()) {
        response.structured["warnings"] = response.warnings;
    }
    response.result = std::move(outcome);
    return response;
}

void CodeExecutionService::ReleaseAsyncTask() {
    // Notify under the lock: the destructor may run as soon as it is released
    std::lock_guard<std::mutex> lock(async_mutex_);
    --async_tasks_;
    async_done_.notify_all();
}

std::future<ExecutionResponse> CodeExecutionService::ExecuteAsync(ExecutionRequest request) {
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        ++async_tasks_;
    }
    try {
        return std::async(std::launch::async, [this, request = std::move(request)]() {
            struct Release {
                CodeExecutionService* service;
                ~Release() { service->ReleaseAsyncTask(); }
            } release{this};
            return Execute(request);
        });
    } catch (const std::system_error&) {
        // No thread was started
        ReleaseAsyncTask();
        throw;
    }
}

} // namespace codebox
