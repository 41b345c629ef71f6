// worker_main.cpp - codebox-worker: hosts exactly one guest run
//
// Launched by the host with fd 0 = /dev/null, fd 1/2 = output pipes and
// fd 3 = control socket. Reads one request, builds the namespace, reports
// ready, runs the guest, extracts results, reports the result and exits.
#include "codebox/resource_governor.h"
#include "codebox/wire_format.h"
#include "codebox/module_catalog.h"
#include "scripting/capability_policy.h"
#include "scripting/guest_interpreter.h"
#include "scripting/guest_runner.h"
#include "scripting/guest_runtime_builder.h"
#include "scripting/result_extractor.h"

#include <pybind11/embed.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace py = pybind11;
using namespace codebox;

namespace {

constexpr size_t kMaxRequestBytes = 16 * 1024 * 1024;

// Exit codes (the host classifies by the result message, these help debugging)
constexpr int kExitOk = 0;
constexpr int kExitBadRequest = 2;
constexpr int kExitControlLost = 3;

void SetupLogging(int argc, char** argv) {
    std::string log_file;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strncmp(argv[i], "--log-file=", 11) == 0) {
            log_file = argv[i] + 11;
        }
    }

    // Guest stdout/stderr belong to the guest: worker logs go elsewhere or nowhere
    std::shared_ptr<spdlog::logger> logger;
    if (!log_file.empty()) {
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
            logger = std::make_shared<spdlog::logger>("codebox-worker", sink);
            logger->set_level(spdlog::level::debug);
            logger->flush_on(spdlog::level::info);
        } catch (const spdlog::spdlog_ex&) {
            logger.reset();
        }
    }
    if (!logger) {
        logger = std::make_shared<spdlog::logger>("codebox-worker",
                                                  std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    spdlog::set_default_logger(logger);
}

bool ReadRequest(std::string& payload) {
    char chunk[65536];
    while (true) {
        ssize_t n = read(kControlFd, chunk, sizeof(chunk));
        if (n > 0) {
            payload.append(chunk, static_cast<size_t>(n));
            if (payload.size() > kMaxRequestBytes) {
                spdlog::error("Request exceeds {} bytes", kMaxRequestBytes);
                return false;
            }
            continue;
        }
        if (n == 0) return true;
        if (errno == EINTR) continue;
        spdlog::error("Failed to read request: {}", std::strerror(errno));
        return false;
    }
}

bool SendLine(const std::string& line) {
    const std::string message = line + "\n";
    size_t sent = 0;
    while (sent < message.size()) {
        ssize_t n = send(kControlFd, message.data() + sent, message.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Control channel write failed: {}", std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

int Finish(WorkerResult result, std::vector<std::string> degraded, const std::string& token) {
    result.degraded_guarantees = std::move(degraded);
    const bool delivered = SendLine(EncodeResult(result, token));
    spdlog::info("Result sent: state={}", GetExecutionStateName(result.state));
    spdlog::default_logger()->flush();
    std::fflush(stdout);
    std::fflush(stderr);
    // The interpreter is deliberately not finalized: process exit releases it
    _exit(delivered ? kExitOk : kExitControlLost);
}

WorkerResult InternalFailure(const std::string& message) {
    WorkerResult result;
    result.state = ExecutionState::Faulted;
    result.error = ExecutionError{ErrorKind::InternalError, message, ""};
    return result;
}

} // anonymous namespace

int main(int argc, char** argv) {
    SetupLogging(argc, argv);

    std::string payload;
    if (!ReadRequest(payload)) {
        return kExitControlLost;
    }

    WorkerRequest request;
    try {
        request = nlohmann::json::parse(payload).get<WorkerRequest>();
    } catch (const nlohmann::json::exception& e) {
        // Without a token the host classifies this as a protocol error
        spdlog::error("Invalid request: {}", e.what());
        return kExitBadRequest;
    }
    // Stays on the C++ side: nothing below hands the request to the interpreter
    const std::string token = request.channel_token;
    spdlog::info("Request received: {} bytes of source, timeout {}s",
                 request.source_code.size(), request.timeout_seconds);

    const ResourceGovernor governor(request.limits);
    std::vector<std::string> degraded = governor.ApplyStartupLimits();

    scripting::GuestInterpreter interpreter;
    if (!interpreter.Initialize()) {
        return Finish(InternalFailure("Python interpreter failed to start: " + interpreter.GetLastError()),
                      degraded, token);
    }

    auto& policy = scripting::CapabilityPolicy::Instance();

    try {
        scripting::GuestRuntimeBuilder builder(ResolveCatalog(request.disabled_modules));
        scripting::BuildReport report;
        scripting::GuestNamespace guest = builder.Build(report);
        if (!report.audit_hook_installed) {
            degraded.push_back("capability audit hook could not be installed");
        }

        for (auto& note : governor.ApplyRunLimits(request.timeout_seconds)) {
            degraded.push_back(std::move(note));
        }

        WorkerReady ready;
        ready.degraded_guarantees = degraded;
        ready.unavailable_modules = report.unavailable_modules;
        if (!SendLine(EncodeReady(ready, token))) {
            _exit(kExitControlLost);
        }

        WorkerResult result;
        {
            scripting::FigureRegistryScope figures;
            policy.Arm();

            scripting::GuestRunner runner(policy);
            scripting::GuestRunResult run = runner.Run(guest, request.source_code);
            result.state = run.state;
            result.error = run.error;

            if (run.state == ExecutionState::Completed || run.state == ExecutionState::Faulted) {
                scripting::ResultExtractor extractor(request.limits);
                scripting::ExtractionResult extracted = extractor.Extract(guest);
                result.variables = std::move(extracted.variables);
                result.variables_omitted = extracted.variables_omitted;
                result.artifacts = std::move(extracted.artifacts);
                result.artifacts_dropped = extracted.artifacts_dropped;
            }

            // Capabilities refused while extracting (a guest __str__, say) count too
            if (result.state == ExecutionState::Completed && policy.HasViolations()) {
                result.state = ExecutionState::Faulted;
                result.error = ExecutionError{
                    ErrorKind::SecurityViolation,
                    "Security violation: " + policy.GetViolations().front() + " is not permitted in the sandbox",
                    "PermissionError"};
            }
            policy.Disarm();
        }

        // Drop guest objects while the interpreter is still consistent
        guest.globals.clear();
        guest.seeded.clear();

        return Finish(std::move(result), degraded, token);

    } catch (const py::error_already_set& e) {
        policy.Disarm();
        spdlog::error("Sandbox setup failed: {}", e.what());
        return Finish(InternalFailure(std::string("Sandbox setup failed: ") + e.what()), degraded, token);
    } catch (const std::exception& e) {
        policy.Disarm();
        spdlog::error("Worker failure: {}", e.what());
        return Finish(InternalFailure(std::string("Worker failure: ") + e.what()), degraded, token);
    }
}
