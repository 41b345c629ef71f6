// executor.h - Governed execution of one guest snippet
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include "resource_governor.h"
#include <string>
#include <vector>

namespace codebox {

/**
 * ExecutionBackend - runs an already validated request to a terminal state.
 *
 * Implementations must return a well-formed ExecutionOutcome for every input:
 * nothing the guest does may escape as an exception.
 */
class CODEBOX_API ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    virtual ExecutionOutcome Run(const ExecutionRequest& request, int timeout_seconds) = 0;
    virtual std::string GetName() const = 0;
};

struct WorkerExecutorOptions {
    std::string worker_path;                      // codebox-worker executable
    std::vector<std::string> disabled_modules;    // subset of the guest module catalog
    std::string worker_log_file;                  // empty = worker logs discarded
    std::vector<std::string> passthrough_env{     // copied from the host if set
        "PATH", "LANG", "LC_ALL", "PYTHONHOME", "PYTHONPATH", "VIRTUAL_ENV"
    };
};

/**
 * WorkerProcessExecutor - one codebox-worker process per request.
 *
 * The host streams the worker's stdout/stderr into bounded buffers while the
 * ResourceGovernor's deadline runs. At the deadline the worker's process group
 * is killed, independent of anything the guest is doing, and whatever output
 * already arrived is kept. Thread-safe: concurrent Run calls share nothing.
 */
class CODEBOX_API WorkerProcessExecutor : public ExecutionBackend {
public:
    WorkerProcessExecutor(const ExecutionLimits& limits, WorkerExecutorOptions options);

    ExecutionOutcome Run(const ExecutionRequest& request, int timeout_seconds) override;
    std::string GetName() const override { return "worker-process"; }

    const WorkerExecutorOptions& GetOptions() const { return options_; }

private:
    std::vector<std::string> BuildEnvironment() const;
    std::vector<std::string> BuildArguments() const;

    const ExecutionLimits limits_;
    const ResourceGovernor governor_;
    const WorkerExecutorOptions options_;
};

} // namespace codebox
