// guest_runner.h - Executes guest source in a GuestNamespace
#pragma once

#include "codebox/execution_types.h"
#include "guest_runtime_builder.h"
#include <optional>
#include <string>

namespace codebox::scripting {

class CapabilityPolicy;

struct GuestRunResult {
    ExecutionState state = ExecutionState::Faulted;
    std::optional<ExecutionError> error;
};

/**
 * GuestRunner - one exec of the guest source, then classification.
 *
 * Output goes straight to the worker's stdout/stderr pipes, which the host is
 * already draining, so nothing is buffered here. On a guest exception the
 * traceback is printed to stderr and the outcome carries "<Type>: <message>".
 */
class GuestRunner {
public:
    static constexpr const char* kGuestFilename = "<guest>";

    explicit GuestRunner(CapabilityPolicy& policy);

    GuestRunResult Run(GuestNamespace& guest, const std::string& source);

private:
    GuestRunResult Classify(py::error_already_set& error);
    void PrintTraceback(py::error_already_set& error);
    void RegisterSource(const std::string& source);
    void FlushStreams();

    CapabilityPolicy& policy_;
};

} // namespace codebox::scripting
