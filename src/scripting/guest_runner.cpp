#include "guest_runner.h"
#include "capability_policy.h"
#include <spdlog/spdlog.h>

namespace codebox::scripting {

GuestRunner::GuestRunner(CapabilityPolicy& policy)
    : policy_(policy)
{
}

void GuestRunner::RegisterSource(const std::string& source) {
    // Lets tracebacks quote guest lines
    try {
        py::str text(source);
        py::list lines = text.attr("splitlines")(true);
        py::module_::import("linecache").attr("cache")[py::str(kGuestFilename)] =
            py::make_tuple(source.size(), py::none(), lines, kGuestFilename);
    } catch (const py::error_already_set& e) {
        spdlog::debug("Guest source not registered with linecache: {}", e.what());
    }
}

void GuestRunner::FlushStreams() {
    try {
        py::module_ sys = py::module_::import("sys");
        sys.attr("stdout").attr("flush")();
        sys.attr("stderr").attr("flush")();
    } catch (const py::error_already_set& e) {
        spdlog::warn("Failed to flush guest streams: {}", e.what());
    }
}

void GuestRunner::PrintTraceback(py::error_already_set& error) {
    try {
        py::module_::import("traceback").attr("print_exception")(error.type(), error.value(), error.trace());
    } catch (const py::error_already_set& e) {
        spdlog::warn("Failed to print guest traceback: {}", e.what());
    }
}

GuestRunResult GuestRunner::Classify(py::error_already_set& error) {
    GuestRunResult result;
    result.state = ExecutionState::Faulted;

    std::string type_name = "Exception";
    std::string message;
    try {
        type_name = py::str(py::handle(error.type()).attr("__name__"));
        message = py::str(error.value());
    } catch (const py::error_already_set& e) {
        spdlog::debug("Guest exception not printable: {}", e.what());
        message = "<unprintable exception>";
    }

    // A refused capability wins even if the guest raised something else afterwards
    if (policy_.HasViolations()) {
        result.error = ExecutionError{
            ErrorKind::SecurityViolation,
            "Security violation: " + policy_.GetViolations().front() + " is not permitted in the sandbox",
            type_name};
        return result;
    }

    if (error.matches(PyExc_MemoryError)) {
        result.state = ExecutionState::LimitExceeded;
        result.error = ExecutionError{
            ErrorKind::ResourceLimitExceeded,
            message.empty() ? "MemoryError: memory limit exceeded" : "MemoryError: " + message,
            type_name};
        return result;
    }

    result.error = ExecutionError{
        ErrorKind::GuestRuntimeError,
        message.empty() ? type_name : type_name + ": " + message,
        type_name};
    return result;
}

GuestRunResult GuestRunner::Run(GuestNamespace& guest, const std::string& source) {
    RegisterSource(source);

    try {
        py::module_ builtins = py::module_::import("builtins");
        py::object code = builtins.attr("compile")(source, kGuestFilename, "exec");
        builtins.attr("exec")(code, guest.globals);
        FlushStreams();

    } catch (py::error_already_set& e) {
        GuestRunResult result = Classify(e);
        PrintTraceback(e);
        FlushStreams();
        spdlog::info("Guest run faulted: {}", result.error ? result.error->message : "");
        return result;
    }

    GuestRunResult result;
    if (policy_.HasViolations()) {
        // The guest caught the PermissionError; the attempt still counts
        result.state = ExecutionState::Faulted;
        result.error = ExecutionError{
            ErrorKind::SecurityViolation,
            "Security violation: " + policy_.GetViolations().front() + " is not permitted in the sandbox",
            "PermissionError"};
        return result;
    }

    result.state = ExecutionState::Completed;
    spdlog::info("Guest run completed");
    return result;
}

} // namespace codebox::scripting
