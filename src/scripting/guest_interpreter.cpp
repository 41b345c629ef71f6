#include "guest_interpreter.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace codebox::scripting {

GuestInterpreter::~GuestInterpreter() {
    Shutdown();
}

bool GuestInterpreter::Initialize() {
    if (initialized_) return true;

    if (Py_IsInitialized()) {
        last_error_ = "interpreter already running in this process";
        spdlog::error("Guest interpreter: {}", last_error_);
        return false;
    }

    try {
        // No signal handlers (SIGINT stays default) and no program directory on sys.path
        py::initialize_interpreter(false, 0, nullptr, false);
        initialized_ = true;
        spdlog::info("Guest interpreter initialized (Python {})", GetVersion());
        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        spdlog::error("Failed to initialize Python: {}", e.what());
        return false;
    }
}

void GuestInterpreter::Shutdown() {
    if (initialized_) {
        py::finalize_interpreter();
        initialized_ = false;
        spdlog::info("Guest interpreter finalized");
    }
}

std::string GuestInterpreter::GetVersion() const {
    if (!initialized_) return "";
    try {
        py::object version_info = py::module_::import("sys").attr("version_info");
        return std::to_string(version_info.attr("major").cast<int>()) + "." +
               std::to_string(version_info.attr("minor").cast<int>()) + "." +
               std::to_string(version_info.attr("micro").cast<int>());
    } catch (const py::error_already_set& e) {
        spdlog::debug("Could not read interpreter version: {}", e.what());
        return "unknown";
    }
}

} // namespace codebox::scripting
