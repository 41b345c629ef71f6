// capability_policy.cpp - Audit hook decisions
#include "capability_policy.h"

#include <pybind11/pybind11.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>

namespace py = pybind11;

namespace codebox::scripting {

namespace {

// Event name prefixes refused while armed
const char* const kDeniedEventPrefixes[] = {
    // Process creation and signals
    "os.system", "os.exec", "os.posix_spawn", "os.spawn", "os.fork", "os.kill",
    "subprocess.", "_posixsubprocess.", "pty.", "signal.pthread_kill",

    // Network
    "socket.", "urllib.", "http.client.", "ftplib.", "smtplib.", "poplib.",
    "imaplib.", "nntplib.", "telnetlib.", "webbrowser.",

    // Native code and interpreter internals
    "ctypes.", "sys.addaudithook", "sys._current_frames", "gc.get_objects",
    "gc.get_referrers", "gc.get_referents", "resource.setrlimit", "resource.prlimit",

    // Filesystem mutation
    "os.remove", "os.rename", "os.rmdir", "os.mkdir", "os.chmod", "os.chown",
    "os.chflags", "os.link", "os.symlink", "os.truncate", "os.utime", "os.chdir",
    "os.mkfifo", "os.mknod", "os.setxattr", "os.removexattr", "os.putenv",
    "os.unsetenv", "shutil.", "sqlite3.", "fcntl.", "syslog."
};

int AuditHook(const char* event, PyObject* args, void* user_data) {
    auto* policy = static_cast<CapabilityPolicy*>(user_data);
    return policy->Check(event, args) ? 0 : -1;
}

bool StartsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

// str, bytes or os.PathLike to a filesystem path; false for descriptors
bool PathFromObject(PyObject* obj, std::string& out) {
    if (obj == nullptr || PyLong_Check(obj)) {
        return false;
    }
    PyObject* fspath = PyOS_FSPath(obj);
    if (fspath == nullptr) {
        PyErr_Clear();
        return false;
    }

    bool ok = false;
    if (PyUnicode_Check(fspath)) {
        Py_ssize_t size = 0;
        const char* data = PyUnicode_AsUTF8AndSize(fspath, &size);
        if (data != nullptr) {
            out.assign(data, static_cast<size_t>(size));
            ok = true;
        } else {
            PyErr_Clear();
        }
    } else if (PyBytes_Check(fspath)) {
        out.assign(PyBytes_AS_STRING(fspath), static_cast<size_t>(PyBytes_GET_SIZE(fspath)));
        ok = true;
    }
    Py_DECREF(fspath);
    return ok;
}

std::filesystem::path Normalize(const std::string& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
    if (ec) {
        return std::filesystem::path(path).lexically_normal();
    }
    return canonical;
}

bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto [root_end, nothing] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    (void)nothing;
    return root_end == root.end();
}

} // anonymous namespace

CapabilityPolicy& CapabilityPolicy::Instance() {
    static CapabilityPolicy instance;
    return instance;
}

bool CapabilityPolicy::Install() {
    if (installed_) return true;

    if (PySys_AddAuditHook(AuditHook, this) != 0) {
        PyErr_Clear();
        spdlog::error("Interpreter refused the capability audit hook");
        return false;
    }
    installed_ = true;
    spdlog::debug("Capability audit hook installed");
    return true;
}

void CapabilityPolicy::Arm() {
    std::vector<std::string> roots;

    py::list sys_path = py::module_::import("sys").attr("path");
    for (auto entry : sys_path) {
        if (!py::isinstance<py::str>(entry)) continue;
        std::string path = entry.cast<std::string>();
        // An empty entry means the working directory, which stays closed
        if (path.empty() || path == ".") continue;
        roots.push_back(Normalize(path).string());
    }

    if (const char* mpl_dir = std::getenv("MPLCONFIGDIR")) {
        roots.push_back(Normalize(mpl_dir).string());
    }
    roots.push_back("/usr/share/zoneinfo");
    roots.push_back("/usr/share/fonts");

    read_roots_ = std::move(roots);
    violations_.clear();
    armed_ = true;
    spdlog::debug("Capability policy armed with {} read roots", read_roots_.size());
}

void CapabilityPolicy::Disarm() {
    armed_ = false;
}

bool CapabilityPolicy::IsDeniedEvent(const std::string& event) {
    for (const char* prefix : kDeniedEventPrefixes) {
        if (StartsWith(event, prefix)) {
            return true;
        }
    }
    return false;
}

bool CapabilityPolicy::IsWriteOpen(const std::string& mode, long flags) {
    if (flags & (O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND)) {
        return true;
    }
    return mode.find_first_of("wax+") != std::string::npos;
}

bool CapabilityPolicy::IsReadablePath(const std::string& path) const {
    if (path.empty()) return false;
    const auto normalized = Normalize(path);
    for (const auto& root : read_roots_) {
        if (IsWithin(normalized, std::filesystem::path(root))) {
            return true;
        }
    }
    return false;
}

void CapabilityPolicy::Deny(const std::string& event, const std::string& detail) {
    violations_.push_back(detail.empty() ? event : event + " " + detail);
    spdlog::warn("Capability denied: {} {}", event, detail);
    PyErr_Format(PyExc_PermissionError, "Operation '%s' is not permitted in the sandbox", event.c_str());
}

bool CapabilityPolicy::Check(const char* event, PyObject* args) {
    if (!armed_) return true;

    try {
        const std::string name(event);

        if (IsDeniedEvent(name)) {
            Deny(name, "");
            return false;
        }

        if (name == "open") {
            // (path, mode, flags)
            PyObject* path_obj = PyTuple_Size(args) > 0 ? PyTuple_GetItem(args, 0) : nullptr;
            PyObject* mode_obj = PyTuple_Size(args) > 1 ? PyTuple_GetItem(args, 1) : nullptr;
            PyObject* flags_obj = PyTuple_Size(args) > 2 ? PyTuple_GetItem(args, 2) : nullptr;

            std::string mode;
            if (mode_obj != nullptr && PyUnicode_Check(mode_obj)) {
                const char* text = PyUnicode_AsUTF8(mode_obj);
                if (text) mode = text; else PyErr_Clear();
            }
            long flags = 0;
            if (flags_obj != nullptr && PyLong_Check(flags_obj)) {
                flags = PyLong_AsLong(flags_obj);
                if (flags == -1 && PyErr_Occurred()) {
                    PyErr_Clear();
                    flags = O_RDWR;
                }
            }

            std::string path;
            if (!PathFromObject(path_obj, path)) {
                Deny(name, "(file descriptor or unknown path)");
                return false;
            }
            if (IsWriteOpen(mode, flags)) {
                Deny(name, path + " (write)");
                return false;
            }
            if (!IsReadablePath(path)) {
                Deny(name, path);
                return false;
            }
            return true;
        }

        if (name == "os.listdir" || name == "os.scandir") {
            PyObject* path_obj = PyTuple_Size(args) > 0 ? PyTuple_GetItem(args, 0) : nullptr;
            std::string path = ".";
            if (path_obj != nullptr && path_obj != Py_None && !PathFromObject(path_obj, path)) {
                Deny(name, "(file descriptor)");
                return false;
            }
            if (!IsReadablePath(path)) {
                Deny(name, path);
                return false;
            }
        }
        return true;

    } catch (const std::exception& e) {
        // Undecidable events are refused
        Deny(event, e.what());
        return false;
    }
}

} // namespace codebox::scripting
