// capability_policy.h - Interpreter audit hook guarding the guest run
#pragma once

#include <Python.h>
#include <string>
#include <vector>

namespace codebox::scripting {

/**
 * CapabilityPolicy - PEP 578 audit hook installed from C++.
 *
 * Once armed, the hook refuses process creation, signals, sockets, ctypes,
 * any write-mode open, filesystem mutation and reads outside the read roots
 * (interpreter library paths, the plotting cache, zoneinfo, fonts). Refused
 * events raise PermissionError inside the guest and are recorded, so a guest
 * that catches the exception is still classified as a security violation.
 *
 * Audit hooks cannot be removed once added, so the policy is a process-wide
 * singleton; Disarm() turns it into a pass-through.
 */
class CapabilityPolicy {
public:
    static CapabilityPolicy& Instance();

    CapabilityPolicy(const CapabilityPolicy&) = delete;
    CapabilityPolicy& operator=(const CapabilityPolicy&) = delete;

    // Adds the hook (once). Returns false if the interpreter refused it.
    bool Install();
    bool IsInstalled() const { return installed_; }

    // Requires the GIL: read roots are taken from sys.path
    void Arm();
    void Disarm();
    bool IsArmed() const { return armed_; }

    void SetReadRoots(std::vector<std::string> roots) { read_roots_ = std::move(roots); }
    const std::vector<std::string>& GetReadRoots() const { return read_roots_; }

    // Events refused since the last Arm()
    const std::vector<std::string>& GetViolations() const { return violations_; }
    bool HasViolations() const { return !violations_.empty(); }

    // Pure decisions, usable without an interpreter
    static bool IsDeniedEvent(const std::string& event);
    static bool IsWriteOpen(const std::string& mode, long flags);
    bool IsReadablePath(const std::string& path) const;

    // Called by the C hook; returns false to refuse the event
    bool Check(const char* event, PyObject* args);

private:
    CapabilityPolicy() = default;

    void Deny(const std::string& event, const std::string& detail);

    bool installed_ = false;
    bool armed_ = false;
    std::vector<std::string> read_roots_;
    std::vector<std::string> violations_;
};

} // namespace codebox::scripting
