// guest_interpreter.h - Embedded CPython lifetime for one worker process
#pragma once

#include <string>

namespace codebox::scripting {

/**
 * GuestInterpreter - starts the embedded interpreter on the worker's main thread.
 *
 * A worker hosts exactly one guest run, so the GIL is never released and the
 * interpreter is never shared. The worker exits without finalizing: process
 * exit releases everything the guest or the libraries allocated.
 */
class GuestInterpreter {
public:
    GuestInterpreter() = default;
    ~GuestInterpreter();

    GuestInterpreter(const GuestInterpreter&) = delete;
    GuestInterpreter& operator=(const GuestInterpreter&) = delete;

    bool Initialize();
    void Shutdown();

    bool IsInitialized() const { return initialized_; }
    const std::string& GetLastError() const { return last_error_; }

    // "3.11.2" once initialized
    std::string GetVersion() const;

private:
    bool initialized_ = false;
    std::string last_error_;
};

} // namespace codebox::scripting
