// resource_governor.h - CPU, memory and wall-clock ceilings around a guest run
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <chrono>
#include <string>
#include <vector>

namespace codebox {

/**
 * Wall-clock deadline for one governed run.
 *
 * The worker first gets a startup budget (interpreter start and namespace
 * build). Once it reports ready the timer is re-armed with the guest timeout,
 * so slow library imports never eat into the caller's budget.
 */
class CODEBOX_API DeadlineTimer {
public:
    enum class Phase {
        Disarmed,
        Startup,
        Run
    };

    void Arm(Phase phase, std::chrono::milliseconds budget);

    Phase GetPhase() const { return phase_; }
    bool Expired() const;

    // Milliseconds until expiry, suitable for poll(); -1 when disarmed
    int RemainingMs() const;

    std::chrono::steady_clock::time_point ArmedAt() const { return armed_at_; }

private:
    Phase phase_ = Phase::Disarmed;
    std::chrono::steady_clock::time_point armed_at_{};
    std::chrono::steady_clock::time_point expires_at_{};
};

/**
 * ResourceGovernor - applies the ExecutionLimits ceilings.
 *
 * Worker side, the ceilings are process rlimits that die with the worker.
 * Host side, the governor owns the deadline policy; the WorkerProcess
 * destructor guarantees the kill and reap on every exit path.
 *
 * Every Apply* call returns the guarantees it could not enforce. A non-empty
 * list marks the outcome degraded instead of silently claiming enforcement.
 */
class CODEBOX_API ResourceGovernor {
public:
    explicit ResourceGovernor(const ExecutionLimits& limits);

    // Before the interpreter starts: address-space ceiling, no core dumps
    std::vector<std::string> ApplyStartupLimits() const;

    // After the namespace is built: CPU time, file size, process count, open files
    std::vector<std::string> ApplyRunLimits(int timeout_seconds) const;

    // CPU seconds consumed by this process so far
    static double ConsumedCpuSeconds();

    std::chrono::milliseconds StartupBudget() const;
    std::chrono::milliseconds RunBudget(int timeout_seconds) const;
    std::chrono::milliseconds KillGrace() const;

    const ExecutionLimits& GetLimits() const { return limits_; }

private:
    const ExecutionLimits limits_;
};

} // namespace codebox
