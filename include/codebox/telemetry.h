// telemetry.h - Per-service invocation counters
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <cstdint>
#include <functional>
#include <mutex>

namespace codebox {

struct TelemetrySnapshot {
    uint64_t invocations = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;          // executed but not successful
    uint64_t rejections = 0;        // refused before any worker was spawned
    uint64_t security_violations = 0;
    uint64_t timeouts = 0;
    uint64_t limit_exceeded = 0;
    uint64_t internal_errors = 0;
    double total_elapsed_seconds = 0.0;
    double max_elapsed_seconds = 0.0;

    double AverageElapsedSeconds() const {
        const uint64_t executed = successes + failures;
        return executed == 0 ? 0.0 : total_elapsed_seconds / static_cast<double>(executed);
    }
};

// Called after every update with the new totals
using TelemetrySink = std::function<void(const TelemetrySnapshot&)>;

/**
 * Telemetry - the only mutable state shared between concurrent requests.
 * Counters only ever grow; invocations == successes + failures + rejections.
 */
class CODEBOX_API Telemetry {
public:
    Telemetry() = default;

    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    void RecordOutcome(const ExecutionOutcome& outcome);
    void RecordRejection(const RejectedRequest& rejection);

    TelemetrySnapshot GetSnapshot() const;

    void SetSink(TelemetrySink sink);

private:
    void Publish(const TelemetrySnapshot& snapshot);

    mutable std::mutex mutex_;
    TelemetrySnapshot counters_;
    TelemetrySink sink_;
};

} // namespace codebox
