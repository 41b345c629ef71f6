// telemetry.cpp - Invocation counters
#include "codebox/telemetry.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace codebox {

void Telemetry::RecordOutcome(const ExecutionOutcome& outcome) {
    TelemetrySnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.invocations++;
        if (outcome.success) {
            counters_.successes++;
        } else {
            counters_.failures++;
            if (outcome.error) {
                switch (outcome.error->kind) {
                    case ErrorKind::SecurityViolation: counters_.security_violations++; break;
                    case ErrorKind::Timeout: counters_.timeouts++; break;
                    case ErrorKind::ResourceLimitExceeded: counters_.limit_exceeded++; break;
                    case ErrorKind::InternalError: counters_.internal_errors++; break;
                    default: break;
                }
            }
        }
        const double elapsed = std::max(outcome.elapsed_seconds, 0.0);
        counters_.total_elapsed_seconds += elapsed;
        counters_.max_elapsed_seconds = std::max(counters_.max_elapsed_seconds, elapsed);
        snapshot = counters_;
    }
    Publish(snapshot);
}

void Telemetry::RecordRejection(const RejectedRequest& rejection) {
    TelemetrySnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.invocations++;
        counters_.rejections++;
        if (rejection.kind == ErrorKind::SecurityViolation) {
            counters_.security_violations++;
        }
        snapshot = counters_;
    }
    Publish(snapshot);
}

TelemetrySnapshot Telemetry::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

void Telemetry::SetSink(TelemetrySink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::Publish(const TelemetrySnapshot& snapshot) {
    TelemetrySink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (!sink) return;

    // A failing sink must not fail the request it is reporting on
    try {
        sink(snapshot);
    } catch (const std::exception& e) {
        spdlog::warn("Telemetry sink failed: {}", e.what());
    }
}

} // namespace codebox
