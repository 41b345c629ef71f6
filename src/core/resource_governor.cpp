// resource_governor.cpp - rlimit ceilings and deadline bookkeeping
#include "codebox/resource_governor.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <csignal>
#include <cstring>
#include <spdlog/spdlog.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <unistd.h>

namespace codebox {

namespace {

// Lowers the soft and hard limit to `value`, never raising an existing hard limit
bool LowerLimit(int resource, rlim_t value, std::string& error) {
    struct rlimit current{};
    if (getrlimit(resource, &current) != 0) {
        error = std::strerror(errno);
        return false;
    }

    struct rlimit wanted{};
    wanted.rlim_max = (current.rlim_max == RLIM_INFINITY) ? value : std::min(value, current.rlim_max);
    wanted.rlim_cur = std::min(value, wanted.rlim_max);

    if (setrlimit(resource, &wanted) != 0) {
        error = std::strerror(errno);
        return false;
    }
    return true;
}

} // anonymous namespace

// ===== DeadlineTimer =====

void DeadlineTimer::Arm(Phase phase, std::chrono::milliseconds budget) {
    phase_ = phase;
    armed_at_ = std::chrono::steady_clock::now();
    expires_at_ = armed_at_ + budget;
}

bool DeadlineTimer::Expired() const {
    if (phase_ == Phase::Disarmed) return false;
    return std::chrono::steady_clock::now() >= expires_at_;
}

int DeadlineTimer::RemainingMs() const {
    if (phase_ == Phase::Disarmed) return -1;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        expires_at_ - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) return 0;
    return static_cast<int>(std::min<long long>(remaining, INT_MAX));
}

// ===== ResourceGovernor =====

ResourceGovernor::ResourceGovernor(const ExecutionLimits& limits)
    : limits_(limits)
{
}

std::vector<std::string> ResourceGovernor::ApplyStartupLimits() const {
    std::vector<std::string> degraded;
    std::string error;

    if (!LowerLimit(RLIMIT_CORE, 0, error)) {
        spdlog::warn("Could not disable core dumps: {}", error);
    }

    if (limits_.max_memory_mb > 0) {
        const rlim_t bytes = static_cast<rlim_t>(limits_.max_memory_mb) * 1024 * 1024;
        if (!LowerLimit(RLIMIT_AS, bytes, error)) {
            degraded.push_back("memory ceiling (RLIMIT_AS) not enforced: " + error);
        } else {
            spdlog::debug("Memory ceiling set to {} MB", limits_.max_memory_mb);
        }
    }

    return degraded;
}

std::vector<std::string> ResourceGovernor::ApplyRunLimits(int timeout_seconds) const {
    std::vector<std::string> degraded;
    std::string error;

    // CPU ceiling is a backstop behind the host's wall-clock deadline
    const double used = ConsumedCpuSeconds();
    const rlim_t cpu_soft = static_cast<rlim_t>(std::ceil(used)) + static_cast<rlim_t>(timeout_seconds) + 1;
    struct rlimit cpu{};
    if (getrlimit(RLIMIT_CPU, &cpu) != 0) {
        degraded.push_back(std::string("CPU-time ceiling (RLIMIT_CPU) not enforced: ") + std::strerror(errno));
    } else {
        struct rlimit wanted{};
        wanted.rlim_max = (cpu.rlim_max == RLIM_INFINITY) ? cpu_soft + 1 : std::min(cpu_soft + 1, cpu.rlim_max);
        wanted.rlim_cur = std::min(cpu_soft, wanted.rlim_max);
        if (setrlimit(RLIMIT_CPU, &wanted) != 0) {
            degraded.push_back(std::string("CPU-time ceiling (RLIMIT_CPU) not enforced: ") + std::strerror(errno));
        }
    }

    // Writes fail with EFBIG instead of killing the worker
    std::signal(SIGXFSZ, SIG_IGN);
    if (!LowerLimit(RLIMIT_FSIZE, 0, error)) {
        degraded.push_back("file-size ceiling (RLIMIT_FSIZE) not enforced: " + error);
    }

    if (!LowerLimit(RLIMIT_NPROC, 0, error)) {
        degraded.push_back("process-count ceiling (RLIMIT_NPROC) not enforced: " + error);
    } else if (geteuid() == 0) {
        degraded.push_back("process-count ceiling (RLIMIT_NPROC) is ignored for root");
    }

    if (limits_.max_open_files > 0) {
        if (!LowerLimit(RLIMIT_NOFILE, static_cast<rlim_t>(limits_.max_open_files), error)) {
            degraded.push_back("open-file ceiling (RLIMIT_NOFILE) not enforced: " + error);
        }
    }

    return degraded;
}

double ResourceGovernor::ConsumedCpuSeconds() {
    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    const double user = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6;
    const double system = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
    return user + system;
}

std::chrono::milliseconds ResourceGovernor::StartupBudget() const {
    return std::chrono::seconds(std::max(limits_.startup_timeout_seconds, 1));
}

std::chrono::milliseconds ResourceGovernor::RunBudget(int timeout_seconds) const {
    return std::chrono::seconds(std::max(timeout_seconds, 1));
}

std::chrono::milliseconds ResourceGovernor::KillGrace() const {
    return std::chrono::milliseconds(std::max(limits_.kill_grace_ms, 0));
}

} // namespace codebox
