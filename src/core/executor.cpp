// executor.cpp - Worker process supervision and output capture
#include "codebox/executor.h"
#include "codebox/bounded_buffer.h"
#include "codebox/wire_format.h"
#include "codebox/worker_process.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace codebox {

namespace {

using Clock = std::chrono::steady_clock;

double SecondsBetween(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<double>(end - start).count();
}

void Fail(ExecutionOutcome& outcome, ExecutionState state, ErrorKind kind, std::string message) {
    outcome.state = state;
    outcome.success = false;
    outcome.error = ExecutionError{kind, std::move(message), ""};
}

// Reads whatever is available without blocking. Returns false on EOF or error.
bool Drain(int fd, const std::function<void(const char*, size_t)>& sink) {
    char chunk[16384];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            sink(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        spdlog::warn("Read from worker failed: {}", std::strerror(errno));
        return false;
    }
}

// Saturating size arithmetic for budgets derived from caller limits
size_t Add(size_t a, size_t b) {
    return a > std::numeric_limits<size_t>::max() - b ? std::numeric_limits<size_t>::max() : a + b;
}

size_t Mul(size_t a, size_t b) {
    return (b != 0 && a > std::numeric_limits<size_t>::max() / b) ? std::numeric_limits<size_t>::max() : a * b;
}

std::filesystem::path PlotConfigDir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    dir /= "codebox-mpl-" + std::to_string(getuid());
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Could not create plotting cache dir {}: {}", dir.string(), ec.message());
    }
    return dir;
}

/**
 * Per-run supervision state. Lives on the stack of one Run call.
 */
class RunSupervisor {
public:
    RunSupervisor(const ExecutionLimits& limits, const ResourceGovernor& governor,
                  WorkerProcess& worker, int timeout_seconds, std::string channel_token)
        : limits_(limits)
        , governor_(governor)
        , worker_(worker)
        , timeout_seconds_(timeout_seconds)
        , channel_token_(std::move(channel_token))
        , stdout_(limits.max_output_chars)
        , stderr_(limits.max_output_chars)
        , spawned_at_(Clock::now())
    {
        // Room for every artifact at its cap plus the variable snapshot
        max_control_bytes_ = Add(Add(Mul(limits.max_artifacts, Add(limits.max_artifact_bytes, 4096)),
                                     Mul(limits.max_variables, Add(Mul(limits.max_variable_chars, 6), 256))),
                                 size_t{1} << 20);
        deadline_.Arm(DeadlineTimer::Phase::Startup, governor_.StartupBudget());
    }

    void Pump() {
        while (true) {
            struct pollfd fds[3];
            int count = 0;
            const int watched[3] = {worker_.StdoutFd(), worker_.StderrFd(), worker_.ControlFd()};
            for (int fd : watched) {
                if (fd >= 0) {
                    fds[count].fd = fd;
                    fds[count].events = POLLIN;
                    fds[count].revents = 0;
                    ++count;
                }
            }
            if (count == 0) break;

            if (deadline_.Expired()) {
                Expire();
                return;
            }

            int rc = poll(fds, static_cast<nfds_t>(count), deadline_.RemainingMs());
            if (rc < 0) {
                if (errno == EINTR) continue;
                spdlog::error("poll on worker {} failed: {}", worker_.Pid(), std::strerror(errno));
                protocol_error_ = "poll failed: " + std::string(std::strerror(errno));
                worker_.Kill();
                return;
            }
            if (rc == 0) continue;  // deadline check at the top of the loop

            for (int i = 0; i < count; ++i) {
                if (fds[i].revents == 0) continue;
                const int fd = fds[i].fd;
                if (fd == worker_.StdoutFd()) {
                    if (!Drain(fd, [this](const char* d, size_t n) { stdout_.Append(d, n); })) {
                        worker_.CloseStdout();
                    }
                } else if (fd == worker_.StderrFd()) {
                    if (!Drain(fd, [this](const char* d, size_t n) { stderr_.Append(d, n); })) {
                        worker_.CloseStderr();
                    }
                } else if (fd == worker_.ControlFd()) {
                    bool open = Drain(fd, [this](const char* d, size_t n) { control_.append(d, n); });
                    ConsumeControlLines();
                    if (!open) {
                        if (!control_.empty()) {
                            RejectControl("control channel closed inside a message");
                        }
                        worker_.CloseControl();
                    }
                    if (timed_out_) {
                        return;
                    }
                    if (!protocol_error_.empty() || tampered_) {
                        worker_.Kill();
                        DrainOutput();
                        return;
                    }
                }
            }
        }

        // All streams closed: the worker is exiting. Give it the rest of the
        // deadline (or the kill grace, whichever is longer) to be reaped.
        auto wait = std::chrono::milliseconds(std::max(deadline_.RemainingMs(), 0));
        if (wait < governor_.KillGrace()) wait = governor_.KillGrace();
        if (!worker_.WaitFor(wait)) {
            if (deadline_.Expired() && !result_) {
                Expire();
            } else {
                worker_.Kill();
            }
        }
    }

    ExecutionOutcome Finish() {
        // The WorkerProcess destructor would reap too; doing it here lets the
        // exit status take part in classification
        if (worker_.WasKilled()) {
            worker_.WaitFor(governor_.KillGrace());
        }

        const auto finished_at = Clock::now();
        ExecutionOutcome outcome;
        outcome.timeout_seconds = timeout_seconds_;
        outcome.state = ready_ ? ExecutionState::Running : ExecutionState::Idle;
        outcome.elapsed_seconds = SecondsBetween(ready_ ? running_since_ : spawned_at_, finished_at);
        outcome.degraded_guarantees = degraded_;

        if (tampered_) {
            Fail(outcome, ExecutionState::Faulted, ErrorKind::SecurityViolation,
                 "Security violation: guest code wrote to the sandbox control channel");
        } else if (result_ && protocol_error_.empty()) {
            // Accepted before the deadline; the worker may have lingered afterwards
            ApplyResult(outcome);
        } else if (timed_out_) {
            if (timed_out_phase_ == DeadlineTimer::Phase::Run) {
                Fail(outcome, ExecutionState::TimedOut, ErrorKind::Timeout,
                     "Code execution timed out after " + std::to_string(timeout_seconds_) + " seconds");
            } else {
                Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
                     "Sandbox worker did not become ready within " +
                     std::to_string(limits_.startup_timeout_seconds) + " seconds");
            }
        } else if (!protocol_error_.empty()) {
            Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
                 "Sandbox worker protocol error: " + protocol_error_);
        } else {
            ClassifyAbnormalExit(outcome);
        }

        outcome.output = stdout_.Render();
        outcome.error_output = stderr_.Render();
        outcome.output_truncated = stdout_.IsTruncated() || stderr_.IsTruncated();
        outcome.degraded = !outcome.degraded_guarantees.empty();

        // Every failure carries a classification
        if (!outcome.success && !outcome.error) {
            Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
                 "Sandbox worker ended without reporting a result");
        }
        return outcome;
    }

private:
    void Expire() {
        timed_out_ = true;
        timed_out_phase_ = deadline_.GetPhase();
        spdlog::warn("Worker {} exceeded its {} deadline, terminating", worker_.Pid(),
                     timed_out_phase_ == DeadlineTimer::Phase::Run ? "run" : "startup");
        worker_.Kill();
        DrainOutput();
    }

    // Keeps whatever the guest already wrote
    void DrainOutput() {
        if (worker_.StdoutFd() >= 0) {
            Drain(worker_.StdoutFd(), [this](const char* d, size_t n) { stdout_.Append(d, n); });
        }
        if (worker_.StderrFd() >= 0) {
            Drain(worker_.StderrFd(), [this](const char* d, size_t n) { stderr_.Append(d, n); });
        }
    }

    // Once the guest may run, anything malformed on the channel came from it
    void RejectControl(const std::string& reason) {
        if (ready_) {
            spdlog::warn("Worker {} control channel tampered with: {}", worker_.Pid(), reason);
            tampered_ = true;
        } else {
            protocol_error_ = reason;
        }
    }

    void ConsumeControlLines() {
        if (control_.size() > max_control_bytes_) {
            RejectControl("control message exceeds " + std::to_string(max_control_bytes_) + " bytes");
            return;
        }

        size_t newline;
        while ((newline = control_.find('\n')) != std::string::npos) {
            std::string line = control_.substr(0, newline);
            control_.erase(0, newline + 1);
            if (line.empty()) continue;

            auto message = DecodeControlMessage(line, channel_token_);
            if (!message) {
                RejectControl("undecodable or unauthenticated control message");
                return;
            }
            if (result_) {
                RejectControl("control message after the result");
                return;
            }

            if (message->ready) {
                if (ready_) {
                    protocol_error_ = "duplicate ready message";
                    return;
                }
                ready_ = true;
                running_since_ = Clock::now();
                for (const auto& note : message->ready->degraded_guarantees) {
                    degraded_.push_back(note);
                }
                for (const auto& module : message->ready->unavailable_modules) {
                    spdlog::debug("Guest module unavailable in worker: {}", module);
                }
                deadline_.Arm(DeadlineTimer::Phase::Run, governor_.RunBudget(timeout_seconds_));
                spdlog::debug("Worker {} ready, deadline armed for {}s", worker_.Pid(), timeout_seconds_);
            } else if (message->result) {
                if (!ready_) {
                    // Startup failures are reported without a ready message
                    result_ = std::move(message->result);
                } else if (deadline_.Expired()) {
                    spdlog::warn("Worker {} result arrived after the deadline, discarded", worker_.Pid());
                    Expire();
                    return;
                } else {
                    result_ = std::move(message->result);
                }
            }
        }
    }

    void ApplyResult(ExecutionOutcome& outcome) {
        WorkerResult& result = *result_;
        outcome.state = result.state;
        outcome.error = result.error;
        outcome.success = (result.state == ExecutionState::Completed) && !result.error;
        outcome.variables = std::move(result.variables);
        outcome.variables_omitted = result.variables_omitted;
        outcome.artifacts = std::move(result.artifacts);
        outcome.artifacts_dropped = result.artifacts_dropped;
        for (auto& note : result.degraded_guarantees) {
            outcome.degraded_guarantees.push_back(std::move(note));
        }
    }

    void ClassifyAbnormalExit(ExecutionOutcome& outcome) {
        const auto status = worker_.ExitStatus();
        if (!status) {
            Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
                 "Sandbox worker could not be reaped");
            return;
        }

        const std::string description = DescribeWaitStatus(*status);
        if (WIFSIGNALED(*status)) {
            const int sig = WTERMSIG(*status);
            if (sig == SIGXCPU) {
                Fail(outcome, ExecutionState::TimedOut, ErrorKind::Timeout,
                     "Code execution exceeded its CPU-time limit (" +
                     std::to_string(timeout_seconds_) + " seconds)");
                return;
            }
            if (sig == SIGKILL && worker_.WasKilled()) {
                Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
                     "Sandbox worker stopped responding after closing its output and was killed");
                return;
            }
            if (sig == SIGKILL || sig == SIGSEGV || sig == SIGBUS || sig == SIGABRT) {
                // Not our kill: the kernel or an allocator gave up under the memory ceiling
                Fail(outcome, ExecutionState::LimitExceeded, ErrorKind::ResourceLimitExceeded,
                     "Sandbox worker terminated by " + description +
                     ", most likely after exhausting its " + std::to_string(limits_.max_memory_mb) +
                     " MB memory limit");
                return;
            }
            Fail(outcome, ExecutionState::Faulted, ErrorKind::GuestRuntimeError,
                 "Sandbox worker terminated by " + description);
            return;
        }

        Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
             "Sandbox worker ended with " + description + " before reporting a result");
    }

    const ExecutionLimits& limits_;
    const ResourceGovernor& governor_;
    WorkerProcess& worker_;
    const int timeout_seconds_;
    const std::string channel_token_;

    BoundedBuffer stdout_;
    BoundedBuffer stderr_;
    std::string control_;
    size_t max_control_bytes_ = 0;

    DeadlineTimer deadline_;
    Clock::time_point spawned_at_;
    Clock::time_point running_since_{};
    bool ready_ = false;
    bool timed_out_ = false;
    bool tampered_ = false;
    DeadlineTimer::Phase timed_out_phase_ = DeadlineTimer::Phase::Disarmed;
    std::string protocol_error_;
    std::vector<std::string> degraded_;
    std::optional<WorkerResult> result_;
};

} // anonymous namespace

WorkerProcessExecutor::WorkerProcessExecutor(const ExecutionLimits& limits, WorkerExecutorOptions options)
    : limits_(limits)
    , governor_(limits)
    , options_(std::move(options))
{
    spdlog::info("Worker executor configured: {}", options_.worker_path);
}

std::vector<std::string> WorkerProcessExecutor::BuildEnvironment() const {
    std::vector<std::string> env;
    for (const auto& key : options_.passthrough_env) {
        if (const char* value = std::getenv(key.c_str())) {
            env.push_back(key + "=" + value);
        }
    }

    static const std::string plot_dir = PlotConfigDir().string();
    env.push_back("HOME=" + plot_dir);
    env.push_back("MPLCONFIGDIR=" + plot_dir);
    env.push_back("MPLBACKEND=Agg");
    env.push_back("PYTHONUNBUFFERED=1");
    env.push_back("PYTHONDONTWRITEBYTECODE=1");
    env.push_back("PYTHONNOUSERSITE=1");
    env.push_back("PYTHONIOENCODING=utf-8");
    // Single-threaded numeric backends: the process-count ceiling also caps threads
    env.push_back("OPENBLAS_NUM_THREADS=1");
    env.push_back("OMP_NUM_THREADS=1");
    env.push_back("MKL_NUM_THREADS=1");
    return env;
}

std::vector<std::string> WorkerProcessExecutor::BuildArguments() const {
    std::vector<std::string> args;
    if (!options_.worker_log_file.empty()) {
        args.push_back("--log-file");
        args.push_back(options_.worker_log_file);
    }
    return args;
}

ExecutionOutcome WorkerProcessExecutor::Run(const ExecutionRequest& request, int timeout_seconds) {
    std::unique_ptr<WorkerProcess> worker;
    try {
        worker = WorkerProcess::Spawn({options_.worker_path, BuildArguments(), BuildEnvironment()});
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start sandbox worker: {}", e.what());
        ExecutionOutcome outcome;
        outcome.timeout_seconds = timeout_seconds;
        Fail(outcome, ExecutionState::Faulted, ErrorKind::InternalError,
             std::string("Failed to start sandbox worker: ") + e.what());
        return outcome;
    }

    WorkerRequest worker_request;
    worker_request.source_code = request.source_code;
    worker_request.timeout_seconds = timeout_seconds;
    worker_request.limits = limits_;
    worker_request.disabled_modules = options_.disabled_modules;
    worker_request.channel_token = GenerateChannelToken();

    const nlohmann::json payload = worker_request;
    if (!worker->SendRequest(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n")) {
        // The worker died early; its exit status and stderr tell why
        spdlog::warn("Worker {} did not accept the request", worker->Pid());
    }

    RunSupervisor supervisor(limits_, governor_, *worker, timeout_seconds, worker_request.channel_token);
    supervisor.Pump();
    ExecutionOutcome outcome = supervisor.Finish();

    spdlog::info("Guest run finished: state={} elapsed={:.3f}s output={}B",
                 GetExecutionStateName(outcome.state), outcome.elapsed_seconds, outcome.output.size());
    return outcome;
}

} // namespace codebox
