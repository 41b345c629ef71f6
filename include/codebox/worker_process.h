// worker_process.h - One child process hosting the guest interpreter
#pragma once

#include "api_export.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace codebox {

struct WorkerLaunchOptions {
    std::string executable;
    std::vector<std::string> arguments;    // argv[1..]
    std::vector<std::string> environment;  // complete KEY=VALUE list
};

/**
 * WorkerProcess - owns a spawned worker, its pipes and its control socket.
 *
 * Layout inside the child:
 *   fd 0  /dev/null
 *   fd 1  stdout pipe
 *   fd 2  stderr pipe
 *   fd 3  control socket (bidirectional)
 *
 * The child runs in its own process group. Destruction kills the group if the
 * worker is still alive, reaps it and closes every descriptor, so every exit
 * path of the caller releases the worker.
 */
class CODEBOX_API WorkerProcess {
public:
    // Throws std::system_error when the pipes, fork or exec fail
    static std::unique_ptr<WorkerProcess> Spawn(const WorkerLaunchOptions& options);

    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    pid_t Pid() const { return pid_; }

    int StdoutFd() const { return stdout_fd_; }
    int StderrFd() const { return stderr_fd_; }
    int ControlFd() const { return control_fd_; }

    void CloseStdout();
    void CloseStderr();
    void CloseControl();

    // Writes everything to the control socket, then half-closes it.
    // Returns false if the worker went away first.
    bool SendRequest(const std::string& payload);

    // SIGKILL to the whole process group
    void Kill();
    bool WasKilled() const { return killed_; }

    // Non-blocking reap; returns the wait status once the worker has exited
    std::optional<int> TryReap();

    // Polls TryReap until the worker exits or the grace period elapses
    std::optional<int> WaitFor(std::chrono::milliseconds grace);

    bool HasExited() const { return exit_status_.has_value(); }
    std::optional<int> ExitStatus() const { return exit_status_; }

private:
    WorkerProcess(pid_t pid, int stdout_fd, int stderr_fd, int control_fd);

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    int control_fd_;
    bool killed_ = false;
    std::optional<int> exit_status_;
};

// Human-readable form of a wait status ("exit status 1", "signal 9 (Killed)")
CODEBOX_API std::string DescribeWaitStatus(int status);

} // namespace codebox
