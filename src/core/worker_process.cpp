// worker_process.cpp - fork/exec of the sandbox worker
#include "codebox/worker_process.h"
#include "codebox/wire_format.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace codebox {

namespace {

std::system_error SystemError(const char* what) {
    return std::system_error(errno, std::generic_category(), what);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Child-side only: async-signal-safe dup onto a fixed descriptor number
bool MoveFd(int from, int to) {
    if (from == to) {
        // dup2 would leave FD_CLOEXEC set
        return fcntl(to, F_SETFD, 0) == 0;
    }
    return dup2(from, to) == to;
}

// Closes every pipe end if construction fails part-way
struct PipeSet {
    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    int control[2] = {-1, -1};
    int exec_status[2] = {-1, -1};

    ~PipeSet() {
        for (int* pair : {out, err, control, exec_status}) {
            CloseFd(pair[0]);
            CloseFd(pair[1]);
        }
    }
};

} // anonymous namespace

std::unique_ptr<WorkerProcess> WorkerProcess::Spawn(const WorkerLaunchOptions& options) {
    if (access(options.executable.c_str(), X_OK) != 0) {
        throw std::system_error(errno, std::generic_category(),
                                "worker executable not usable: " + options.executable);
    }

    PipeSet pipes;
    if (pipe2(pipes.out, O_CLOEXEC) != 0) throw SystemError("stdout pipe");
    if (pipe2(pipes.err, O_CLOEXEC) != 0) throw SystemError("stderr pipe");
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, pipes.control) != 0) throw SystemError("control socket");
    if (pipe2(pipes.exec_status, O_CLOEXEC) != 0) throw SystemError("exec status pipe");

    // Everything the child touches is prepared before fork: after fork only
    // async-signal-safe calls are allowed in a multi-threaded host
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(options.executable.c_str()));
    for (const auto& arg : options.arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& entry : options.environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    struct rlimit nofile{};
    int max_fd = 1024;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, 65536));
    }

    pid_t pid = fork();
    if (pid == -1) {
        throw SystemError("fork");
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0 || !MoveFd(null_fd, STDIN_FILENO)) _exit(127);
        if (!MoveFd(pipes.out[1], STDOUT_FILENO)) _exit(127);
        if (!MoveFd(pipes.err[1], STDERR_FILENO)) _exit(127);
        if (!MoveFd(pipes.control[1], kControlFd)) _exit(127);

        for (int fd = kControlFd + 1; fd < max_fd; ++fd) {
            if (fd != pipes.exec_status[1]) {
                close(fd);
            }
        }

        execve(argv[0], argv.data(), envp.data());

        int exec_errno = errno;
        ssize_t ignored = write(pipes.exec_status[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);  // Also done by the child; whichever runs first wins

    CloseFd(pipes.out[1]);
    CloseFd(pipes.err[1]);
    CloseFd(pipes.control[1]);
    CloseFd(pipes.exec_status[1]);

    // EOF on the status pipe means exec succeeded (CLOEXEC closed it)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(pipes.exec_status[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        throw std::system_error(exec_errno, std::generic_category(), "exec " + options.executable);
    }

    std::unique_ptr<WorkerProcess> worker(
        new WorkerProcess(pid, pipes.out[0], pipes.err[0], pipes.control[0]));
    pipes.out[0] = -1;
    pipes.err[0] = -1;
    pipes.control[0] = -1;

    SetNonBlocking(worker->stdout_fd_);
    SetNonBlocking(worker->stderr_fd_);

    spdlog::debug("Sandbox worker started (pid={})", pid);
    return worker;
}

WorkerProcess::WorkerProcess(pid_t pid, int stdout_fd, int stderr_fd, int control_fd)
    : pid_(pid)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
    , control_fd_(control_fd)
{
}

WorkerProcess::~WorkerProcess() {
    CloseStdout();
    CloseStderr();
    CloseControl();

    if (!exit_status_) {
        Kill();
        int status = 0;
        pid_t reaped;
        do {
            reaped = waitpid(pid_, &status, 0);
        } while (reaped < 0 && errno == EINTR);
        if (reaped == pid_) {
            exit_status_ = status;
        }
        spdlog::debug("Sandbox worker {} released on teardown", pid_);
    }
}

void WorkerProcess::CloseStdout() { CloseFd(stdout_fd_); }
void WorkerProcess::CloseStderr() { CloseFd(stderr_fd_); }
void WorkerProcess::CloseControl() { CloseFd(control_fd_); }

bool WorkerProcess::SendRequest(const std::string& payload) {
    if (control_fd_ < 0) return false;

    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = send(control_fd_, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("Failed to send request to worker {}: {}", pid_, std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }

    shutdown(control_fd_, SHUT_WR);
    SetNonBlocking(control_fd_);
    return true;
}

void WorkerProcess::Kill() {
    if (exit_status_) return;
    killed_ = true;
    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
}

std::optional<int> WorkerProcess::TryReap() {
    if (exit_status_) return exit_status_;

    int status = 0;
    pid_t reaped;
    do {
        reaped = waitpid(pid_, &status, WNOHANG);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid_) {
        exit_status_ = status;
    }
    return exit_status_;
}

std::optional<int> WorkerProcess::WaitFor(std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!TryReap()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return exit_status_;
}

std::string DescribeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        const char* name = strsignal(sig);
        return "signal " + std::to_string(sig) + " (" + (name ? name : "unknown") + ")";
    }
    return "status " + std::to_string(status);
}

} // namespace codebox
