#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap a child nobody waited for so it does not linger as a zombie.
    if (pid_ > 0 && !reaped_) {
        int status;
        waitpid(pid_, &status, WNOHANG);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_),
      reaped_(other.reaped_),
      start_error_(std::move(other.start_error_)) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        start_error_ = std::move(other.start_error_);
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

ExitStatus ProcessHandle::wait() {
    ExitStatus result;
    if (pid_ <= 0) {
        result.error = "no process to wait for";
        return result;
    }
    if (reaped_) {
        result.error = fmt::format("process {} was already reaped", pid_);
        return result;
    }

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret != pid_) {
        result.error = fmt::format("waitpid({}): {}", pid_, std::strerror(errno));
        return result;
    }

    reaped_ = true;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.code = WTERMSIG(status);
    }
    return result;
}

// ── spawn ────────────────────────────────────────────────────

// Close every descriptor above stderr except keep. Runs in the forked child,
// so only async-signal-safe calls are allowed.
static void close_inherited_fds(int keep) {
#ifdef SYS_close_range
    bool closed = (keep <= 3 ||
                   syscall(SYS_close_range, 3u, static_cast<unsigned>(keep - 1), 0u) == 0) &&
                  syscall(SYS_close_range, static_cast<unsigned>(keep + 1), ~0u, 0u) == 0;
    if (closed) return;
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (int fd = 3; fd < max_fd; ++fd) {
        if (fd != keep) close(fd);
    }
}

// The child reports exec failure by writing errno into a close-on-exec
// pipe. A successful exec closes the pipe, so the parent reads EOF.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log) {
    ProcessHandle handle;

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        handle.start_error_ = fmt::format("pipe: {}", std::strerror(errno));
        return handle;
    }

    // Build argv before forking; the child must not allocate.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        handle.start_error_ = fmt::format("fork: {}", std::strerror(errno));
        close(err_pipe[0]);
        close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!output_log.empty()) {
            int fd = open(output_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        // Descriptors opened elsewhere in this process (daemon log, other
        // jobs' logs) must not leak into the pipeline.
        close_inherited_fds(err_pipe[1]);

        // Own process group: a terminal Ctrl-C reaches the watcher only,
        // which then waits for this job instead of losing it.
        setpgid(0, 0);

        // Undo the parent's signal mask so the pipeline can be interrupted.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        int err = errno;
        ssize_t n = write(err_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(EXEC_FAILED_EXIT);
    }

    // Parent
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed: reap the child and report why
        int status;
        waitpid(pid, &status, 0);
        handle.start_error_ = fmt::format("{}: {}", program, std::strerror(child_errno));
        return handle;
    }

    handle.pid_ = pid;
    return handle;
}

} // namespace platform
