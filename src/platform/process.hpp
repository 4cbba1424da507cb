#pragma once

#include <string>
#include <vector>

namespace platform {

// How a child process ended.
struct ExitStatus {
    bool exited = false;     // normal exit; code holds the exit status
    bool signaled = false;   // killed; code holds the signal number
    int code = -1;
    std::string error;       // set when neither: the child could not be waited for
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned and exec'd).
    bool valid() const;

    // Why the spawn failed (fork error, or exec error such as ENOENT/EACCES).
    // Empty when valid().
    const std::string& start_error() const { return start_error_; }

    // Block until the process exits and reap it.
    ExitStatus wait();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    std::string start_error_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& output_log);
};

// Spawn a child process with stdin closed, in its own process group, with no
// descriptors inherited beyond stdin, stdout and stderr.
// output_log: if non-empty, the child's stdout and stderr are appended to this file.
// An exec failure is reported through start_error(), never as an exit code.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "");

} // namespace platform
