#include "job_runner.hpp"
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <chrono>
#include <fstream>

namespace fs = std::filesystem;

// Append a timestamped line to a job's log file.
static void append_job_log(const fs::path& log_path, const std::string& msg) {
    if (log_path.empty()) return;
    std::ofstream f(log_path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

SubprocessRunner::SubprocessRunner(std::vector<std::string> command,
                                   fs::path job_log_dir)
    : command_(std::move(command)), job_log_dir_(std::move(job_log_dir)) {}

fs::path SubprocessRunner::job_log_path(const fs::path& path) const {
    if (job_log_dir_.empty()) return {};
    return job_log_dir_ / (path.filename().string() + ".log");
}

std::string SubprocessRunner::check_command_paths() const {
    if (command_.empty()) {
        return "no pipeline command configured";
    }
    for (size_t i = 1; i < command_.size(); ++i) {
        const fs::path arg(command_[i]);
        std::error_code ec;
        if (arg.is_absolute() && !fs::exists(arg, ec)) {
            return fmt::format("{}: No such file or directory", command_[i]);
        }
    }
    return "";
}

JobResult SubprocessRunner::run(const fs::path& path) {
    JobResult result;
    result.path = path;
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    fs::path log_path = job_log_path(path);

    std::string problem = check_command_paths();
    if (!problem.empty()) {
        result.status = JobStatus::StartFailed;
        result.error = problem;
        append_job_log(log_path, "could not start: " + problem);
        result.duration = elapsed();
        return result;
    }

    std::vector<std::string> args(command_.begin() + 1, command_.end());
    args.push_back(path.string());

    append_job_log(log_path, fmt::format("starting: {} {}", join_command(command_),
                                         path.string()));

    auto proc = platform::spawn(command_[0], args, log_path.string());
    if (!proc.valid()) {
        result.status = JobStatus::StartFailed;
        result.error = proc.start_error();
        append_job_log(log_path, "could not start: " + result.error);
        result.duration = elapsed();
        return result;
    }

    auto status = proc.wait();
    result.duration = elapsed();

    if (!status.exited && !status.signaled) {
        result.status = JobStatus::Lost;
        result.error = status.error;
        append_job_log(log_path, "exit status unknown: " + status.error);
    } else if (status.signaled) {
        result.status = JobStatus::Signaled;
        result.exit_code = status.code;
        append_job_log(log_path, fmt::format("killed by signal {}", status.code));
    } else {
        result.status = JobStatus::Exited;
        result.exit_code = status.code;
        append_job_log(log_path, fmt::format("exit code {}", status.code));
    }
    return result;
}
