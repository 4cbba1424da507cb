#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

// Runs the processing pipeline for one file and reports how it ended.
// Called concurrently from job threads, once per admitted file.
class JobRunner {
public:
    virtual ~JobRunner() = default;
    virtual JobResult run(const std::filesystem::path& path) = 0;
};

// Runs the configured command as a subprocess with the file path appended
// as the last argument, and waits for it. Exit codes are reported, never
// interpreted or retried.
class SubprocessRunner : public JobRunner {
public:
    // job_log_dir: when non-empty, the child's stdout/stderr are appended to
    // <job_log_dir>/<file name>.log.
    explicit SubprocessRunner(std::vector<std::string> command,
                              std::filesystem::path job_log_dir = {});

    JobResult run(const std::filesystem::path& path) override;

    std::filesystem::path job_log_path(const std::filesystem::path& path) const;

private:
    std::vector<std::string> command_;
    std::filesystem::path job_log_dir_;

    // Catches a missing script behind an interpreter ("python3 /x/automate.py"),
    // which exec alone would not report.
    std::string check_command_paths() const;
};
