#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Runs all preflight checks before watching.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const Config& config);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_watch_dir(const Config& config);
std::vector<PreflightIssue> check_pipeline(const Config& config);
std::vector<PreflightIssue> check_log_dir(const Config& config);

// Resolve a program the way execvp() would. Empty if not found.
std::string find_executable(const std::string& program);
