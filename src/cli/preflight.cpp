#include "preflight.hpp"
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <fmt/format.h>
#include <util/string_utils.hpp>

namespace fs = std::filesystem;

std::string find_executable(const std::string& program) {
    if (program.empty()) return "";

    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0 ? program : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/bin:/bin";
    for (const auto& dir : StringUtils::split(search, ':')) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

std::vector<PreflightIssue> check_watch_dir(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& dir = config.watch().watch_dir;

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        issues.push_back({"Watch directory does not exist: " + dir.string(),
                          "Create it, or fix watch_dir in the config"});
    } else if (!fs::is_directory(dir, ec)) {
        issues.push_back({"Watch path is not a directory: " + dir.string(),
                          "Point watch_dir at a directory"});
    }
    return issues;
}

// Missing pipeline pieces are hints, not errors: each dispatched file is
// then reported as "could not start" and the watcher keeps running.
std::vector<PreflightIssue> check_pipeline(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& cmd = config.watch().pipeline;
    if (cmd.empty()) return issues;

    if (find_executable(cmd[0]).empty()) {
        issues.push_back({fmt::format("Pipeline program not found: {}", cmd[0]),
                          "Install it or fix pipeline in the config", true});
    }

    for (size_t i = 1; i < cmd.size(); ++i) {
        fs::path arg(cmd[i]);
        std::error_code ec;
        if (arg.is_absolute() && !fs::exists(arg, ec)) {
            issues.push_back({fmt::format("Pipeline argument not found: {}", cmd[i]),
                              "Fix pipeline in the config", true});
        }
    }
    return issues;
}

std::vector<PreflightIssue> check_log_dir(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& dir = config.watch().log_dir;
    if (dir.empty()) return issues;

    std::error_code ec;
    if (fs::exists(dir, ec) && access(dir.c_str(), W_OK) != 0) {
        issues.push_back({"Log directory is not writable: " + dir.string(),
                          "Fix permissions or choose another log_dir"});
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const Config& config) {
    std::vector<PreflightIssue> issues;
    for (auto&& check : {check_watch_dir, check_pipeline, check_log_dir}) {
        auto found = check(config);
        issues.insert(issues.end(), found.begin(), found.end());
    }
    return issues;
}
