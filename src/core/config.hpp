#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Values given on the command line. Empty fields leave the file's value alone.
struct ConfigOverrides {
    std::string watch_dir;
    std::string pipeline;        // whitespace-separated command
    std::string log_dir;
    bool scan_existing = false;
};

class Config {
public:
    // Load a YAML config file, apply command-line overrides, then validate.
    static Result<Config> load(const fs::path& path, const ConfigOverrides& overrides = {});

    // Build a config without a file (everything from overrides).
    static Result<Config> from_overrides(const ConfigOverrides& overrides);

    const WatchConfig& watch() const { return watch_; }
    const fs::path& source_path() const { return source_path_; }

    // Per-file job logs live here; empty when no log_dir is configured.
    fs::path job_log_dir() const;
    fs::path daemon_log_path() const;

public:
    Config() = default;

private:
    WatchConfig watch_;
    fs::path source_path_;

    void apply(const ConfigOverrides& overrides);
    Result<void> validate() const;
};

// Split a command string on whitespace ("python3 automate.py").
std::vector<std::string> split_command(const std::string& cmd);

fs::path get_default_config_path(const fs::path& dir = fs::current_path());
bool config_exists(const fs::path& path);

// Write a commented template config. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path);

// Create the log directory tree for a loaded config.
Result<void> ensure_runtime_directories(const Config& config);
