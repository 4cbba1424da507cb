#pragma once

#include <string>
#include <core/config.hpp>

// Front end for the watcher daemon: loads config, runs preflight, wires the
// dispatch pipeline together and handles shutdown signals.
class WatchCLI {
public:
    // Watch until SIGINT/SIGTERM (exit 0) or a fatal watch error (exit 1).
    // config_path may be empty: ./dropwatch.yaml is used when present,
    // otherwise everything must come from overrides.
    int run_watch(const std::string& config_path, const ConfigOverrides& overrides);

    // Write a template config file. Never overwrites.
    int run_init(const std::string& path_arg);

private:
    Result<Config> load_config(const std::string& config_path,
                               const ConfigOverrides& overrides) const;
    bool preflight(const Config& config) const;
    void print_summary(const Config& config) const;
};
