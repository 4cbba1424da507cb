#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Accepts either a scalar ("python3 automate.py") or a sequence.
static std::vector<std::string> parse_string_list(const YAML::Node& node, bool split_scalar) {
    std::vector<std::string> out;
    if (!node) return out;

    if (node.IsScalar()) {
        std::string value = node.as<std::string>("");
        if (split_scalar) return split_command(value);
        if (!value.empty()) out.push_back(value);
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string value = item.as<std::string>("");
            if (!value.empty()) out.push_back(value);
        }
    }
    return out;
}

std::vector<std::string> split_command(const std::string& cmd) {
    std::vector<std::string> parts;
    std::istringstream ss(cmd);
    std::string word;
    while (ss >> word) parts.push_back(word);
    return parts;
}

fs::path get_default_config_path(const fs::path& dir) {
    return dir / DEFAULT_CONFIG_FILE;
}

bool config_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# dropwatch configuration

# Directory to watch (absolute). Only files written directly into it are seen.
watch_dir: ""

# Command run once per completed file; the file's absolute path is appended.
# Either a string or a list, e.g. [python3, /opt/automation/automate.py]
pipeline: ""

# Filenames matching these globs are skipped. "!" re-includes.
ignore:
  - "*:Zone.Identifier"

# When non-empty, only filenames matching one of these globs are dispatched.
include: []

# Daemon log and per-file job logs. Leave empty to log to stdout only.
log_dir: ""

# Dispatch files already present in watch_dir at startup.
scan_existing: false
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static WatchConfig parse_watch_config(const YAML::Node& root) {
    WatchConfig w;
    w.watch_dir = root["watch_dir"].as<std::string>("");
    w.pipeline = parse_string_list(root["pipeline"], true);

    if (root["ignore"]) {
        w.ignore = parse_string_list(root["ignore"], false);
    } else {
        w.ignore.push_back(ZONE_IDENTIFIER_PATTERN);
    }
    w.include = parse_string_list(root["include"], false);

    w.log_dir = root["log_dir"].as<std::string>("");
    w.scan_existing = root["scan_existing"].as<bool>(false);
    return w;
}

Result<Config> Config::load(const fs::path& path, const ConfigOverrides& overrides) {
    if (!config_exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    Config config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<Config>::Err(fmt::format("{}: expected a YAML mapping", path.string()));
        }
        config.watch_ = parse_watch_config(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
    config.source_path_ = path;
    config.apply(overrides);

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), valid.error));
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::from_overrides(const ConfigOverrides& overrides) {
    Config config;
    config.watch_.ignore.push_back(ZONE_IDENTIFIER_PATTERN);

    config.apply(overrides);

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config>::Err(valid.error);
    }
    return Result<Config>::Ok(config);
}

void Config::apply(const ConfigOverrides& overrides) {
    if (!overrides.watch_dir.empty()) watch_.watch_dir = overrides.watch_dir;
    if (!overrides.pipeline.empty()) watch_.pipeline = split_command(overrides.pipeline);
    if (!overrides.log_dir.empty()) watch_.log_dir = overrides.log_dir;
    if (overrides.scan_existing) watch_.scan_existing = true;
}

Result<void> Config::validate() const {
    if (watch_.watch_dir.empty()) {
        return Result<void>::Err("watch_dir is not set");
    }
    if (!watch_.watch_dir.is_absolute()) {
        return Result<void>::Err(fmt::format("watch_dir must be absolute (got '{}')",
                                             watch_.watch_dir.string()));
    }
    if (watch_.pipeline.empty()) {
        return Result<void>::Err("pipeline is not set");
    }
    if (!watch_.log_dir.empty() && !watch_.log_dir.is_absolute()) {
        return Result<void>::Err(fmt::format("log_dir must be absolute (got '{}')",
                                             watch_.log_dir.string()));
    }
    return Result<void>::Ok();
}

fs::path Config::job_log_dir() const {
    if (watch_.log_dir.empty()) return {};
    return watch_.log_dir / JOB_LOG_SUBDIR;
}

fs::path Config::daemon_log_path() const {
    if (watch_.log_dir.empty()) return {};
    return watch_.log_dir / DAEMON_LOG_FILE;
}

Result<void> ensure_runtime_directories(const Config& config) {
    if (config.watch().log_dir.empty()) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config.job_log_dir(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create log directory {}: {}",
                                             config.job_log_dir().string(), ec.message()));
    }
    return Result<void>::Ok();
}
