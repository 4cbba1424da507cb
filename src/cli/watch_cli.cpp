#include "watch_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/dispatcher.hpp>
#include <managers/event_filter.hpp>
#include <managers/inotify_watcher.hpp>
#include <managers/job_runner.hpp>
#include <managers/outcome_reporter.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

Result<Config> WatchCLI::load_config(const std::string& config_path,
                                     const ConfigOverrides& overrides) const {
    fs::path path = config_path;
    if (path.empty() && config_exists(get_default_config_path())) {
        path = get_default_config_path();
    }

    if (path.empty()) {
        return Config::from_overrides(overrides);
    }
    return Config::load(path, overrides);
}

bool WatchCLI::preflight(const Config& config) const {
    bool fatal = false;
    for (const auto& issue : run_preflight_checks(config)) {
        if (issue.is_hint) {
            std::cout << theme::hint(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            fatal = true;
        }
        std::cout << theme::step(issue.fix);
    }
    return !fatal;
}

void WatchCLI::print_summary(const Config& config) const {
    const auto& w = config.watch();
    std::cout << theme::section("dropwatch");
    std::cout << theme::kv("watching", w.watch_dir.string());
    std::cout << theme::kv("pipeline", join_command(w.pipeline) + " <file>");
    if (!w.include.empty()) {
        std::cout << theme::kv("include", join_command(w.include));
    }
    if (!w.ignore.empty()) {
        std::cout << theme::kv("ignore", join_command(w.ignore));
    }
    std::cout << theme::kv("logs", w.log_dir.empty() ? "stdout" : w.log_dir.string());
    std::cout << "\n" << std::flush;
}

int WatchCLI::run_watch(const std::string& config_path, const ConfigOverrides& overrides) {
    auto loaded = load_config(config_path, overrides);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        std::cout << theme::step("Run 'dropwatch init' to create a config, "
                                 "or pass --watch and --pipeline");
        return 1;
    }
    const Config config = loaded.value;

    if (!preflight(config)) {
        return 1;
    }

    auto dirs = ensure_runtime_directories(config);
    if (dirs.is_err()) {
        std::cout << theme::fail(dirs.error);
        return 1;
    }

    auto filter = EventFilter::from_config(config.watch());
    if (filter.is_err()) {
        std::cout << theme::fail(filter.error);
        return 1;
    }

    print_summary(config);

    if (!config.daemon_log_path().empty() && !dwlog::set_file(config.daemon_log_path())) {
        std::cout << theme::hint("Cannot open " + config.daemon_log_path().string() +
                                 ", logging to stdout only");
    }

    // Every thread started from here on inherits the blocked mask, so
    // termination signals are only ever seen by the signal thread below.
    platform::block_termination_signals();

    InotifyWatcher source;
    auto subscribed = source.subscribe(config.watch().watch_dir);
    if (subscribed.is_err()) {
        log_error(subscribed.error);
        return 1;
    }

    SubprocessRunner runner(config.watch().pipeline, config.job_log_dir());
    OutcomeReporter reporter;
    Dispatcher dispatcher(filter.value, runner, reporter);

    std::atomic<bool> shutting_down{false};
    std::thread signal_thread([&source, &shutting_down] {
        int sig = platform::wait_for_termination_signal();
        if (shutting_down.exchange(true)) return;
        log_info(fmt::format("received signal {}, stopping", sig));
        source.stop();
    });

    if (config.watch().scan_existing) {
        size_t n = dispatcher.dispatch_existing(config.watch().watch_dir);
        log_info(fmt::format("startup scan examined {} entries", n));
    }

    auto result = dispatcher.run(source);

    // The loop can also end on its own (watch lost); wake the signal thread.
    if (!shutting_down.exchange(true)) {
        platform::raise_termination();
    }
    signal_thread.join();

    if (result.is_err()) {
        log_error(result.error);
    }

    if (dispatcher.in_flight() > 0) {
        log_info(fmt::format("waiting for {} running job(s) to finish", dispatcher.in_flight()));
    }
    dispatcher.wait_idle();
    source.stop();

    log_info(reporter.summary());
    return result.is_ok() ? 0 : 1;
}

int WatchCLI::run_init(const std::string& path_arg) {
    fs::path path = path_arg.empty() ? get_default_config_path() : fs::path(path_arg);

    if (fs::exists(path)) {
        std::cout << theme::hint(path.string() + " already exists, leaving it alone");
        return 0;
    }

    auto created = create_default_config(path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + path.string());
    std::cout << theme::step("Set watch_dir and pipeline, then run 'dropwatch run'");
    return 0;
}
