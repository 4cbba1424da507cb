#include <iostream>
#include <string>
#include <stdexcept>
#include <core/constants.hpp>
#include "cli/watch_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    dropwatch run"
              << theme::color::RESET << theme::color::DIM
              << " [options]       Watch and dispatch until stopped" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    dropwatch init"
              << theme::color::RESET << theme::color::DIM
              << " [file]         Write a default dropwatch.yaml" << theme::color::RESET << "\n";
    std::cout << theme::section("Options for run");
    std::cout << theme::color::DIM
              << "    --config FILE         Config file (default ./dropwatch.yaml)\n"
              << "    --watch DIR           Directory to watch (absolute)\n"
              << "    --pipeline CMD        Command run per file, path appended\n"
              << "    --log-dir DIR         Daemon and job logs\n"
              << "    --scan-existing       Also dispatch files already present\n"
              << "\n"
              << "    dropwatch --version   Show version\n"
              << "    dropwatch --help      Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        WatchCLI cli;

        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::bold("dropwatch") << theme::dim(std::string(" version ") +
                                                                DROPWATCH_VERSION) << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init") {
            return cli.run_init(argc >= 3 ? argv[2] : "");
        } else if (cmd == "run") {
            std::string config_path;
            ConfigOverrides overrides;

            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                auto value = [&]() -> std::string {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for " + arg);
                    }
                    return argv[++i];
                };

                if (arg == "--config") {
                    config_path = value();
                } else if (arg == "--watch") {
                    overrides.watch_dir = value();
                } else if (arg == "--pipeline") {
                    overrides.pipeline = value();
                } else if (arg == "--log-dir") {
                    overrides.log_dir = value();
                } else if (arg == "--scan-existing") {
                    overrides.scan_existing = true;
                } else {
                    std::cout << theme::fail("Unknown option: " + arg);
                    print_usage();
                    return 1;
                }
            }
            return cli.run_watch(config_path, overrides);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
