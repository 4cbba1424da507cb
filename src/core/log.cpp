#include "log.hpp"
#include "utils.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace dwlog {

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::ofstream& log_file() {
    static std::ofstream f;
    return f;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?    ";
}

} // namespace

bool set_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    auto& f = log_file();
    if (f.is_open()) f.close();
    if (path.empty()) return true;

    f.open(path, std::ios::app);
    return f.is_open();
}

std::string format_line(LogLevel level, const std::string& msg) {
    return fmt::format("[{}] {} {}", now_iso(), level_name(level), msg);
}

void write(LogLevel level, const std::string& msg) noexcept {
    try {
        std::string line = format_line(level, msg);
        std::lock_guard<std::mutex> lock(log_mutex());
        std::cout << line << "\n" << std::flush;
        auto& f = log_file();
        if (f.is_open()) {
            f << line << "\n";
            f.flush();
            if (!f) f.clear();   // disk full etc.; keep going on stdout
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: log write failed: %s\n", e.what());
    }
}

} // namespace dwlog
