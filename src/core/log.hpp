#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { Info, Warn, Error };

// Process-wide line logger: "[2025-01-15T10:00:00] INFO  message".
// Lines go to stdout and, once a file is set, are appended to it as well.
// Safe to call from job threads. Never throws.
namespace dwlog {

// Start appending to this file (created if missing). Empty path disables.
// Returns false when the file cannot be opened; stdout logging continues.
bool set_file(const std::filesystem::path& path);

void write(LogLevel level, const std::string& msg) noexcept;

std::string format_line(LogLevel level, const std::string& msg);

} // namespace dwlog

inline void log_info(const std::string& msg)  { dwlog::write(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { dwlog::write(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { dwlog::write(LogLevel::Error, msg); }
