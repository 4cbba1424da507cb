#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Events ──────────────────────────────────────────────────

enum class EventKind {
    WriteCompleted,   // IN_CLOSE_WRITE: a writer closed the file
    Other,
};

// One notification as reported by the event source. Never persisted.
struct RawEvent {
    std::string directory;
    EventKind kind = EventKind::Other;
    std::string filename;
};

// A raw event that survived filtering.
struct CandidateFile {
    std::filesystem::path path;   // absolute, lexically normal
    std::string filename;
};

// Why the filter refused an event.
enum class FilterVerdict {
    Accepted,
    NotWriteCompleted,
    IgnoredPattern,       // alternate-stream artifacts and other noise
    NotIncluded,          // include list configured and name matched none
    NotRegularFile,       // directory, fifo, vanished, ...
};

// ── Jobs ────────────────────────────────────────────────────

enum class JobStatus {
    Exited,          // pipeline ran; exit_code holds its status
    StartFailed,     // pipeline could not be launched at all
    Signaled,        // pipeline was killed; exit_code holds the signal
    Lost,            // pipeline started but its end could not be observed
};

struct JobResult {
    std::filesystem::path path;
    JobStatus status = JobStatus::Exited;
    int exit_code = -1;
    std::chrono::milliseconds duration{0};
    std::string error;   // set when status is StartFailed or Lost

    bool succeeded() const { return status == JobStatus::Exited && exit_code == 0; }
};

// ── Configuration ───────────────────────────────────────────

struct WatchConfig {
    std::filesystem::path watch_dir;          // absolute
    std::vector<std::string> pipeline;        // program + leading args; file path appended
    std::vector<std::string> ignore;          // glob patterns, "!" re-includes
    std::vector<std::string> include;         // empty = accept every name
    std::filesystem::path log_dir;            // empty = stdout only
    bool scan_existing = false;
};
