#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <core/log.hpp>
#include <core/types.hpp>

struct ReportCounters {
    long detected = 0;
    long skipped = 0;
    long dropped = 0;
    long started = 0;
    long succeeded = 0;
    long failed = 0;            // ran and exited non-zero, was killed, or was lost
    long start_failures = 0;
};

// Log sink for everything the dispatch loop observes. Every method is
// noexcept: a failed log write never reaches the dispatch loop.
class OutcomeReporter {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    // Default sink is the process logger.
    OutcomeReporter();
    explicit OutcomeReporter(Sink sink);

    void detected(const RawEvent& ev) noexcept;
    void skipped(const RawEvent& ev, FilterVerdict why) noexcept;
    void dropped(const CandidateFile& candidate) noexcept;
    void started(const CandidateFile& candidate) noexcept;
    void finished(const JobResult& result) noexcept;

    // Free-form line through the same sink ("waiting for 2 jobs", ...).
    void note(LogLevel level, const std::string& msg) noexcept;

    ReportCounters counters() const;
    std::string summary() const;

private:
    Sink sink_;

    std::atomic<long> detected_{0};
    std::atomic<long> skipped_{0};
    std::atomic<long> dropped_{0};
    std::atomic<long> started_{0};
    std::atomic<long> succeeded_{0};
    std::atomic<long> failed_{0};
    std::atomic<long> start_failures_{0};

    void emit(LogLevel level, const std::string& msg) noexcept;
};
