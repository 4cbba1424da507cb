#include "outcome_reporter.hpp"
#include "event_filter.hpp"
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <cstdio>

static const char* kind_name(EventKind kind) {
    return kind == EventKind::WriteCompleted ? "close_write" : "other";
}

OutcomeReporter::OutcomeReporter()
    : sink_([](LogLevel level, const std::string& msg) { dwlog::write(level, msg); }) {}

OutcomeReporter::OutcomeReporter(Sink sink) : sink_(std::move(sink)) {}

void OutcomeReporter::emit(LogLevel level, const std::string& msg) noexcept {
    try {
        if (sink_) sink_(level, msg);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: report failed: %s\n", e.what());
    }
}

void OutcomeReporter::detected(const RawEvent& ev) noexcept {
    detected_++;
    try {
        emit(LogLevel::Info, fmt::format("detected {} on {}", kind_name(ev.kind),
                                         resolve_event_path(ev.directory, ev.filename).string()));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: report failed: %s\n", e.what());
    }
}

void OutcomeReporter::skipped(const RawEvent& ev, FilterVerdict why) noexcept {
    skipped_++;
    try {
        emit(LogLevel::Info, fmt::format("skipped {} ({})",
                                         resolve_event_path(ev.directory, ev.filename).string(),
                                         verdict_reason(why)));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: report failed: %s\n", e.what());
    }
}

void OutcomeReporter::dropped(const CandidateFile& candidate) noexcept {
    dropped_++;
    try {
        emit(LogLevel::Info, fmt::format("dropped {} (already in flight)",
                                         candidate.path.string()));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: report failed: %s\n", e.what());
    }
}

void OutcomeReporter::started(const CandidateFile& candidate) noexcept {
    started_++;
    try {
        emit(LogLevel::Info, fmt::format("started {}", candidate.path.string()));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: report failed: %s\n", e.what());
    }
}

void OutcomeReporter::finished(const JobResult& result) noexcept {
    try {
        std::string took = format_duration(result.duration);
        switch (result.status) {
            case JobStatus::StartFailed:
                start_failures_++;
                emit(LogLevel::Error, fmt::format("finished {}, could not start: {}",
                                                  result.path.string(), result.error));
                break;
            case JobStatus::Signaled:
                failed_++;
                emit(LogLevel::Warn, fmt::format("finished {}, killed by signal {} ({})",
                                                 result.path.string(), result.exit_code, took));
                break;
            case JobStatus::Lost:
                failed_++;
                emit(LogLevel::Error, fmt::format("finished {}, exit status unknown: {} ({})",
                                                  result.path.string(), result.error, took));
                break;
            case JobStatus::Exited:
                if (result.exit_code == 0) {
                    succeeded_++;
                    emit(LogLevel::Info, fmt::format("finished {}, exit 0 ({})",
                                                     result.path.string(), took));
                } else {
                    failed_++;
                    emit(LogLevel::Warn, fmt::format("finished {}, exit {} ({})",
                                                     result.path.string(), result.exit_code,
                                                     took));
                }
                break;
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "dropwatch: report failed: %s\n", e.what());
    }
}

void OutcomeReporter::note(LogLevel level, const std::string& msg) noexcept {
    emit(level, msg);
}

ReportCounters OutcomeReporter::counters() const {
    ReportCounters c;
    c.detected = detected_.load();
    c.skipped = skipped_.load();
    c.dropped = dropped_.load();
    c.started = started_.load();
    c.succeeded = succeeded_.load();
    c.failed = failed_.load();
    c.start_failures = start_failures_.load();
    return c;
}

std::string OutcomeReporter::summary() const {
    auto c = counters();
    return fmt::format("{} detected, {} skipped, {} dropped, {} started: "
                       "{} succeeded, {} failed, {} could not start",
                       c.detected, c.skipped, c.dropped, c.started,
                       c.succeeded, c.failed, c.start_failures);
}
