#include "event_filter.hpp"

namespace fs = std::filesystem;

fs::path resolve_event_path(const std::string& directory, const std::string& filename) {
    return (fs::path(directory) / filename).lexically_normal();
}

const char* verdict_reason(FilterVerdict verdict) {
    switch (verdict) {
        case FilterVerdict::Accepted:          return "accepted";
        case FilterVerdict::NotWriteCompleted: return "not a completed write";
        case FilterVerdict::IgnoredPattern:    return "matches an ignore pattern";
        case FilterVerdict::NotIncluded:       return "matches no include pattern";
        case FilterVerdict::NotRegularFile:    return "not a regular file";
    }
    return "unknown";
}

EventFilter::EventFilter(PatternList ignore, PatternList include)
    : ignore_(std::move(ignore)), include_(std::move(include)) {}

Result<EventFilter> EventFilter::from_config(const WatchConfig& config) {
    auto ignore = PatternList::compile(config.ignore);
    if (ignore.is_err()) {
        return Result<EventFilter>::Err("ignore: " + ignore.error);
    }
    auto include = PatternList::compile(config.include);
    if (include.is_err()) {
        return Result<EventFilter>::Err("include: " + include.error);
    }
    return Result<EventFilter>::Ok(EventFilter(std::move(ignore.value),
                                               std::move(include.value)));
}

FilterVerdict EventFilter::evaluate(const RawEvent& ev, CandidateFile& out) const {
    if (ev.kind != EventKind::WriteCompleted) {
        return FilterVerdict::NotWriteCompleted;
    }

    if (ignore_.matches(ev.filename)) {
        return FilterVerdict::IgnoredPattern;
    }

    if (!include_.empty() && !include_.matches(ev.filename)) {
        return FilterVerdict::NotIncluded;
    }

    fs::path path = resolve_event_path(ev.directory, ev.filename);

    // Follows symlinks; a link to a regular file is processable.
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return FilterVerdict::NotRegularFile;
    }

    out.path = path;
    out.filename = ev.filename;
    return FilterVerdict::Accepted;
}

std::optional<CandidateFile> EventFilter::filter(const RawEvent& ev) const {
    CandidateFile candidate;
    if (evaluate(ev, candidate) != FilterVerdict::Accepted) {
        return std::nullopt;
    }
    return candidate;
}
