#pragma once

#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "pattern_list.hpp"

// Join a watched directory and a reported filename into one canonical path.
// "/data" + "a.fits" and "/data/" + "a.fits" both give "/data/a.fits".
std::filesystem::path resolve_event_path(const std::string& directory,
                                         const std::string& filename);

// Human-readable reason for a verdict, for log lines.
const char* verdict_reason(FilterVerdict verdict);

// Turns raw events into candidate files. Stateless apart from its pattern
// lists, so it can be shared by the dispatch loop and the startup scan.
class EventFilter {
public:
    EventFilter() = default;
    EventFilter(PatternList ignore, PatternList include);

    // Build from config patterns. Fails on a malformed glob.
    static Result<EventFilter> from_config(const WatchConfig& config);

    // Decide on one event. On Accepted, out holds the candidate.
    FilterVerdict evaluate(const RawEvent& ev, CandidateFile& out) const;

    std::optional<CandidateFile> filter(const RawEvent& ev) const;

private:
    PatternList ignore_;
    PatternList include_;
};
