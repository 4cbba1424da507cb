#pragma once

#include <optional>
#include <string>
#include <filesystem>
#include <core/types.hpp>

// A live, unbounded sequence of raw change events for one directory.
// Not restartable: after the sequence ends, construct a new source.
class EventSource {
public:
    virtual ~EventSource() = default;

    // Start watching. Fails (WatchUnavailable) if the directory is missing
    // or cannot be watched; there is no internal retry.
    virtual Result<void> subscribe(const std::filesystem::path& directory) = 0;

    // Block until the next event. nullopt means the sequence has ended,
    // either through stop() or because the watch was lost (see failure()).
    virtual std::optional<RawEvent> next() = 0;

    // End the sequence. Safe to call from another thread and more than once.
    virtual void stop() = 0;

    // Why the sequence ended on its own; empty after a clean stop().
    virtual std::string failure() const = 0;
};
