#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <filesystem>
#include <sys/types.h>
#include "event_source.hpp"
#include "event_queue.hpp"

// inotify-backed event source. A reader thread turns kernel events for the
// watched directory into RawEvents on an EventQueue; next() pops them.
class InotifyWatcher : public EventSource {
public:
    InotifyWatcher() = default;
    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    Result<void> subscribe(const std::filesystem::path& directory) override;
    std::optional<RawEvent> next() override;
    void stop() override;
    std::string failure() const override;

    // Decode one inotify mask into an event kind.
    static EventKind classify(uint32_t mask);

private:
    int inotify_fd_ = -1;
    int wd_ = -1;
    std::string directory_;   // as given to subscribe(), trailing slash and all

    EventQueue queue_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;

    mutable std::mutex failure_mutex_;
    std::string failure_;

    void reader_loop();
    // Returns false when the watch is gone and the loop must end.
    bool drain_events(const char* buf, ssize_t len);
    void fail(const std::string& why);
};
