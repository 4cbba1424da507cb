#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <filesystem>
#include <core/types.hpp>
#include "dispatch_gate.hpp"
#include "event_filter.hpp"
#include "event_source.hpp"
#include "job_runner.hpp"
#include "outcome_reporter.hpp"

// The control loop: event source -> filter -> gate -> runner -> reporter.
//
// run() is the only consumer of the event source and blocks only there.
// Every admitted file gets its own job thread, so a slow job never holds up
// dispatch of other files. The gate entry for a path is released only after
// that path's job has reported.
class Dispatcher {
public:
    Dispatcher(const EventFilter& filter, JobRunner& runner, OutcomeReporter& reporter);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Consume events until the source ends. Returns an error (WatchUnavailable)
    // when the source ended because its watch failed, Ok after a clean stop.
    // In-flight jobs keep running; call wait_idle() to join them.
    Result<void> run(EventSource& source);

    // Filter, admit and dispatch one event.
    void handle(const RawEvent& ev);

    // Feed regular files already in dir through handle(), in name order.
    // Returns the number of entries examined.
    size_t dispatch_existing(const std::filesystem::path& dir);

    // Block until every dispatched job has finished.
    void wait_idle();

    size_t in_flight() const { return gate_.size(); }
    const DispatchGate& gate() const { return gate_; }

private:
    const EventFilter& filter_;
    JobRunner& runner_;
    OutcomeReporter& reporter_;
    DispatchGate gate_;

    struct Entry {
        std::thread thread;
        std::atomic<bool> done{false};
    };
    std::map<uint64_t, std::unique_ptr<Entry>> jobs_;
    uint64_t next_job_id_ = 0;
    std::mutex mutex_;
    std::condition_variable idle_cv_;

    void job_thread(CandidateFile candidate, Entry* entry);
    void reap_finished();
};
