#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <core/types.hpp>

// Unbounded blocking channel between an event producer thread and the
// dispatch loop. Events come out in the order they went in.
class EventQueue {
public:
    // Returns false if the queue is already closed (event discarded).
    bool push(RawEvent ev);

    // Blocks until an event is available. Returns nullopt once the queue is
    // closed and drained.
    std::optional<RawEvent> pop();

    // Wake all waiters. Pending events can still be popped unless
    // discard_pending is set.
    void close(bool discard_pending = false);

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RawEvent> events_;
    bool closed_ = false;
};
