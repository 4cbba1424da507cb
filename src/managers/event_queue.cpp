#include "event_queue.hpp"

bool EventQueue::push(RawEvent ev) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        events_.push_back(std::move(ev));
    }
    cv_.notify_one();
    return true;
}

std::optional<RawEvent> EventQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;

    RawEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

void EventQueue::close(bool discard_pending) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        if (discard_pending) events_.clear();
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
