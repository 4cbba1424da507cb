#include "dispatch_gate.hpp"

bool DispatchGate::admit(const CandidateFile& candidate) {
    return admit(candidate.path);
}

bool DispatchGate::admit(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.insert(path.string()).second;
}

bool DispatchGate::release(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.erase(path.string()) > 0;
}

bool DispatchGate::in_flight(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(path.string()) > 0;
}

size_t DispatchGate::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}
