#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <filesystem>
#include <core/types.hpp>

// Admission control for jobs: at most one in-flight job per path.
//
// admit() and release() are the only mutators of the in-flight set and are
// serialized on one mutex, so two events for the same file can never both
// be admitted. release() must only be called once the job for that path has
// reported completion.
class DispatchGate {
public:
    // Insert the candidate's path if absent. False means a job for the same
    // path is still running and this event must be dropped.
    bool admit(const CandidateFile& candidate);
    bool admit(const std::filesystem::path& path);

    // Remove a completed job's path. Returns false if it was not in flight.
    bool release(const std::filesystem::path& path);

    bool in_flight(const std::filesystem::path& path) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> in_flight_;
};
