#include "dispatcher.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

Dispatcher::Dispatcher(const EventFilter& filter, JobRunner& runner,
                       OutcomeReporter& reporter)
    : filter_(filter), runner_(runner), reporter_(reporter) {}

Dispatcher::~Dispatcher() {
    wait_idle();
}

// ── Control loop ────────────────────────────────────────────

Result<void> Dispatcher::run(EventSource& source) {
    while (auto ev = source.next()) {
        handle(*ev);
    }

    std::string why = source.failure();
    if (!why.empty()) {
        return Result<void>::Err(why);
    }
    return Result<void>::Ok();
}

void Dispatcher::handle(const RawEvent& ev) {
    reap_finished();
    reporter_.detected(ev);

    CandidateFile candidate;
    FilterVerdict verdict = filter_.evaluate(ev, candidate);
    if (verdict != FilterVerdict::Accepted) {
        reporter_.skipped(ev, verdict);
        return;
    }

    if (!gate_.admit(candidate)) {
        reporter_.dropped(candidate);
        return;
    }

    reporter_.started(candidate);

    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = std::make_unique<Entry>();
    auto* raw = entry.get();
    try {
        entry->thread = std::thread(&Dispatcher::job_thread, this, candidate, raw);
    } catch (const std::system_error& e) {
        JobResult result;
        result.path = candidate.path;
        result.status = JobStatus::StartFailed;
        result.error = fmt::format("cannot start job thread: {}", e.what());
        reporter_.finished(result);
        gate_.release(candidate.path);
        return;
    }
    jobs_[next_job_id_++] = std::move(entry);
}

size_t Dispatcher::dispatch_existing(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        reporter_.note(LogLevel::Warn, fmt::format("startup scan of {} failed: {}",
                                                   dir.string(), ec.message()));
    }
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        RawEvent ev;
        ev.directory = dir.string();
        ev.kind = EventKind::WriteCompleted;
        ev.filename = name;
        handle(ev);
    }
    return names.size();
}

// ── Job threads ─────────────────────────────────────────────

void Dispatcher::job_thread(CandidateFile candidate, Entry* entry) {
    JobResult result;
    try {
        result = runner_.run(candidate.path);
    } catch (const std::exception& e) {
        result.path = candidate.path;
        result.status = JobStatus::StartFailed;
        result.error = e.what();
    }

    reporter_.finished(result);
    gate_.release(candidate.path);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->done.store(true);
    }
    idle_cv_.notify_all();
}

void Dispatcher::reap_finished() {
    std::vector<std::unique_ptr<Entry>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->second->done.load()) {
                finished.push_back(std::move(it->second));
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& e : finished) {
        if (e->thread.joinable()) e->thread.join();
    }
}

void Dispatcher::wait_idle() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] {
            for (const auto& [id, e] : jobs_) {
                if (!e->done.load()) return false;
            }
            return true;
        });
    }
    reap_finished();
}
