#include "inotify_watcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <climits>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

// Events that mean the watch itself is gone.
static constexpr uint32_t WATCH_LOST_MASK =
    IN_IGNORED | IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT;

InotifyWatcher::~InotifyWatcher() {
    stop();
}

EventKind InotifyWatcher::classify(uint32_t mask) {
    return (mask & IN_CLOSE_WRITE) ? EventKind::WriteCompleted : EventKind::Other;
}

// ── Lifecycle ───────────────────────────────────────────────

Result<void> InotifyWatcher::subscribe(const fs::path& directory) {
    if (running_ || inotify_fd_ >= 0) {
        return Result<void>::Err("watcher already subscribed; create a new one");
    }

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Result<void>::Err(fmt::format("WatchUnavailable: {} is not a directory",
                                             directory.string()));
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return Result<void>::Err(fmt::format("WatchUnavailable: inotify_init1: {}",
                                             std::strerror(errno)));
    }

    // IN_CREATE and IN_MOVED_TO are delivered so they can be seen (and
    // refused) by the filter; only IN_CLOSE_WRITE becomes a write-completed event.
    uint32_t mask = IN_CLOSE_WRITE | IN_CREATE | IN_MOVED_TO |
                    IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;
    wd_ = inotify_add_watch(inotify_fd_, directory.c_str(), mask);
    if (wd_ < 0) {
        int error = errno;
        close(inotify_fd_);
        inotify_fd_ = -1;
        if (error == ENOSPC) {
            return Result<void>::Err(fmt::format(
                "WatchUnavailable: {}: out of inotify watches "
                "(raise fs.inotify.max_user_watches)", directory.string()));
        }
        return Result<void>::Err(fmt::format("WatchUnavailable: {}: {}",
                                             directory.string(), std::strerror(error)));
    }

    directory_ = directory.string();
    running_ = true;
    thread_ = std::thread(&InotifyWatcher::reader_loop, this);
    log_info(fmt::format("watching {}", directory_));
    return Result<void>::Ok();
}

std::optional<RawEvent> InotifyWatcher::next() {
    return queue_.pop();
}

void InotifyWatcher::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);

    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    // Events not yet consumed are dropped; nothing is replayed later.
    queue_.close(true);

    if (inotify_fd_ >= 0) {
        if (wd_ >= 0) inotify_rm_watch(inotify_fd_, wd_);
        close(inotify_fd_);
        inotify_fd_ = -1;
        wd_ = -1;
    }
}

std::string InotifyWatcher::failure() const {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    return failure_;
}

void InotifyWatcher::fail(const std::string& why) {
    {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        failure_ = why;
    }
    running_ = false;
    queue_.close();
}

// ── Reader loop ─────────────────────────────────────────────

void InotifyWatcher::reader_loop() {
    alignas(struct inotify_event)
        char buf[INOTIFY_BUF_EVENTS * (sizeof(struct inotify_event) + NAME_MAX + 1)];

    while (running_) {
        struct pollfd pfd = { inotify_fd_, POLLIN, 0 };
        int ready = poll(&pfd, 1, INOTIFY_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            fail(fmt::format("WatchUnavailable: poll: {}", std::strerror(errno)));
            return;
        }
        if (ready == 0) continue;

        ssize_t len = read(inotify_fd_, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            fail(fmt::format("WatchUnavailable: read: {}", std::strerror(errno)));
            return;
        }

        if (!drain_events(buf, len)) return;
    }
}

bool InotifyWatcher::drain_events(const char* buf, ssize_t len) {
    for (const char* p = buf; p < buf + len;) {
        const auto* ev = reinterpret_cast<const struct inotify_event*>(p);
        p += sizeof(struct inotify_event) + ev->len;

        if (ev->mask & IN_Q_OVERFLOW) {
            log_warn(fmt::format("inotify queue overflowed on {}; some events were lost",
                                 directory_));
            continue;
        }

        if (ev->mask & WATCH_LOST_MASK) {
            fail(fmt::format("WatchUnavailable: watch on {} was lost "
                             "(directory deleted, moved or unmounted)", directory_));
            return false;
        }

        if (ev->len == 0 || ev->name[0] == '\0') continue;

        RawEvent raw;
        raw.directory = directory_;
        raw.kind = classify(ev->mask);
        raw.filename = ev->name;
        queue_.push(std::move(raw));
    }
    return true;
}
