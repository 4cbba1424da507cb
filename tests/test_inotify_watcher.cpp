#include <gtest/gtest.h>
#include <managers/inotify_watcher.hpp>
#include <sys/inotify.h>
#include <future>
#include "test_support.hpp"

// Pop events until one for filename with the given kind shows up. Gives up
// (and stops the watcher) after a few seconds so a broken watcher cannot
// hang the suite.
static bool wait_for_event(InotifyWatcher& w, const std::string& filename, EventKind kind) {
    auto found = std::async(std::launch::async, [&] {
        while (auto ev = w.next()) {
            if (ev->filename == filename && ev->kind == kind) return true;
        }
        return false;
    });
    if (found.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        w.stop();
    }
    return found.get();
}

TEST(InotifyWatcher, ClassifyCloseWrite) {
    EXPECT_EQ(InotifyWatcher::classify(IN_CLOSE_WRITE), EventKind::WriteCompleted);
    EXPECT_EQ(InotifyWatcher::classify(IN_CREATE), EventKind::Other);
    EXPECT_EQ(InotifyWatcher::classify(IN_MOVED_TO), EventKind::Other);
}

TEST(InotifyWatcher, MissingDirectoryIsWatchUnavailable) {
    InotifyWatcher w;
    auto r = w.subscribe("/nonexistent/dropwatch/dir");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("WatchUnavailable"), std::string::npos);
}

TEST(InotifyWatcher, RegularFileIsNotWatchable) {
    ScratchDir dir("dropwatch_inotify_file");
    auto file = dir.write("plain.txt");

    InotifyWatcher w;
    EXPECT_TRUE(w.subscribe(file).is_err());
}

TEST(InotifyWatcher, CompletedWriteIsReported) {
    ScratchDir dir("dropwatch_inotify_write");
    InotifyWatcher w;
    ASSERT_TRUE(w.subscribe(dir.path()).is_ok());

    dir.write("cube001.fits", "payload");

    EXPECT_TRUE(wait_for_event(w, "cube001.fits", EventKind::WriteCompleted));
    w.stop();
    EXPECT_EQ(w.failure(), "");
}

TEST(InotifyWatcher, EventCarriesDirectoryAsSubscribed) {
    ScratchDir dir("dropwatch_inotify_dirname");
    InotifyWatcher w;
    std::string with_slash = dir.path().string() + "/";
    ASSERT_TRUE(w.subscribe(with_slash).is_ok());

    dir.write("x.dat");

    auto ev = w.next();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->directory, with_slash);
    w.stop();
}

TEST(InotifyWatcher, StopEndsNext) {
    ScratchDir dir("dropwatch_inotify_stop");
    InotifyWatcher w;
    ASSERT_TRUE(w.subscribe(dir.path()).is_ok());

    auto ended = std::async(std::launch::async, [&] { return w.next().has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    w.stop();

    ASSERT_EQ(ended.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(ended.get());
    EXPECT_EQ(w.failure(), "");
}

TEST(InotifyWatcher, DeletedDirectoryEndsWithFailure) {
    ScratchDir dir("dropwatch_inotify_lost");
    fs::path watched = dir.path() / "incoming";
    fs::create_directories(watched);

    InotifyWatcher w;
    ASSERT_TRUE(w.subscribe(watched).is_ok());
    fs::remove_all(watched);

    auto drained = std::async(std::launch::async, [&] {
        while (w.next()) {}
        return true;
    });
    ASSERT_EQ(drained.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_NE(w.failure().find("WatchUnavailable"), std::string::npos);
}
