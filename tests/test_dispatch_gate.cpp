#include <gtest/gtest.h>
#include <managers/dispatch_gate.hpp>
#include <atomic>
#include <thread>
#include <vector>

TEST(DispatchGate, SecondAdmitBeforeReleaseIsRefused) {
    DispatchGate gate;
    CandidateFile c{"/data/cube002.fits", "cube002.fits"};

    EXPECT_TRUE(gate.admit(c));
    EXPECT_FALSE(gate.admit(c));
    EXPECT_TRUE(gate.in_flight(c.path));
    EXPECT_EQ(gate.size(), 1u);
}

TEST(DispatchGate, AdmitAgainAfterRelease) {
    DispatchGate gate;
    std::filesystem::path p = "/data/cube001.fits";

    ASSERT_TRUE(gate.admit(p));
    EXPECT_TRUE(gate.release(p));
    EXPECT_FALSE(gate.in_flight(p));
    EXPECT_TRUE(gate.admit(p));
}

TEST(DispatchGate, DistinctPathsAreIndependent) {
    DispatchGate gate;
    EXPECT_TRUE(gate.admit(std::filesystem::path("/data/a.fits")));
    EXPECT_TRUE(gate.admit(std::filesystem::path("/data/b.fits")));
    EXPECT_EQ(gate.size(), 2u);
}

TEST(DispatchGate, ReleaseOfUnknownPathIsHarmless) {
    DispatchGate gate;
    EXPECT_FALSE(gate.release("/data/never.fits"));
    EXPECT_EQ(gate.size(), 0u);
}

TEST(DispatchGate, ConcurrentAdmitsForOnePathAdmitExactlyOne) {
    DispatchGate gate;
    std::atomic<int> admitted{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            if (gate.admit(std::filesystem::path("/data/same.fits"))) admitted++;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(admitted.load(), 1);
}
