#include "pulsescope/poller.h"

#include <QElapsedTimer>

#include <gtest/gtest.h>

using namespace pulsescope;

TEST(Poller, ReturnsAsSoonAsReady) {
    Poller poller(1.0);
    int calls = 0;
    EXPECT_TRUE(poller.wait([&] {
        return ++calls == 3;
    }));
    EXPECT_EQ(calls, 3);
    EXPECT_LT(poller.elapsedMs(), 500);
}

TEST(Poller, ZeroTimeoutStillPollsOnce) {
    Poller poller(0.0);
    int calls = 0;
    EXPECT_FALSE(poller.wait([&] {
        ++calls;
        return false;
    }));
    EXPECT_EQ(calls, 1);

    Poller ready(0.0);
    EXPECT_TRUE(ready.wait([] {
        return true;
    }));
}

TEST(Poller, GivesUpAfterTimeout) {
    QElapsedTimer t;
    t.start();
    Poller poller(0.05);
    int calls = 0;
    EXPECT_FALSE(poller.wait([&] {
        ++calls;
        return false;
    }));
    EXPECT_GE(t.elapsed(), 50);
    EXPECT_LT(t.elapsed(), 1000);
    // Backoff keeps the number of polls well below one per millisecond.
    EXPECT_LT(calls, 50);
    EXPECT_DOUBLE_EQ(poller.remainingSeconds(), 0.0);
}

TEST(Poller, SleepWaitsAtLeastTheInterval) {
    QElapsedTimer t;
    t.start();
    Poller::sleep(0.02);
    EXPECT_GE(t.elapsed(), 19);
    Poller::sleep(-1.0);
}
