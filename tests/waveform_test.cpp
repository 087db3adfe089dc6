#include "fake_instrument.h"

#include "pulsescope/logic_analyzer.h"
#include "pulsescope/waveform.h"

#include <gtest/gtest.h>

using namespace pulsescope;
using pulsescope::test::FakeInstrument;

namespace {

// Low until 10 us, high until 15 us, low until 30 us, then high.
Waveform squareWave() {
    return Waveform{{10.0, 15.0, 30.0}, {false, true, false}};
}

} // namespace

TEST(Waveform, EdgesBeforeCountsEdgesAtOrBeforeTime) {
    const Waveform w = squareWave();
    EXPECT_EQ(edgesBefore(w, 0.0), 0u);
    EXPECT_EQ(edgesBefore(w, 10.0), 1u);
    EXPECT_EQ(edgesBefore(w, 29.9), 2u);
    EXPECT_EQ(edgesBefore(w, 100.0), 3u);
}

TEST(Waveform, NearestEdgeSnapsToClosestTimestamp) {
    const Waveform w = squareWave();
    EXPECT_EQ(nearestEdge(w, -5.0), 0u);
    EXPECT_EQ(nearestEdge(w, 13.0), 1u);
    EXPECT_EQ(nearestEdge(w, 12.5), 0u);
    EXPECT_EQ(nearestEdge(w, 22.0), 1u);
    EXPECT_EQ(nearestEdge(w, 23.0), 2u);
    EXPECT_EQ(nearestEdge(w, 1e9), 2u);
    EXPECT_FALSE(nearestEdge(Waveform{}, 1.0));
}

TEST(Waveform, LevelFollowsAlternatingEdges) {
    const Waveform w = squareWave();
    EXPECT_EQ(levelAt(w, 5.0), false);
    EXPECT_EQ(levelAt(w, 12.0), true);
    EXPECT_EQ(levelAt(w, 20.0), false);
    EXPECT_EQ(levelAt(w, 40.0), true);
    EXPECT_FALSE(levelAt(Waveform{}, 1.0));
}

TEST(Waveform, LevelMatchesCapturedSquareWave) {
    // 100 kHz at 25 % duty: high for 2.5 us of every 10 us.
    FakeInstrument instrument(1e5, 0.25);
    LogicAnalyzer la(instrument);
    la.configureTrigger(Channel::ID1, TriggerDirection::Rising);
    const auto t = la.capture(1, 20);
    ASSERT_TRUE(t);
    const Waveform w = la.getXY(*t)[0];
    // Edge 0 is the falling edge 2.5 us after the trigger, edge 1 the next rising one.
    EXPECT_EQ(levelAt(w, 1.0), true);
    EXPECT_EQ(levelAt(w, 5.0), false);
    EXPECT_EQ(levelAt(w, 11.0), true);
    EXPECT_EQ(nearestEdge(w, 9.0), 1u);
}
