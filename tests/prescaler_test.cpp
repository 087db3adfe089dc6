#include "pulsescope/errors.h"
#include "pulsescope/prescaler.h"
#include "pulsescope/protocol.h"

#include <gtest/gtest.h>

#include <limits>

using namespace pulsescope;

namespace {

const std::vector<int> TABLE(PRESCALERS.begin(), PRESCALERS.end());

int select16(double spanSeconds) {
    return selectPrescaler(spanSeconds * MICROSECONDS, 16, CLOCK_RATE, TABLE);
}

} // namespace

TEST(Prescaler, RangeOfSixteenBitRegister) {
    EXPECT_NEAR(maxSpanUs(1, 16, CLOCK_RATE), 1023.984375, 1e-9);
    EXPECT_NEAR(maxSpanUs(256, 16, CLOCK_RATE), 262140.0, 1e-6);
}

TEST(Prescaler, PicksFinestPrescalerThatFits) {
    EXPECT_EQ(select16(0.0), 1);
    EXPECT_EQ(select16(0.001), 1);
    EXPECT_EQ(select16(0.005), 8);
    EXPECT_EQ(select16(0.01), 64);
    EXPECT_EQ(select16(0.16), 256);
}

TEST(Prescaler, BoundaryIsInclusive) {
    EXPECT_EQ(selectPrescaler(maxSpanUs(8, 16, CLOCK_RATE), 16, CLOCK_RATE, TABLE), 8);
    EXPECT_EQ(selectPrescaler(maxSpanUs(8, 16, CLOCK_RATE) + 0.01, 16, CLOCK_RATE, TABLE), 64);
}

TEST(Prescaler, SpanBeyondLargestPrescalerIsUnattainable) {
    EXPECT_THROW(select16(0.4), TimingUnattainable);
    EXPECT_THROW(select16(std::numeric_limits<double>::infinity()), TimingUnattainable);
    EXPECT_THROW(select16(std::numeric_limits<double>::quiet_NaN()), TimingUnattainable);
    EXPECT_THROW(select16(-1.0), TimingUnattainable);
}

TEST(Prescaler, ThirtyTwoBitRegisterCoversLongTimeouts) {
    EXPECT_EQ(selectPrescaler(10.0 * MICROSECONDS, 32, CLOCK_RATE, {1}), 1);
    EXPECT_THROW(selectPrescaler(100.0 * MICROSECONDS, 32, CLOCK_RATE, {1}), TimingUnattainable);
}

TEST(Prescaler, EmptyTableIsUnattainable) {
    EXPECT_THROW(selectPrescaler(1.0, 16, CLOCK_RATE, {}), TimingUnattainable);
}
