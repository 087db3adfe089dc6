#include "pulsescope/edge_mode.h"
#include "pulsescope/errors.h"

#include <gtest/gtest.h>

using namespace pulsescope;

TEST(EdgeMode, EncodesHardwareCodesAndMultipliers) {
    EXPECT_EQ(encode(EdgeMode::Any).hardwareCode, 1);
    EXPECT_EQ(encode(EdgeMode::Falling).hardwareCode, 2);
    EXPECT_EQ(encode(EdgeMode::Rising).hardwareCode, 3);
    EXPECT_EQ(encode(EdgeMode::FourRising).hardwareCode, 4);
    EXPECT_EQ(encode(EdgeMode::SixteenRising).hardwareCode, 5);

    EXPECT_EQ(encode(EdgeMode::Any).multiplier, 1);
    EXPECT_EQ(encode(EdgeMode::Rising).multiplier, 1);
    EXPECT_EQ(encode(EdgeMode::FourRising).multiplier, 4);
    EXPECT_EQ(encode(EdgeMode::SixteenRising).multiplier, 16);
}

TEST(EdgeMode, OutOfRangeValueIsRejected) {
    EXPECT_THROW(encode(static_cast<EdgeMode>(42)), InvalidArgument);
}

TEST(EdgeMode, ParsesNamesLeniently) {
    EXPECT_EQ(parseEdgeMode("any"), EdgeMode::Any);
    EXPECT_EQ(parseEdgeMode("Rising"), EdgeMode::Rising);
    EXPECT_EQ(parseEdgeMode("four rising"), EdgeMode::FourRising);
    EXPECT_EQ(parseEdgeMode("four-rising"), EdgeMode::FourRising);
    EXPECT_EQ(parseEdgeMode("SIXTEEN_RISING"), EdgeMode::SixteenRising);
    EXPECT_THROW(parseEdgeMode("eight rising"), InvalidArgument);
    EXPECT_THROW(parseEdgeMode(""), InvalidArgument);
}

TEST(EdgeMode, NamesParseBack) {
    for (EdgeMode m : {EdgeMode::Any, EdgeMode::Rising, EdgeMode::Falling, EdgeMode::FourRising, EdgeMode::SixteenRising}) {
        EXPECT_EQ(parseEdgeMode(edgeModeName(m)), m);
    }
}

TEST(Channel, NamesAndParsing) {
    EXPECT_EQ(channelName(Channel::ID1).toStdString(), "ID1");
    EXPECT_EQ(channelName(Channel::ID4).toStdString(), "ID4");
    EXPECT_EQ(parseChannel("id3"), Channel::ID3);
    EXPECT_THROW(parseChannel("ID5"), InvalidArgument);
    EXPECT_THROW(parseChannel("LA1"), InvalidArgument);
}

TEST(Trigger, ParsesDirections) {
    EXPECT_EQ(parseTriggerDirection("falling"), TriggerDirection::Falling);
    EXPECT_EQ(parseTriggerDirection("Rising"), TriggerDirection::Rising);
    EXPECT_EQ(parseTriggerDirection("none"), TriggerDirection::Disabled);
    EXPECT_THROW(parseTriggerDirection("both"), InvalidArgument);
}

TEST(Trigger, CodesDependOnLayout) {
    const TriggerConfig rising{Channel::ID2, TriggerDirection::Rising};
    const TriggerConfig falling{Channel::ID2, TriggerDirection::Falling};
    const TriggerConfig off{Channel::ID2, TriggerDirection::Disabled};

    EXPECT_EQ(encodeTrigger(rising, Layout::OneChannel), (1 << 4) | 3);
    EXPECT_EQ(encodeTrigger(falling, Layout::OneChannel), (1 << 4) | 2);
    EXPECT_EQ(encodeTrigger(rising, Layout::TwoChannel), (1 << 4) | 1);
    EXPECT_EQ(encodeTrigger(falling, Layout::TwoChannel), (1 << 4) | 3);
    EXPECT_EQ(encodeTrigger(rising, Layout::FourChannel), 8 | 3);
    EXPECT_EQ(encodeTrigger(falling, Layout::FourChannel), 8 | 1);
    EXPECT_EQ(encodeTrigger(off, Layout::OneChannel) & 0x0F, 0);
    EXPECT_EQ(encodeTrigger(off, Layout::FourChannel) & 0x03, 0);
}

TEST(Trigger, FourChannelLayoutCannotTriggerOnID4) {
    EXPECT_THROW(encodeTrigger({Channel::ID4, TriggerDirection::Rising}, Layout::FourChannel), InvalidArgument);
    EXPECT_NO_THROW(encodeTrigger({Channel::ID4, TriggerDirection::Rising}, Layout::OneChannel));
}
