#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

#include <array>

namespace pulsescope {

constexpr double CLOCK_RATE = 64'000'000.0;
constexpr std::array<int, 4> PRESCALERS{1, 8, 64, 256};
constexpr int MAX_SAMPLES = 10000;
constexpr int CHANNEL_COUNT = 4;
constexpr int MAX_EVENTS = MAX_SAMPLES / CHANNEL_COUNT;
constexpr int FETCH_CHUNK_WORDS = 1000;
constexpr double HIGH_FREQUENCY_GATE = 0.1;
constexpr double HIGH_FREQUENCY_LIMIT = 1e7;
constexpr double MICROSECONDS = 1e6;
constexpr quint8 ACKNOWLEDGE = 0xFE;

struct Opcode {
    quint8 group;
    quint8 command;
};

inline bool operator==(Opcode a, Opcode b) {
    return a.group == b.group && a.command == b.command;
}

namespace op {

constexpr quint8 DIN = 9;
constexpr quint8 TIMING = 10;
constexpr quint8 COMMON = 11;

constexpr Opcode GET_STATES{DIN, 2};

constexpr Opcode START_TWO_CHAN_LA{TIMING, 3};
constexpr Opcode START_FOUR_CHAN_LA{TIMING, 4};
constexpr Opcode GET_INITIAL_DIGITAL_STATES{TIMING, 9};
constexpr Opcode START_ALTERNATE_ONE_CHAN_LA{TIMING, 13};
constexpr Opcode STOP_LA{TIMING, 15};

constexpr Opcode RETRIEVE_BUFFER{COMMON, 8};
constexpr Opcode CLEAR_BUFFER{COMMON, 10};
constexpr Opcode GET_ALTERNATE_HIGH_FREQUENCY{COMMON, 20};
constexpr Opcode START_COUNTING{COMMON, 25};
constexpr Opcode FETCH_COUNT{COMMON, 26};

} // namespace op

// Digital inputs, numbered as the firmware numbers them.
enum class Channel : quint8 {
    ID1 = 0,
    ID2 = 1,
    ID3 = 2,
    ID4 = 3
};

constexpr std::array<Channel, CHANNEL_COUNT> ALL_CHANNELS{Channel::ID1, Channel::ID2, Channel::ID3, Channel::ID4};

inline quint8 channelNumber(Channel c) {
    return quint8(c);
}

QString channelName(Channel c);
Channel parseChannel(const QString& name);

// Capture layouts the firmware offers. Three channels run in the four channel layout.
enum class Layout {
    OneChannel,
    TwoChannel,
    FourChannel
};

inline void put8(QByteArray& o, quint8 v) {
    o.append(char(v));
}

inline void put16(QByteArray& o, quint16 v) {
    o.append(char(v & 0xFF));
    o.append(char(v >> 8));
}

inline void put32(QByteArray& o, quint32 v) {
    put16(o, quint16(v & 0xFFFF));
    put16(o, quint16(v >> 16));
}

} // namespace pulsescope
