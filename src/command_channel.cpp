#include "pulsescope/command_channel.h"

#include "pulsescope/errors.h"
#include "pulsescope/traffic_log.h"

#include <string>

namespace pulsescope {

void CommandChannel::send(Opcode opcode, const QByteArray& payload) {
    QByteArray frame;
    frame.reserve(2 + payload.size());
    put8(frame, opcode.group);
    put8(frame, opcode.command);
    frame.append(payload);
    writeBytes(frame);
    if (recorder) {
        recorder->logWrite(frame);
    }
}

QByteArray CommandChannel::receive(int n) {
    if (n <= 0) {
        return {};
    }
    QByteArray data = readBytes(n);
    if (recorder) {
        recorder->logRead(data);
    }
    if (data.size() != n) {
        throw TransportError("short read: expected " + std::to_string(n) + " bytes, got " + std::to_string(data.size()));
    }
    return data;
}

quint32 CommandChannel::receiveScalar(int width) {
    if (width != 1 && width != 2 && width != 4) {
        throw TransportError("unsupported scalar width " + std::to_string(width));
    }
    const QByteArray d = receive(width);
    quint32 v = 0;
    for (int i = width - 1; i >= 0; --i) {
        v = (v << 8) | quint8(d[i]);
    }
    return v;
}

void CommandChannel::getAck() {
    const quint8 ack = getByte();
    if (ack != ACKNOWLEDGE) {
        throw TransportError("bad acknowledge byte " + std::to_string(ack));
    }
}

} // namespace pulsescope
