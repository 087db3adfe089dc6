#pragma once

#include "pulsescope/protocol.h"

#include <QByteArray>

namespace pulsescope {

class TrafficRecorder;

/**
 * Synchronous half-duplex link to the instrument firmware.
 *
 * Every command is written in one piece (two opcode bytes followed by the payload)
 * and its response is read back with receive()/receiveScalar()/getAck(). Subclasses
 * only move bytes; short reads and bad acknowledges are turned into TransportError
 * here so every transport reports them the same way.
 */
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    void send(Opcode opcode, const QByteArray& payload = {});
    QByteArray receive(int n);
    // Little-endian unsigned integer of `width` bytes (1, 2 or 4).
    quint32 receiveScalar(int width);
    void getAck();

    quint8 getByte() {
        return quint8(receiveScalar(1));
    }

    quint16 getInt() {
        return quint16(receiveScalar(2));
    }

    quint32 getLong() {
        return receiveScalar(4);
    }

    // Raw traffic hook used by the record/playback harness. Not owned.
    void setRecorder(TrafficRecorder* r) {
        recorder = r;
    }

protected:
    virtual void writeBytes(const QByteArray& data) = 0;
    // May return fewer than n bytes when the device does not answer in time.
    virtual QByteArray readBytes(int n) = 0;

private:
    TrafficRecorder* recorder = nullptr;
};

} // namespace pulsescope
