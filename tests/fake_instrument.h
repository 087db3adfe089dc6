#pragma once

#include "pulsescope/command_channel.h"
#include "pulsescope/protocol.h"

#include <QByteArray>
#include <QElapsedTimer>

#include <array>
#include <optional>
#include <vector>

namespace pulsescope::test {

/**
 * Firmware stand-in for the unit tests.
 *
 * All four inputs see the same ideal square wave, rising at multiples of the
 * period on a 64 MHz tick clock that runs `speed` times faster than wall time.
 * Capture progress is computed in closed form from the clock, so a capture fills
 * at the rate real hardware would.
 */
class FakeInstrument : public CommandChannel {
public:
    explicit FakeInstrument(double frequency = 1e5, double dutyCycle = 0.5);

    void setSpeed(double factor);
    // Freezes every input at `level`; no more edges are seen.
    void holdLevel(std::optional<bool> level);

    const std::vector<Opcode>& commands() const {
        return received;
    }

    void clearCommands() {
        received.clear();
    }

    int count(Opcode opcode) const;

    qint64 periodTicks() const {
        return period;
    }

protected:
    void writeBytes(const QByteArray& data) override;
    QByteArray readBytes(int n) override;

private:
    struct Capture {
        Layout layout = Layout::OneChannel;
        std::array<int, CHANNEL_COUNT> modes{};
        int channels = 0;
        int samples = 0;
        int prescaler = 1;
        int triggerCode = 0;
        bool triggerRising = false;
        qint64 armTick = 0;
        std::optional<qint64> stopTick;
    };

    qint64 now() const;
    bool levelAt(qint64 tick) const;
    qint64 nextEdge(qint64 after, bool rising) const;
    std::optional<qint64> origin() const;
    qint64 sample(int mode, qint64 from, int j) const;
    qint64 samplesUntil(int mode, qint64 from, qint64 until) const;
    int progress(int slot) const;
    std::vector<quint16> bufferImage() const;

    void arm(Layout layout, const QByteArray& payload);
    void reply(const QByteArray& data);
    void ack();

    qint64 period;
    qint64 high;
    double frequency;
    double speed = 1.0;
    qint64 base = 0;
    std::optional<bool> held;
    QElapsedTimer clock;
    std::optional<Capture> capture;
    qint64 countingFrom = 0;
    std::vector<Opcode> received;
    QByteArray out;
};

} // namespace pulsescope::test
