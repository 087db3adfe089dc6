#pragma once

#include "pulsescope/command_channel.h"
#include "pulsescope/edge_mode.h"
#include "pulsescope/protocol.h"

#include <QElapsedTimer>

#include <array>
#include <optional>
#include <vector>

namespace pulsescope {

struct CaptureRequest {
    std::vector<Channel> channels{Channel::ID1};
    int events = MAX_EVENTS;
    // One per channel; empty means Any everywhere.
    std::vector<EdgeMode> modes;
    // Expected time between consecutive events in seconds, 0 if unknown.
    double e2eTime = 0.0;
    double timeout = 1.0;
};

struct Trace {
    Channel channel;
    EdgeMode mode;
    // Microseconds after the trigger edge (or the arm instant without trigger).
    std::vector<double> timestamps;
};

struct CaptureResult {
    TriggerConfig trigger;
    std::vector<Trace> traces;
    // Input levels the firmware latched at the capture origin, indexed by channel number.
    std::array<bool, CHANNEL_COUNT> initialStates{};

    size_t size() const {
        return traces.size();
    }

    const std::vector<double>& operator[](size_t i) const {
        return traces[i].timestamps;
    }
};

/**
 * Owns the instrument's capture buffer and timer.
 *
 *   Idle -> Configured -> Running -> {Completed, Stopped, TimedOut} -> Idle
 *
 * A blocking start() or fetchData() that misses its deadline leaves the firmware
 * armed and the session TimedOut; getProgress(), fetchData() and stop() still work
 * there, and a new configure() simply re-arms. Not thread safe.
 */
class CaptureSession {
public:
    enum class State {
        Idle,
        Configured,
        Running,
        Completed,
        Stopped,
        TimedOut
    };

    explicit CaptureSession(CommandChannel& channel);

    void configure(const CaptureRequest& request, const TriggerConfig& trigger);
    // Returns the decoded capture when block is true, nothing otherwise.
    std::optional<CaptureResult> start(bool block);
    int getProgress();
    CaptureResult fetchData();
    CaptureResult stop();

    State state() const {
        return sessionState;
    }

    bool running() const {
        return sessionState == State::Running || sessionState == State::TimedOut;
    }

    const CaptureRequest& request() const {
        return req;
    }

    Layout layout() const {
        return captureLayout;
    }

    int prescaler() const {
        return prescalerValue;
    }

    // Last value returned by getProgress() or read back by stop().
    int lastProgress() const {
        return progress;
    }

    static const char* stateName(State s);

private:
    struct FirmwareStatus {
        std::array<int, CHANNEL_COUNT> counts{};
        std::array<bool, CHANNEL_COUNT> levels{};
    };

    void setState(State s);
    void validate(const CaptureRequest& request) const;
    void arm();
    FirmwareStatus readStatus();
    int activeCount(const FirmwareStatus& status) const;
    bool waitForEvents(double timeout);
    CaptureResult decode(int events, const FirmwareStatus& status);
    std::vector<quint64> fetchTicks(int slot, int count);
    std::vector<quint16> retrieveWords(int start, int count);
    bool wideTimestamps() const {
        return captureLayout != Layout::FourChannel;
    }

    CommandChannel& channel;
    State sessionState = State::Idle;
    CaptureRequest req;
    TriggerConfig trig;
    Layout captureLayout = Layout::OneChannel;
    std::vector<EdgeModeCode> codes;
    int prescalerValue = 1;
    int prescalerIndex = 0;
    bool armed = false;
    int progress = 0;
    QElapsedTimer armTimer;
};

} // namespace pulsescope
