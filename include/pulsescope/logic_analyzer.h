#pragma once

#include "pulsescope/capture_session.h"
#include "pulsescope/command_channel.h"
#include "pulsescope/edge_mode.h"
#include "pulsescope/protocol.h"
#include "pulsescope/waveform.h"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace pulsescope {

struct CaptureOptions {
    std::vector<EdgeMode> modes;
    double e2eTime = 0.0;
    double timeout = 1.0;
    bool block = true;
};

struct DutyCycle {
    // Microseconds.
    double period;
    // High fraction of the period, 0..1.
    double dutyCycle;
};

/**
 * Logic analyzer front end of the instrument.
 *
 * Raw captures go through capture()/fetchData()/getProgress()/stop(); the
 * measure*() helpers run their own short capture on top of the same session and
 * leave it Idle. The trigger set with configureTrigger() applies to every raw
 * capture; measurements that need a particular trigger swap it in and put the
 * caller's one back before returning.
 */
class LogicAnalyzer {
public:
    explicit LogicAnalyzer(CommandChannel& channel);

    // Captures on ID1..ID`channels`.
    std::optional<CaptureResult> capture(int channels, int events = MAX_EVENTS, const CaptureOptions& options = {});
    std::optional<CaptureResult> capture(const CaptureRequest& request, bool block = true);
    CaptureResult fetchData();
    int getProgress();
    CaptureResult stop();

    void configureTrigger(Channel channel, TriggerDirection direction);

    const TriggerConfig& trigger() const {
        return trig;
    }

    double measureFrequency(Channel channel, double timeout = 1.0, bool simultaneousOscilloscope = false);
    // Microseconds from the first `modes.first` edge on `channels.first` to the
    // following `modes.second` edge on `channels.second`.
    double measureInterval(std::pair<Channel, Channel> channels, std::pair<EdgeMode, EdgeMode> modes, double timeout = 1.0);
    DutyCycle measureDutyCycle(Channel channel, double timeout = 1.0);
    std::map<Channel, bool> getStates();
    quint32 countPulses(Channel channel, double interval = 1.0);
    void startCounting(Channel channel);
    quint32 fetchPulseCount();

    std::vector<Waveform> getXY(const CaptureResult& result) const;

    CaptureSession& session() {
        return captureSession;
    }

private:
    void ensureIdle(const char* operation) const;
    // Blocking capture owned by a measurement. A timed out capture is stopped and
    // either its partial data returned (keepPartial) or the Timeout rethrown.
    CaptureResult runCapture(const CaptureRequest& request, const TriggerConfig& trigger, bool keepPartial);
    double measureHighFrequency(Channel channel);

    CommandChannel& device;
    CaptureSession captureSession;
    TriggerConfig trig;
};

} // namespace pulsescope
