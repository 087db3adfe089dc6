#include "pulsescope/logic_analyzer.h"

#include "pulsescope/errors.h"
#include "pulsescope/poller.h"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <string>

namespace pulsescope {

namespace {

bool qualifies(EdgeMode mode, bool rising) {
    switch (mode) {
    case EdgeMode::Any: {
        return true;
    }
    case EdgeMode::Falling: {
        return !rising;
    }
    default: {
        return rising;
    }
    }
}

// Index of the edge `mode` selects, counting edges of an alternating trace whose
// level before edge 0 is `level` and starting the search at edge `from`.
int edgeIndex(EdgeMode mode, bool level, int from) {
    const int wanted = encode(mode).multiplier;
    int seen = 0;
    for (int i = from;; ++i) {
        // Edges alternate, so edge i leaves the line high when (i is even) != level.
        const bool rising = (i % 2 == 0) != level;
        if (qualifies(mode, rising) && ++seen == wanted) {
            return i;
        }
    }
}

std::pair<int, int> intervalIndices(EdgeMode a, EdgeMode b, bool level) {
    const int first = edgeIndex(a, level, 0);
    const int second = edgeIndex(b, level, a == b ? first + 1 : first);
    return {first, second};
}

} // namespace

LogicAnalyzer::LogicAnalyzer(CommandChannel& channel) : device(channel), captureSession(channel) {
}

std::optional<CaptureResult> LogicAnalyzer::capture(int channels, int events, const CaptureOptions& options) {
    if (channels < 1 || channels > CHANNEL_COUNT) {
        throw InvalidArgument("channel count must be between 1 and 4, got " + std::to_string(channels));
    }
    CaptureRequest request;
    request.channels.assign(ALL_CHANNELS.begin(), ALL_CHANNELS.begin() + channels);
    request.events = events;
    request.modes = options.modes;
    request.e2eTime = options.e2eTime;
    request.timeout = options.timeout;
    return capture(request, options.block);
}

std::optional<CaptureResult> LogicAnalyzer::capture(const CaptureRequest& request, bool block) {
    captureSession.configure(request, trig);
    return captureSession.start(block);
}

CaptureResult LogicAnalyzer::fetchData() {
    return captureSession.fetchData();
}

int LogicAnalyzer::getProgress() {
    return captureSession.getProgress();
}

CaptureResult LogicAnalyzer::stop() {
    return captureSession.stop();
}

void LogicAnalyzer::configureTrigger(Channel channel, TriggerDirection direction) {
    trig.channel = channel;
    trig.direction = direction;
    qDebug() << "LA trigger" << channelName(channel) << triggerDirectionName(direction);
}

void LogicAnalyzer::ensureIdle(const char* operation) const {
    if (captureSession.state() == CaptureSession::State::Running) {
        throw HardwareBusy(std::string(operation) + " needs the capture buffer, stop or fetch the running capture first");
    }
}

CaptureResult LogicAnalyzer::runCapture(const CaptureRequest& request, const TriggerConfig& trigger, bool keepPartial) {
    captureSession.configure(request, trigger);
    try {
        return *captureSession.start(true);
    } catch (const Timeout& e) {
        // The capture belongs to this measurement, never leave it armed.
        CaptureResult partial = captureSession.stop();
        if (!keepPartial) {
            throw;
        }
        qDebug() << "LA" << e.what() << "- using" << (partial.size() ? partial[0].size() : 0) << "events";
        return partial;
    }
}

double LogicAnalyzer::measureFrequency(Channel channel, double timeout, bool simultaneousOscilloscope) {
    if (simultaneousOscilloscope) {
        return measureHighFrequency(channel);
    }
    ensureIdle("measureFrequency");
    CaptureRequest request;
    request.channels = {channel};
    request.events = MAX_EVENTS;
    request.modes = {EdgeMode::Rising};
    request.timeout = timeout;
    const CaptureResult r = runCapture(request, TriggerConfig{channel, TriggerDirection::Disabled}, true);

    const std::vector<double>& t = r[0];
    if (t.size() < 2) {
        throw Timeout("fewer than two rising edges on " + channelName(channel).toStdString() + " within " + std::to_string(timeout) + " s");
    }
    const double span = t.back() - t.front();
    if (span <= 0) {
        return measureHighFrequency(channel);
    }
    const double frequency = double(t.size() - 1) / span * MICROSECONDS;
    if (frequency >= HIGH_FREQUENCY_LIMIT) {
        qDebug() << "LA" << frequency << "Hz is beyond the timer resolution, using the edge counter";
        return measureHighFrequency(channel);
    }
    return frequency;
}

double LogicAnalyzer::measureHighFrequency(Channel channel) {
    QByteArray p;
    put8(p, channelNumber(channel));
    device.send(op::GET_ALTERNATE_HIGH_FREQUENCY, p);
    const quint8 scale = device.getByte();
    const quint32 counter = device.getLong();
    device.getAck();
    return scale * double(counter) / HIGH_FREQUENCY_GATE;
}

double LogicAnalyzer::measureInterval(std::pair<Channel, Channel> channels, std::pair<EdgeMode, EdgeMode> modes, double timeout) {
    ensureIdle("measureInterval");
    const TriggerConfig trigger{channels.first, trig.direction};

    CaptureRequest request;
    request.timeout = timeout;
    if (channels.first != channels.second) {
        request.channels = {channels.first, channels.second};
        request.events = 1;
        request.modes = {modes.first, modes.second};
        const CaptureResult r = runCapture(request, trigger, false);
        return r[1][0] - r[0][0];
    }

    // One channel carries both edges: record every edge and pick them out by
    // parity, starting from the level the firmware latched at the origin.
    const int needed = std::max(intervalIndices(modes.first, modes.second, false).second, intervalIndices(modes.first, modes.second, true).second) + 1;
    request.channels = {channels.first};
    request.events = needed;
    request.modes = {EdgeMode::Any};
    const CaptureResult r = runCapture(request, trigger, false);

    const bool level = r.initialStates[channelNumber(channels.first)];
    const std::pair<int, int> idx = intervalIndices(modes.first, modes.second, level);
    return r[0][idx.second] - r[0][idx.first];
}

DutyCycle LogicAnalyzer::measureDutyCycle(Channel channel, double timeout) {
    ensureIdle("measureDutyCycle");
    CaptureRequest request;
    request.channels = {channel};
    request.events = 3;
    request.modes = {EdgeMode::Any};
    request.timeout = timeout;
    // Starting on a falling edge makes the three edges rising, falling, rising.
    const CaptureResult r = runCapture(request, TriggerConfig{channel, TriggerDirection::Falling}, false);

    const std::vector<double>& t = r[0];
    DutyCycle d;
    d.period = t[2] - t[0];
    d.dutyCycle = d.period > 0 ? (t[1] - t[0]) / d.period : 0.0;
    return d;
}

std::map<Channel, bool> LogicAnalyzer::getStates() {
    device.send(op::GET_STATES);
    const quint8 s = device.getByte();
    device.getAck();
    std::map<Channel, bool> states;
    for (Channel c : ALL_CHANNELS) {
        states[c] = (s & (1 << channelNumber(c))) != 0;
    }
    return states;
}

quint32 LogicAnalyzer::countPulses(Channel channel, double interval) {
    if (!std::isfinite(interval) || interval < 0) {
        throw InvalidArgument("pulse counting interval must be a non-negative number of seconds");
    }
    startCounting(channel);
    Poller::sleep(interval);
    return fetchPulseCount();
}

void LogicAnalyzer::startCounting(Channel channel) {
    ensureIdle("countPulses");
    QByteArray p;
    put8(p, channelNumber(channel));
    device.send(op::START_COUNTING, p);
    device.getAck();
}

quint32 LogicAnalyzer::fetchPulseCount() {
    device.send(op::FETCH_COUNT);
    const quint32 count = device.getLong();
    device.getAck();
    return count;
}

std::vector<Waveform> LogicAnalyzer::getXY(const CaptureResult& result) const {
    std::vector<Waveform> waveforms;
    for (const Trace& trace : result.traces) {
        Waveform w;
        w.x = trace.timestamps;
        w.y.reserve(w.x.size());
        switch (trace.mode) {
        case EdgeMode::Any: {
            bool level = result.initialStates[channelNumber(trace.channel)];
            if (result.trigger.direction != TriggerDirection::Disabled) {
                level = result.trigger.direction == TriggerDirection::Rising;
            }
            for (size_t i = 0; i < w.x.size(); ++i) {
                w.y.push_back(level);
                level = !level;
            }
            break;
        }
        case EdgeMode::Falling: {
            w.y.assign(w.x.size(), false);
            break;
        }
        default: {
            w.y.assign(w.x.size(), true);
            break;
        }
        }
        waveforms.push_back(std::move(w));
    }
    return waveforms;
}

} // namespace pulsescope
