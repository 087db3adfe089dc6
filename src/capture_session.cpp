#include "pulsescope/capture_session.h"

#include "pulsescope/errors.h"
#include "pulsescope/poller.h"
#include "pulsescope/prescaler.h"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace pulsescope {

namespace {

std::string str(int v) {
    return std::to_string(v);
}

} // namespace

CaptureSession::CaptureSession(CommandChannel& channel) : channel(channel) {
}

const char* CaptureSession::stateName(State s) {
    switch (s) {
    case State::Idle: {
        return "Idle";
    }
    case State::Configured: {
        return "Configured";
    }
    case State::Running: {
        return "Running";
    }
    case State::Completed: {
        return "Completed";
    }
    case State::Stopped: {
        return "Stopped";
    }
    case State::TimedOut: {
        return "TimedOut";
    }
    }
    return "?";
}

void CaptureSession::setState(State s) {
    if (s != sessionState) {
        qDebug() << "LA" << stateName(sessionState) << "->" << stateName(s);
    }
    sessionState = s;
}

void CaptureSession::validate(const CaptureRequest& request) const {
    const int n = int(request.channels.size());
    if (n < 1 || n > CHANNEL_COUNT) {
        throw InvalidArgument("channel count must be between 1 and 4, got " + str(n));
    }
    if (request.events < 1 || request.events > MAX_EVENTS || n * request.events > MAX_SAMPLES) {
        throw InvalidArgument("events must be between 1 and " + str(MAX_EVENTS) + " per channel, got " + str(request.events));
    }
    if (int(request.modes.size()) < n) {
        throw InvalidArgument("expected " + str(n) + " edge modes, got " + str(int(request.modes.size())));
    }
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            if (request.channels[i] == request.channels[j]) {
                throw InvalidArgument("channel " + channelName(request.channels[i]).toStdString() + " requested twice");
            }
        }
        if (n > 2 && request.channels[i] != ALL_CHANNELS[i]) {
            throw InvalidArgument("captures of three or four channels always use ID1..ID" + str(n) + " in order");
        }
    }
    if (!std::isfinite(request.timeout) || request.timeout < 0) {
        throw InvalidArgument("timeout must be a non-negative number of seconds");
    }
    if (!std::isfinite(request.e2eTime) || request.e2eTime < 0) {
        throw InvalidArgument("e2e time must be a non-negative number of seconds");
    }
}

void CaptureSession::configure(const CaptureRequest& request, const TriggerConfig& trigger) {
    if (sessionState == State::Running) {
        throw HardwareBusy("a capture is already running, stop or fetch it first");
    }
    CaptureRequest r = request;
    if (r.modes.empty()) {
        r.modes.assign(r.channels.size(), EdgeMode::Any);
    }
    validate(r);
    r.modes.resize(r.channels.size());

    const int n = int(r.channels.size());
    const Layout l = n == 1 ? Layout::OneChannel : (n == 2 ? Layout::TwoChannel : Layout::FourChannel);
    std::vector<EdgeModeCode> c;
    for (EdgeMode m : r.modes) {
        c.push_back(encode(m));
    }
    encodeTrigger(trigger, l);

    int p = 1;
    if (l == Layout::FourChannel) {
        p = selectPrescaler(r.e2eTime * MICROSECONDS, 16, CLOCK_RATE, std::vector<int>(PRESCALERS.begin(), PRESCALERS.end()));
    } else {
        p = selectPrescaler(r.timeout * MICROSECONDS, 32, CLOCK_RATE, {1});
    }

    req = r;
    trig = trigger;
    captureLayout = l;
    codes = c;
    prescalerValue = p;
    prescalerIndex = int(std::distance(PRESCALERS.begin(), std::find(PRESCALERS.begin(), PRESCALERS.end(), p)));
    setState(State::Configured);
}

void CaptureSession::arm() {
    QByteArray clear;
    put16(clear, 0);
    put16(clear, MAX_SAMPLES);
    channel.send(op::CLEAR_BUFFER, clear);
    channel.getAck();

    const quint8 trigger = encodeTrigger(trig, captureLayout);
    QByteArray p;
    put16(p, MAX_EVENTS);
    switch (captureLayout) {
    case Layout::OneChannel: {
        put8(p, quint8((channelNumber(req.channels[0]) << 4) | codes[0].hardwareCode));
        put8(p, trigger);
        channel.send(op::START_ALTERNATE_ONE_CHAN_LA, p);
        break;
    }
    case Layout::TwoChannel: {
        put8(p, trigger);
        put8(p, quint8(codes[0].hardwareCode | (codes[1].hardwareCode << 4)));
        put8(p, quint8(channelNumber(req.channels[0]) | (channelNumber(req.channels[1]) << 4)));
        channel.send(op::START_TWO_CHAN_LA, p);
        break;
    }
    case Layout::FourChannel: {
        quint16 modes = 0;
        for (int i = 0; i < CHANNEL_COUNT; ++i) {
            const quint8 code = i < int(codes.size()) ? codes[i].hardwareCode : MODE_DISABLED;
            modes |= quint16(code << (4 * i));
        }
        put16(p, modes);
        put8(p, quint8(prescalerIndex));
        put8(p, trigger);
        channel.send(op::START_FOUR_CHAN_LA, p);
        break;
    }
    }
    channel.getAck();
    armed = true;
    progress = 0;
    armTimer.start();
    qDebug() << "LA armed:" << req.channels.size() << "channel(s)," << req.events << "events, prescaler" << prescalerValue << ", trigger" << channelName(trig.channel) << triggerDirectionName(trig.direction);
}

std::optional<CaptureResult> CaptureSession::start(bool block) {
    if (sessionState == State::Running) {
        throw HardwareBusy("a capture is already running, stop or fetch it first");
    }
    if (sessionState != State::Configured) {
        throw SessionStateError(std::string("start() needs a configured capture, session is ") + stateName(sessionState));
    }
    arm();
    setState(State::Running);
    if (!block) {
        return std::nullopt;
    }
    if (!waitForEvents(req.timeout)) {
        setState(State::TimedOut);
        throw Timeout("capture timed out after " + std::to_string(req.timeout) + " s with " + str(progress) + " of " + str(req.events) + " events");
    }
    setState(State::Completed);
    CaptureResult r = decode(req.events, readStatus());
    setState(State::Idle);
    return r;
}

CaptureSession::FirmwareStatus CaptureSession::readStatus() {
    channel.send(op::GET_INITIAL_DIGITAL_STATES);
    FirmwareStatus s;
    for (int i = 0; i < CHANNEL_COUNT; ++i) {
        s.counts[i] = channel.getInt();
    }
    const quint8 levels = channel.getByte();
    const quint8 error = channel.getByte();
    channel.getAck();
    for (int i = 0; i < CHANNEL_COUNT; ++i) {
        s.levels[i] = (levels & (1 << i)) != 0;
    }
    if (error) {
        qWarning() << "LA status reports error flags" << Qt::hex << error;
    }
    return s;
}

int CaptureSession::activeCount(const FirmwareStatus& status) const {
    int n = MAX_EVENTS;
    for (size_t i = 0; i < req.channels.size(); ++i) {
        n = std::min(n, status.counts[i]);
    }
    return std::max(0, n);
}

bool CaptureSession::waitForEvents(double timeout) {
    Poller poller(timeout);
    return poller.wait([&] {
        progress = activeCount(readStatus());
        return progress >= req.events;
    });
}

int CaptureSession::getProgress() {
    if (!armed) {
        throw SessionStateError("no capture has been armed yet");
    }
    progress = activeCount(readStatus());
    return progress;
}

CaptureResult CaptureSession::fetchData() {
    if (!running()) {
        throw SessionStateError(std::string("fetchData() needs a running capture, session is ") + stateName(sessionState));
    }
    if (!waitForEvents(req.timeout)) {
        setState(State::TimedOut);
        throw Timeout("fetch timed out with " + str(progress) + " of " + str(req.events) + " events");
    }
    setState(State::Completed);
    CaptureResult r = decode(req.events, readStatus());
    setState(State::Idle);
    return r;
}

CaptureResult CaptureSession::stop() {
    if (!running()) {
        throw SessionStateError(std::string("stop() needs a running capture, session is ") + stateName(sessionState));
    }
    channel.send(op::STOP_LA);
    channel.getAck();
    const FirmwareStatus status = readStatus();
    progress = activeCount(status);
    const int n = std::min(progress, req.events);
    setState(State::Stopped);
    qDebug() << "LA stopped after" << armTimer.elapsed() << "ms with" << n << "of" << req.events << "events";
    CaptureResult r = decode(n, status);
    setState(State::Idle);
    return r;
}

CaptureResult CaptureSession::decode(int events, const FirmwareStatus& status) {
    CaptureResult r;
    r.trigger = trig;
    r.initialStates = status.levels;
    const double usPerTick = prescalerValue / CLOCK_RATE * MICROSECONDS;
    for (size_t i = 0; i < req.channels.size(); ++i) {
        Trace t{req.channels[i], req.modes[i], {}};
        const std::vector<quint64> ticks = fetchTicks(int(i), events);
        t.timestamps.reserve(ticks.size());
        for (quint64 tk : ticks) {
            t.timestamps.push_back(double(tk) * usPerTick);
        }
        r.traces.push_back(std::move(t));
    }
    return r;
}

std::vector<quint64> CaptureSession::fetchTicks(int slot, int count) {
    std::vector<quint64> ticks;
    if (count <= 0) {
        return ticks;
    }
    ticks.reserve(count);
    if (wideTimestamps()) {
        // Two words per event, accumulated by the firmware's 32 bit timer.
        const std::vector<quint16> w = retrieveWords(slot * 2 * MAX_EVENTS, 2 * count);
        for (int i = 0; i < count; ++i) {
            ticks.push_back(quint64(w[2 * i]) | (quint64(w[2 * i + 1]) << 16));
        }
    } else {
        // 16 bit timer: a sample not above its predecessor means the counter wrapped.
        const std::vector<quint16> w = retrieveWords(slot * MAX_EVENTS, count);
        quint64 offset = 0;
        for (int i = 0; i < count; ++i) {
            if (i > 0 && w[i] <= w[i - 1]) {
                offset += 0x10000;
            }
            ticks.push_back(offset + w[i]);
        }
    }
    return ticks;
}

std::vector<quint16> CaptureSession::retrieveWords(int start, int count) {
    std::vector<quint16> words;
    words.reserve(count);
    for (int done = 0; done < count;) {
        const int n = std::min(FETCH_CHUNK_WORDS, count - done);
        QByteArray p;
        put16(p, quint16(start + done));
        put16(p, quint16(n));
        channel.send(op::RETRIEVE_BUFFER, p);
        const QByteArray raw = channel.receive(2 * n);
        channel.getAck();
        for (int i = 0; i < n; ++i) {
            words.push_back(quint16(quint8(raw[2 * i]) | (quint8(raw[2 * i + 1]) << 8)));
        }
        done += n;
    }
    return words;
}

} // namespace pulsescope
