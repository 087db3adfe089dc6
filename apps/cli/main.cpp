#include "pulsescope/errors.h"
#include "pulsescope/ftdi_channel.h"
#include "pulsescope/logic_analyzer.h"
#include "pulsescope/poller.h"
#include "pulsescope/traffic_log.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QStringList>
#include <QTextStream>

#include <cstdio>
#include <memory>

using namespace pulsescope;

namespace {

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

int toInt(const QString& s, const char* what) {
    bool ok = false;
    const int v = s.toInt(&ok);
    if (!ok) {
        throw InvalidArgument(std::string(what) + " must be an integer, got '" + s.toStdString() + "'");
    }
    return v;
}

double toDouble(const QString& s, const char* what) {
    bool ok = false;
    const double v = s.toDouble(&ok);
    if (!ok) {
        throw InvalidArgument(std::string(what) + " must be a number, got '" + s.toStdString() + "'");
    }
    return v;
}

std::vector<EdgeMode> parseModes(const QString& list) {
    std::vector<EdgeMode> modes;
    for (const QString& m : list.split(',', Qt::SkipEmptyParts)) {
        modes.push_back(parseEdgeMode(m));
    }
    return modes;
}

// "ID1:falling" or "none".
TriggerConfig parseTrigger(const QString& text) {
    TriggerConfig t;
    const QStringList parts = text.split(':');
    if (parts.size() == 1) {
        t.direction = parseTriggerDirection(parts[0]);
        return t;
    }
    if (parts.size() != 2) {
        throw InvalidArgument("trigger must look like ID1:falling, got '" + text.toStdString() + "'");
    }
    t.channel = parseChannel(parts[0]);
    t.direction = parseTriggerDirection(parts[1]);
    return t;
}

void need(const QStringList& args, int n, const char* usage) {
    if (args.size() < n) {
        throw InvalidArgument(std::string("usage: ") + usage);
    }
}

void printTraces(const CaptureResult& r) {
    for (const Trace& t : r.traces) {
        out() << channelName(t.channel) << " (" << edgeModeName(t.mode) << ", " << t.timestamps.size() << " events):";
        for (double v : t.timestamps) {
            out() << ' ' << QString::number(v, 'f', 4);
        }
        out() << '\n';
    }
}

int run(const QCommandLineParser& parser, LogicAnalyzer& la) {
    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);
    const double timeout = toDouble(parser.value("timeout"), "timeout");

    if (parser.isSet("trigger")) {
        const TriggerConfig t = parseTrigger(parser.value("trigger"));
        la.configureTrigger(t.channel, t.direction);
    }

    if (command == "capture") {
        need(args, 3, "capture <channels> <events>");
        CaptureOptions o;
        o.modes = parseModes(parser.value("modes"));
        o.e2eTime = toDouble(parser.value("e2e"), "e2e");
        o.timeout = timeout;
        printTraces(*la.capture(toInt(args[1], "channels"), toInt(args[2], "events"), o));
    } else if (command == "frequency") {
        need(args, 2, "frequency <channel>");
        const double f = la.measureFrequency(parseChannel(args[1]), timeout, parser.isSet("simultaneous"));
        out() << QString::number(f, 'f', 3) << " Hz\n";
    } else if (command == "interval") {
        need(args, 3, "interval <channelA> <channelB> [--modes a,b]");
        std::vector<EdgeMode> modes = parseModes(parser.value("modes"));
        if (modes.empty()) {
            modes = {EdgeMode::Rising, EdgeMode::Rising};
        }
        if (modes.size() != 2) {
            throw InvalidArgument("interval needs exactly two edge modes");
        }
        const double us = la.measureInterval({parseChannel(args[1]), parseChannel(args[2])}, {modes[0], modes[1]}, timeout);
        out() << QString::number(us, 'f', 4) << " us\n";
    } else if (command == "duty") {
        need(args, 2, "duty <channel>");
        const DutyCycle d = la.measureDutyCycle(parseChannel(args[1]), timeout);
        out() << "period " << QString::number(d.period, 'f', 4) << " us, duty cycle " << QString::number(d.dutyCycle * 100.0, 'f', 2) << " %\n";
    } else if (command == "states") {
        for (const auto& s : la.getStates()) {
            out() << channelName(s.first) << ' ' << (s.second ? "high" : "low") << '\n';
        }
    } else if (command == "count") {
        need(args, 3, "count <channel> <seconds>");
        out() << la.countPulses(parseChannel(args[1]), toDouble(args[2], "seconds")) << " pulses\n";
    } else if (command == "progress") {
        need(args, 3, "progress <channels> <events>");
        const int events = toInt(args[2], "events");
        CaptureOptions o;
        o.modes = parseModes(parser.value("modes"));
        o.e2eTime = toDouble(parser.value("e2e"), "e2e");
        o.timeout = timeout;
        o.block = false;
        la.capture(toInt(args[1], "channels"), events, o);
        Poller poller(timeout, 50, 200);
        const bool complete = poller.wait([&] {
            const int p = la.getProgress();
            out() << p << '/' << events << '\n';
            out().flush();
            return p >= events;
        });
        const CaptureResult r = complete ? la.fetchData() : la.stop();
        out() << (complete ? "complete, " : "stopped, ") << (r.size() ? r[0].size() : 0) << " events per channel\n";
    } else {
        throw InvalidArgument("unknown command '" + command.toStdString() + "'");
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pulsescope-cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Logic analyzer client. Commands: capture, frequency, interval, duty, states, count, progress.");
    parser.addHelpOption();
    parser.addOptions({
        {"serial", "FTDI serial number (first device when omitted).", "serial"},
        {"baud", "Link baud rate.", "baud", "1000000"},
        {"timeout", "Capture timeout in seconds.", "seconds", "1"},
        {"trigger", "Trigger as CHANNEL:DIRECTION, e.g. ID1:falling.", "trigger"},
        {"modes", "Comma separated edge modes, e.g. any,rising.", "modes"},
        {"e2e", "Expected time between events in seconds.", "seconds", "0"},
        {"simultaneous", "Measure frequency with the edge counter."},
        {"record", "Record device traffic to a JSON file.", "file"},
        {"playback", "Replay device traffic from a JSON file instead of opening the device.", "file"},
        {{"v", "verbose"}, "Log device traffic and state changes."},
    });
    parser.addPositionalArgument("command", "Command and its arguments.", "<command> [args...]");
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet("verbose") ? "default.debug=true" : "default.debug=false");

    if (parser.positionalArguments().isEmpty()) {
        parser.showHelp(1);
    }

    try {
        std::unique_ptr<CommandChannel> channel;
        if (parser.isSet("playback")) {
            channel = std::make_unique<PlaybackChannel>(parser.value("playback"));
        } else {
            FtdiChannel::Options o;
            o.serial = parser.value("serial").toLatin1();
            o.baudRate = ULONG(toInt(parser.value("baud"), "baud"));
            channel = std::make_unique<FtdiChannel>(o);
        }
        TrafficRecorder recorder;
        if (parser.isSet("record")) {
            channel->setRecorder(&recorder);
        }
        LogicAnalyzer la(*channel);
        const int rc = run(parser, la);
        if (parser.isSet("record")) {
            recorder.save(parser.value("record"));
        }
        return rc;
    } catch (const Error& e) {
        std::fprintf(stderr, "pulsescope-cli: %s\n", e.what());
        return 1;
    }
}
