#include "main_window.h"

#include "pulsescope/errors.h"
#include "pulsescope/ftdi_channel.h"
#include "pulsescope/traffic_log.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QMessageBox>

#include <memory>

using namespace pulsescope;

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("pulsescope-viewer");

    QCommandLineParser parser;
    parser.setApplicationDescription("Logic analyzer capture viewer.");
    parser.addHelpOption();
    parser.addOptions({
        {"serial", "FTDI serial number (first device when omitted).", "serial"},
        {"playback", "Replay device traffic from a JSON file instead of opening the device.", "file"},
        {{"v", "verbose"}, "Log device traffic and state changes."},
    });
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet("verbose") ? "default.debug=true" : "default.debug=false");

    std::unique_ptr<CommandChannel> channel;
    try {
        if (parser.isSet("playback")) {
            channel = std::make_unique<PlaybackChannel>(parser.value("playback"));
        } else {
            FtdiChannel::Options o;
            o.serial = parser.value("serial").toLatin1();
            channel = std::make_unique<FtdiChannel>(o);
        }
    } catch (const Error& e) {
        QMessageBox::critical(nullptr, "pulsescope", QString("Cannot open the instrument:\n%1").arg(e.what()));
        return 1;
    }

    LogicAnalyzer la(*channel);
    MainWindow w(la);
    w.resize(1400, 900);
    w.show();
    return app.exec();
}
