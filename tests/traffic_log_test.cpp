#include "fake_instrument.h"

#include "pulsescope/errors.h"
#include "pulsescope/logic_analyzer.h"
#include "pulsescope/traffic_log.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace pulsescope;
using pulsescope::test::FakeInstrument;

namespace {

struct Session {
    CaptureResult capture;
    DutyCycle duty;
    double interval;
    std::map<Channel, bool> states;
};

Session runSession(LogicAnalyzer& la) {
    Session s;
    la.configureTrigger(Channel::ID1, TriggerDirection::Falling);
    CaptureOptions o;
    o.modes = {EdgeMode::Any, EdgeMode::Rising};
    s.capture = *la.capture(2, 50, o);
    s.duty = la.measureDutyCycle(Channel::ID4, 0.1);
    s.interval = la.measureInterval({Channel::ID1, Channel::ID1}, {EdgeMode::Rising, EdgeMode::FourRising}, 0.1);
    s.states = la.getStates();
    return s;
}

void writeFile(const QString& path, const QByteArray& content) {
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(content);
}

} // namespace

TEST(TrafficLog, RecordsOneExchangePerCommand) {
    FakeInstrument instrument;
    TrafficRecorder recorder;
    instrument.setRecorder(&recorder);
    LogicAnalyzer la(instrument);
    la.getStates();

    ASSERT_EQ(recorder.exchanges().size(), 1u);
    const Exchange& e = recorder.exchanges()[0];
    EXPECT_EQ(e.tx, QByteArray::fromHex("0902"));
    ASSERT_EQ(e.rx.size(), 2);
    EXPECT_EQ(quint8(e.rx[1]), ACKNOWLEDGE);
}

TEST(TrafficLog, RecordingReplaysToIdenticalResults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("session.json");

    FakeInstrument instrument;
    TrafficRecorder recorder;
    instrument.setRecorder(&recorder);
    LogicAnalyzer live(instrument);
    const Session recorded = runSession(live);
    recorder.save(path);

    PlaybackChannel playback(path);
    LogicAnalyzer replay(playback);
    const Session replayed = runSession(replay);

    ASSERT_EQ(replayed.capture.size(), recorded.capture.size());
    for (size_t i = 0; i < recorded.capture.size(); ++i) {
        EXPECT_EQ(replayed.capture[i], recorded.capture[i]);
    }
    EXPECT_EQ(replayed.capture.initialStates, recorded.capture.initialStates);
    EXPECT_DOUBLE_EQ(replayed.duty.period, recorded.duty.period);
    EXPECT_DOUBLE_EQ(replayed.duty.dutyCycle, recorded.duty.dutyCycle);
    EXPECT_DOUBLE_EQ(replayed.interval, recorded.interval);
    EXPECT_EQ(replayed.states, recorded.states);
    EXPECT_TRUE(playback.exhausted());
}

TEST(TrafficLog, DivergingCommandIsTransportError) {
    FakeInstrument instrument;
    TrafficRecorder recorder;
    instrument.setRecorder(&recorder);
    LogicAnalyzer live(instrument);
    live.capture(1, 10);

    PlaybackChannel playback(recorder.exchanges());
    LogicAnalyzer replay(playback);
    EXPECT_THROW(replay.capture(2, 10), TransportError);
}

TEST(TrafficLog, ExhaustedPlaybackIsTransportError) {
    PlaybackChannel playback(std::vector<Exchange>{});
    LogicAnalyzer la(playback);
    EXPECT_TRUE(playback.exhausted());
    EXPECT_THROW(la.getStates(), TransportError);
}

TEST(TrafficLog, ShortResponseIsTransportError) {
    PlaybackChannel playback(std::vector<Exchange>{{QByteArray::fromHex("0902"), QByteArray::fromHex("0f")}});
    LogicAnalyzer la(playback);
    EXPECT_THROW(la.getStates(), TransportError);
}

TEST(TrafficLog, BadAcknowledgeIsTransportError) {
    PlaybackChannel playback(std::vector<Exchange>{{QByteArray::fromHex("0902"), QByteArray::fromHex("0f00")}});
    LogicAnalyzer la(playback);
    EXPECT_THROW(la.getStates(), TransportError);
}

TEST(TrafficLog, MalformedRecordingsAreRejected) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString notJson = dir.filePath("garbage.json");
    writeFile(notJson, "not json");
    EXPECT_THROW(TrafficRecorder::load(notJson), TransportError);

    const QString unpaired = dir.filePath("unpaired.json");
    writeFile(unpaired, "[[[9, 2]], []]");
    EXPECT_THROW(TrafficRecorder::load(unpaired), TransportError);

    const QString notBytes = dir.filePath("bytes.json");
    writeFile(notBytes, "[[[9, 300]], [[254]]]");
    EXPECT_THROW(TrafficRecorder::load(notBytes), TransportError);

    EXPECT_THROW(TrafficRecorder::load(dir.filePath("missing.json")), TransportError);

    const QString good = dir.filePath("good.json");
    writeFile(good, "[[[9, 2]], [[15, 254]]]");
    PlaybackChannel playback(good);
    LogicAnalyzer la(playback);
    EXPECT_TRUE(la.getStates().at(Channel::ID4));
}
