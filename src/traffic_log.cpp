#include "pulsescope/traffic_log.h"

#include "pulsescope/errors.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace pulsescope {

namespace {

QJsonArray toJson(const QByteArray& bytes) {
    QJsonArray a;
    for (char c : bytes) {
        a.append(int(quint8(c)));
    }
    return a;
}

QByteArray fromJson(const QJsonArray& a) {
    QByteArray bytes;
    bytes.reserve(a.size());
    for (const auto& v : a) {
        const int b = v.toInt(-1);
        if (b < 0 || b > 255) {
            throw TransportError("recording holds a value that is not a byte");
        }
        bytes.append(char(b));
    }
    return bytes;
}

QString hexBytes(const QByteArray& d) {
    return QString::fromLatin1(d.toHex(' ').toUpper());
}

} // namespace

void TrafficRecorder::logWrite(const QByteArray& data) {
    log.push_back(Exchange{data, {}});
}

void TrafficRecorder::logRead(const QByteArray& data) {
    if (log.empty()) {
        log.push_back(Exchange{{}, data});
        return;
    }
    log.back().rx.append(data);
}

void TrafficRecorder::save(const QString& path) const {
    QJsonArray tx;
    QJsonArray rx;
    for (const auto& e : log) {
        tx.append(toJson(e.tx));
        rx.append(toJson(e.rx));
    }
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw TransportError("cannot write recording " + path.toStdString() + ": " + f.errorString().toStdString());
    }
    f.write(QJsonDocument(QJsonArray{tx, rx}).toJson(QJsonDocument::Compact));
    qDebug() << "Recorded" << log.size() << "exchanges to" << path;
}

std::vector<Exchange> TrafficRecorder::load(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        throw TransportError("cannot open recording " + path.toStdString() + ": " + f.errorString().toStdString());
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError) {
        throw TransportError("malformed recording " + path.toStdString() + ": " + err.errorString().toStdString());
    }
    const QJsonArray root = doc.array();
    if (root.size() != 2 || !root[0].isArray() || !root[1].isArray()) {
        throw TransportError("recording " + path.toStdString() + " is not a [tx, rx] pair");
    }
    const QJsonArray tx = root[0].toArray();
    const QJsonArray rx = root[1].toArray();
    if (tx.size() != rx.size()) {
        throw TransportError("recording " + path.toStdString() + " has unequal tx/rx counts");
    }
    std::vector<Exchange> out;
    out.reserve(tx.size());
    for (int i = 0; i < tx.size(); ++i) {
        out.push_back(Exchange{fromJson(tx[i].toArray()), fromJson(rx[i].toArray())});
    }
    return out;
}

PlaybackChannel::PlaybackChannel(std::vector<Exchange> recording) : exchanges(std::move(recording)) {
}

PlaybackChannel::PlaybackChannel(const QString& path) : exchanges(TrafficRecorder::load(path)) {
    qDebug() << "Playback of" << exchanges.size() << "exchanges from" << path;
}

void PlaybackChannel::writeBytes(const QByteArray& data) {
    if (next >= exchanges.size()) {
        throw TransportError("playback exhausted, unexpected command " + hexBytes(data).toStdString());
    }
    const Exchange& e = exchanges[next++];
    if (e.tx != data) {
        throw TransportError("sent data does not match recording: sent " + hexBytes(data).toStdString() + ", recorded " + hexBytes(e.tx).toStdString());
    }
    inBuffer.append(e.rx);
}

QByteArray PlaybackChannel::readBytes(int n) {
    QByteArray out = inBuffer.left(n);
    inBuffer.remove(0, out.size());
    return out;
}

} // namespace pulsescope
