#pragma once

#include "pulsescope/command_channel.h"

#include <QByteArray>
#include <QString>

#include <vector>

namespace pulsescope {

// One command written to the instrument and every byte read back before the next one.
struct Exchange {
    QByteArray tx;
    QByteArray rx;
};

class TrafficRecorder {
public:
    void logWrite(const QByteArray& data);
    void logRead(const QByteArray& data);

    const std::vector<Exchange>& exchanges() const {
        return log;
    }

    void clear() {
        log.clear();
    }

    // Writes [[tx...], [rx...]] as JSON arrays of byte values.
    void save(const QString& path) const;
    static std::vector<Exchange> load(const QString& path);

private:
    std::vector<Exchange> log;
};

// Replays a recording in place of the instrument. Each write must match the next
// recorded command byte for byte.
class PlaybackChannel : public CommandChannel {
public:
    explicit PlaybackChannel(std::vector<Exchange> recording);
    explicit PlaybackChannel(const QString& path);

    bool exhausted() const {
        return next >= exchanges.size();
    }

protected:
    void writeBytes(const QByteArray& data) override;
    QByteArray readBytes(int n) override;

private:
    std::vector<Exchange> exchanges;
    size_t next = 0;
    QByteArray inBuffer;
};

} // namespace pulsescope
