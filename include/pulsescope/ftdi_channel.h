#pragma once

#include "pulsescope/command_channel.h"

#include <QByteArray>

#include "ftd2xx.h"

namespace pulsescope {

class FtdiChannel : public CommandChannel {
public:
    struct Options {
        QByteArray serial;  // empty: first device
        ULONG baudRate = 1'000'000;
        UCHAR latencyMs = 1;
        ULONG readTimeoutMs = 1000;
        ULONG writeTimeoutMs = 1000;
    };

    explicit FtdiChannel(const Options& options);
    ~FtdiChannel() override;

    FtdiChannel(const FtdiChannel&) = delete;
    FtdiChannel& operator=(const FtdiChannel&) = delete;

protected:
    void writeBytes(const QByteArray& data) override;
    QByteArray readBytes(int n) override;

private:
    void check(FT_STATUS st, const char* what);

    FT_HANDLE h = nullptr;
};

} // namespace pulsescope
