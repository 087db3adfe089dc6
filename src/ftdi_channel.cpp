#include "pulsescope/ftdi_channel.h"

#include "pulsescope/errors.h"

#include <QDebug>

#include <string>

namespace pulsescope {

FtdiChannel::FtdiChannel(const Options& options) {
    QByteArray serial = options.serial;
    FT_STATUS st = serial.isEmpty() ? FT_Open(0, &h) : FT_OpenEx(serial.data(), FT_OPEN_BY_SERIAL_NUMBER, &h);
    if (st != FT_OK || !h) {
        qDebug() << "FTDI open fail" << st;
        h = nullptr;
        throw TransportError("cannot open FTDI device " + (serial.isEmpty() ? std::string("#0") : serial.toStdString()) + " (status " + std::to_string(st) + ")");
    }
    try {
        check(FT_ResetDevice(h), "FT_ResetDevice");
        check(FT_SetBaudRate(h, options.baudRate), "FT_SetBaudRate");
        check(FT_SetDataCharacteristics(h, FT_BITS_8, FT_STOP_BITS_1, FT_PARITY_NONE), "FT_SetDataCharacteristics");
        check(FT_SetFlowControl(h, FT_FLOW_NONE, 0, 0), "FT_SetFlowControl");
        check(FT_SetLatencyTimer(h, options.latencyMs), "FT_SetLatencyTimer");
        check(FT_SetTimeouts(h, options.readTimeoutMs, options.writeTimeoutMs), "FT_SetTimeouts");
        check(FT_Purge(h, FT_PURGE_RX | FT_PURGE_TX), "FT_Purge");
    } catch (const TransportError&) {
        FT_Close(h);
        h = nullptr;
        throw;
    }
    qDebug() << "FTDI open" << (serial.isEmpty() ? QByteArray("#0") : serial) << "at" << options.baudRate << "baud";
}

FtdiChannel::~FtdiChannel() {
    if (h) {
        FT_Close(h);
    }
}

void FtdiChannel::check(FT_STATUS st, const char* what) {
    if (st != FT_OK) {
        qDebug() << what << "failed" << st;
        throw TransportError(std::string(what) + " failed (status " + std::to_string(st) + ")");
    }
}

void FtdiChannel::writeBytes(const QByteArray& data) {
    DWORD w = 0;
    check(FT_Write(h, const_cast<char*>(data.constData()), DWORD(data.size()), &w), "FT_Write");
    if (w != DWORD(data.size())) {
        throw TransportError("short write: " + std::to_string(w) + " of " + std::to_string(data.size()) + " bytes");
    }
}

QByteArray FtdiChannel::readBytes(int n) {
    QByteArray rx(n, '\0');
    DWORD got = 0;
    check(FT_Read(h, rx.data(), DWORD(n), &got), "FT_Read");
    rx.resize(int(got));
    return rx;
}

} // namespace pulsescope
