#include "pulsescope/poller.h"

#include <QThread>

#include <algorithm>
#include <cmath>

namespace pulsescope {

Poller::Poller(double timeoutSeconds, int intervalMs, int maxIntervalMs)
    : timeoutMs(qint64(std::ceil(std::max(0.0, timeoutSeconds) * 1000.0))),
      intervalMs(std::max(1, intervalMs)),
      maxIntervalMs(std::max(intervalMs, maxIntervalMs)) {
    timer.start();
}

bool Poller::wait(const std::function<bool()>& ready) {
    int interval = intervalMs;
    for (;;) {
        if (ready()) {
            return true;
        }
        const qint64 left = timeoutMs - timer.elapsed();
        if (left <= 0) {
            return false;
        }
        QThread::msleep(unsigned(std::min<qint64>(interval, left)));
        interval = std::min(interval * 2, maxIntervalMs);
    }
}

double Poller::remainingSeconds() const {
    return std::max<qint64>(0, timeoutMs - timer.elapsed()) / 1000.0;
}

void Poller::sleep(double seconds) {
    if (seconds > 0) {
        QThread::usleep((unsigned long)(seconds * 1e6));
    }
}

} // namespace pulsescope
