#pragma once

#include <QElapsedTimer>

#include <functional>

namespace pulsescope {

// Bounded wait shared by every blocking operation: calls `ready` until it reports
// true or the timeout runs out, sleeping between calls with a doubling interval.
// `ready` is always called at least once.
class Poller {
public:
    explicit Poller(double timeoutSeconds, int intervalMs = 1, int maxIntervalMs = 32);

    bool wait(const std::function<bool()>& ready);

    qint64 elapsedMs() const {
        return timer.elapsed();
    }

    double remainingSeconds() const;

    static void sleep(double seconds);

private:
    QElapsedTimer timer;
    qint64 timeoutMs;
    int intervalMs;
    int maxIntervalMs;
};

} // namespace pulsescope
