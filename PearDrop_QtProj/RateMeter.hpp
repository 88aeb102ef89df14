#pragma once
#include <QtGlobal>
#include <deque>

// Sliding-window throughput estimate. Times are caller-supplied milliseconds
// from any monotonic clock.
class RateMeter {
public:
    static constexpr qint64 DefaultWindowMs = 2000;
    static constexpr double MinSpeed = 1.0;  // bytes/s floor used for ETA

    explicit RateMeter(qint64 windowMs = DefaultWindowMs);

    void start(qint64 nowMs);
    void addSample(qint64 nowMs, qint64 bytes);

    // Average over the last window (or since start, if shorter).
    double bytesPerSecond(qint64 nowMs) const;

    static double etaSeconds(qint64 remainingBytes, double speed);

private:
    struct Sample {
        qint64 atMs;
        qint64 bytes;
    };

    void prune(qint64 nowMs);

    std::deque<Sample> m_samples;
    qint64 m_windowMs;
    qint64 m_startMs = 0;
};
