#include "RateMeter.hpp"
#include <algorithm>

RateMeter::RateMeter(qint64 windowMs)
    : m_windowMs(windowMs) {}

void RateMeter::start(qint64 nowMs) {
    m_samples.clear();
    m_startMs = nowMs;
}

void RateMeter::prune(qint64 nowMs) {
    while (!m_samples.empty() && m_samples.front().atMs <= nowMs - m_windowMs) {
        m_samples.pop_front();
    }
}

void RateMeter::addSample(qint64 nowMs, qint64 bytes) {
    m_samples.push_back({nowMs, bytes});
    prune(nowMs);
}

double RateMeter::bytesPerSecond(qint64 nowMs) const {
    qint64 bytes = 0;
    for (const Sample& s : m_samples) {
        if (s.atMs > nowMs - m_windowMs) bytes += s.bytes;
    }
    const qint64 span = std::max<qint64>(1, std::min(m_windowMs, nowMs - m_startMs));
    return double(bytes) * 1000.0 / double(span);
}

double RateMeter::etaSeconds(qint64 remainingBytes, double speed) {
    if (remainingBytes <= 0) return 0;
    return double(remainingBytes) / std::max(speed, MinSpeed);
}
