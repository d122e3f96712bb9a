#include "adaptive/PerformanceMetrics.hpp"
#include "BeaconLogging.hpp"
#include <algorithm>
#include <numeric>
#include <vector>

PerformanceMetrics::PerformanceMetrics(const Scheduler& clock, QObject* parent)
    : QObject(parent)
    , m_clock(clock) {
}

double PerformanceMetrics::measure(const QString& name, const std::function<void()>& fn) {
    const qint64 started = m_clock.nowMs();
    fn();
    const double duration = static_cast<double>(m_clock.nowMs() - started);
    record(name, duration);
    return duration;
}

QFuture<double> PerformanceMetrics::measureAsync(const QString& name, QFuture<void> future) {
    const qint64 started = m_clock.nowMs();
    return future.then(this, [this, name, started]() {
        const double duration = static_cast<double>(m_clock.nowMs() - started);
        record(name, duration);
        return duration;
    });
}

void PerformanceMetrics::record(const QString& name, double durationMs) {
    std::deque<double>& samples = m_samples[name];
    samples.push_back(durationMs);
    while (samples.size() > MAX_SAMPLES) {
        samples.pop_front();
    }

    bLog_DebugN(20, "⏱️" << name << durationMs << "ms");
    emit measured(name, durationMs);
}

std::optional<TimingStats> PerformanceMetrics::stats(const QString& name) const {
    const auto it = m_samples.constFind(name);
    if (it == m_samples.constEnd() || it->empty()) return std::nullopt;
    return summarize(*it);
}

QStringList PerformanceMetrics::names() const {
    QStringList keys = m_samples.keys();
    keys.sort();
    return keys;
}

void PerformanceMetrics::clear() {
    m_samples.clear();
}

TimingStats PerformanceMetrics::summarize(const std::deque<double>& samples) {
    TimingStats stats;
    if (samples.empty()) return stats;

    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());

    const size_t n = sorted.size();
    stats.count = static_cast<int>(n);
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.average = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);
    stats.median = sorted[n / 2];
    stats.p95 = sorted[static_cast<size_t>(static_cast<double>(n) * 0.95)];
    return stats;
}
