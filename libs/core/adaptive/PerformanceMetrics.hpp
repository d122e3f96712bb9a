#pragma once

#include "scheduling/Scheduler.hpp"
#include <QFuture>
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <deque>
#include <functional>
#include <optional>

struct TimingStats {
    int count = 0;
    double min = 0.0;
    double max = 0.0;
    double average = 0.0;
    double median = 0.0;
    double p95 = 0.0;
};

/**
 * Named operation timings, keeping the most recent MAX_SAMPLES per name.
 * Durations are read from the injected Scheduler clock in milliseconds.
 */
class PerformanceMetrics : public QObject {
    Q_OBJECT

public:
    static constexpr size_t MAX_SAMPLES = 10;

    explicit PerformanceMetrics(const Scheduler& clock, QObject* parent = nullptr);

    // Runs fn and records its duration. An exception from fn propagates and nothing is recorded.
    double measure(const QString& name, const std::function<void()>& fn);

    // Records the time until future finishes. Failed or cancelled futures are not recorded
    // and carry through to the returned future.
    QFuture<double> measureAsync(const QString& name, QFuture<void> future);

    void record(const QString& name, double durationMs);

    std::optional<TimingStats> stats(const QString& name) const;
    QStringList names() const;
    void clear();

    static TimingStats summarize(const std::deque<double>& samples);

signals:
    void measured(const QString& name, double durationMs);

private:
    const Scheduler& m_clock;
    QHash<QString, std::deque<double>> m_samples;
};
