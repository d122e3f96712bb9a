#pragma once

#include "config/InteractionConfig.hpp"
#include "scheduling/Scheduler.hpp"
#include <QObject>
#include <functional>

struct MemoryReading {
    size_t usedBytes = 0;
    size_t limitBytes = 0;
};

/**
 * Periodic process memory sampling. usagePercent is resident set over total
 * physical memory; readings with an unknown limit leave the percentage at 0.
 */
class MemoryMonitor : public QObject {
    Q_OBJECT
    Q_PROPERTY(double usagePercent READ usagePercent NOTIFY memoryUsageChanged)
    Q_PROPERTY(bool highMemoryUsage READ isHighMemoryUsage NOTIFY highMemoryUsageChanged)

public:
    using Reader = std::function<MemoryReading()>;

    explicit MemoryMonitor(Scheduler& scheduler, const MemoryMonitorConfig& config = {},
                           Reader reader = {}, QObject* parent = nullptr);
    ~MemoryMonitor() override;

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Takes one reading now; also called on every scheduled tick.
    void sample();

    size_t usedBytes() const { return m_lastReading.usedBytes; }
    size_t limitBytes() const { return m_lastReading.limitBytes; }
    size_t peakBytes() const { return m_peakBytes; }
    double usagePercent() const { return m_usagePercent; }
    bool isHighMemoryUsage() const { return m_highUsage; }

    static MemoryReading platformReading();

signals:
    void memoryUsageChanged(double usagePercent);
    void highMemoryUsageChanged(bool high);

private:
    void scheduleNext();

    Scheduler& m_scheduler;
    MemoryMonitorConfig m_config;
    Reader m_reader;
    ScheduledTask m_next;

    MemoryReading m_lastReading;
    size_t m_peakBytes = 0;
    double m_usagePercent = 0.0;
    bool m_highUsage = false;
    bool m_running = false;
};
