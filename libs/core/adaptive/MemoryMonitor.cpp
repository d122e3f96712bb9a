#include "adaptive/MemoryMonitor.hpp"
#include "adaptive/SystemResources.hpp"
#include "BeaconLogging.hpp"
#include <algorithm>

MemoryMonitor::MemoryMonitor(Scheduler& scheduler, const MemoryMonitorConfig& config, Reader reader, QObject* parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_config(config)
    , m_reader(reader ? std::move(reader) : Reader(&MemoryMonitor::platformReading)) {
    m_config.intervalMs = std::max<qint64>(1, m_config.intervalMs);
}

MemoryMonitor::~MemoryMonitor() {
    stop();
}

MemoryReading MemoryMonitor::platformReading() {
    return { SystemResources::residentMemoryBytes(), SystemResources::totalPhysicalMemoryBytes() };
}

void MemoryMonitor::start() {
    if (m_running) return;
    m_running = true;
    sample();
    scheduleNext();
}

void MemoryMonitor::stop() {
    if (!m_running) return;
    m_running = false;
    m_next.cancel();
}

void MemoryMonitor::sample() {
    m_lastReading = m_reader();
    m_peakBytes = std::max(m_peakBytes, m_lastReading.usedBytes);

    m_usagePercent = m_lastReading.limitBytes > 0
        ? static_cast<double>(m_lastReading.usedBytes) * 100.0 / static_cast<double>(m_lastReading.limitBytes)
        : 0.0;

    bLog_Debug("Memory:" << SystemResources::formatMemorySize(m_lastReading.usedBytes)
               << "of" << SystemResources::formatMemorySize(m_lastReading.limitBytes)
               << "(" << m_usagePercent << "% ) peak" << SystemResources::formatMemorySize(m_peakBytes));
    emit memoryUsageChanged(m_usagePercent);

    const bool high = m_usagePercent > m_config.highUsagePercent;
    if (high != m_highUsage) {
        m_highUsage = high;
        if (high) {
            bLog_Warning("⚠️ High memory usage:" << m_usagePercent << "%");
        }
        emit highMemoryUsageChanged(high);
    }
}

void MemoryMonitor::scheduleNext() {
    m_next = ScheduledTask(&m_scheduler, m_scheduler.schedule(m_config.intervalMs, [this]() {
        if (!m_running) return;
        sample();
        scheduleNext();
    }));
}
