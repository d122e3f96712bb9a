#include "adaptive/FrameRateSampler.hpp"
#include "BeaconLogging.hpp"
#include <algorithm>

FrameRateSampler::FrameRateSampler(Scheduler& scheduler, const FrameSamplingConfig& config, QObject* parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_config(config) {
    m_config.tickIntervalMs = std::max<qint64>(1, m_config.tickIntervalMs);
    m_config.windowMs = std::max<qint64>(1, m_config.windowMs);
    m_config.idleGapMs = std::max(m_config.idleGapMs, m_config.tickIntervalMs);
}

FrameRateSampler::~FrameRateSampler() {
    stop();
}

void FrameRateSampler::start() {
    if (m_running) return;

    m_running = true;
    resetWindow();
    scheduleTick();
    bLog_Render("FrameRateSampler started, tick" << m_config.tickIntervalMs << "ms");
}

void FrameRateSampler::stop() {
    if (!m_running) return;

    m_running = false;
    m_tick.cancel();
    bLog_Render("FrameRateSampler stopped at" << m_fps << "fps");
}

void FrameRateSampler::resetWindow() {
    m_windowStart = m_scheduler.nowMs();
    m_lastFrame = m_windowStart;
    m_frames = 0;
    m_windowValid = true;
}

void FrameRateSampler::recordFrame() {
    const qint64 now = m_scheduler.nowMs();
    if (!m_windowValid || now - m_lastFrame > m_config.idleGapMs) {
        if (m_windowValid) {
            bLog_RenderN(10, "FrameRateSampler: idle for" << (now - m_lastFrame) << "ms, restarting window");
        }
        resetWindow();
        return;
    }

    m_lastFrame = now;
    ++m_frames;
    const qint64 elapsed = now - m_windowStart;
    if (elapsed < m_config.windowMs) return;

    m_fps = static_cast<double>(m_frames) * 1000.0 / static_cast<double>(elapsed);
    m_frames = 0;
    m_windowStart = now;

    bLog_Render("📊 FPS:" << m_fps);
    emit fpsChanged(m_fps);
}

void FrameRateSampler::scheduleTick() {
    m_tick = ScheduledTask(&m_scheduler, m_scheduler.schedule(m_config.tickIntervalMs, [this]() {
        if (!m_running) return;
        recordFrame();
        scheduleTick();
    }));
}
