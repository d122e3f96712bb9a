#pragma once

#include "config/InteractionConfig.hpp"
#include "scheduling/Scheduler.hpp"
#include <QObject>

/**
 * Rolling FPS estimate over fixed windows.
 *
 * Either drive it with start(), which ticks itself on the scheduler at the
 * configured interval, or connect a real frame signal to recordFrame().
 * fps() starts at 60 and is updated once per elapsed window. Qt Quick only renders
 * when the scene changes, so a frame that follows an idle pause longer than
 * idleGapMs opens a new window instead of being measured against the pause.
 */
class FrameRateSampler : public QObject {
    Q_OBJECT
    Q_PROPERTY(double fps READ fps NOTIFY fpsChanged)

public:
    static constexpr double INITIAL_FPS = 60.0;

    explicit FrameRateSampler(Scheduler& scheduler, const FrameSamplingConfig& config = {},
                              QObject* parent = nullptr);
    ~FrameRateSampler() override;

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Starts a new measurement window at the current scheduler time.
    void resetWindow();

    double fps() const { return m_fps; }
    int framesInWindow() const { return m_frames; }

public slots:
    void recordFrame();

signals:
    void fpsChanged(double fps);

private:
    void scheduleTick();

    Scheduler& m_scheduler;
    FrameSamplingConfig m_config;
    ScheduledTask m_tick;

    double m_fps = INITIAL_FPS;
    int m_frames = 0;
    qint64 m_windowStart = 0;
    qint64 m_lastFrame = 0;
    bool m_windowValid = false;
    bool m_running = false;
};
