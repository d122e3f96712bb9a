/*
Beacon — GestureRecognizer
Role: State machine that classifies one pointer session into tap, swipe, long press or drag.
Inputs/Outputs: Takes PointerSamples (start/move/end/cancel); emits gestureRecognized.
Threading: GUI thread only; long-press and tap-debounce timers come from the injected Scheduler.
Integration: Fed by InteractionRouter for every session pull-to-refresh did not claim.
Observability: Logs classified gestures via bLog_Input, dropped samples via bLog_Debug.
Related: GestureRecognizer.cpp, PointerTypes.hpp, InteractionRouter.hpp.
Assumptions: Samples of one session arrive in order; at most one session is active.
*/
#pragma once

#include "config/InteractionConfig.hpp"
#include "interaction/PointerTypes.hpp"
#include "scheduling/Scheduler.hpp"
#include <QObject>
#include <optional>

class GestureRecognizer : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool longPressActive READ isLongPressActive NOTIFY longPressActiveChanged)

public:
    explicit GestureRecognizer(Scheduler& scheduler, const GestureConfig& config = {},
                               QObject* parent = nullptr);
    ~GestureRecognizer() override;

    // heldForMs: how long the contact was already down when the session reached this
    // recognizer (a pull hand-off); the long-press delay is shortened by it.
    void onSampleStart(const PointerSample& sample, qint64 heldForMs = 0);
    void onSampleMove(const PointerSample& sample);
    void onSampleEnd(const PointerSample& sample);
    void onSampleCancel(const PointerSample& sample);

    // Dispatch on sample.phase.
    void handleSample(const PointerSample& sample);

    // Teardown: drops the session, a pending long press and a debounced tap.
    void reset();

    bool hasActiveSession() const { return m_sessionActive; }
    bool isLongPressActive() const { return m_longPressActive; }
    bool isLongPressArmed() const { return m_longPressTask.isArmed(); }
    bool hasPendingTap() const { return m_pendingTapTask.isArmed(); }

    const GestureConfig& config() const { return m_config; }
    void setConfig(const GestureConfig& config) { m_config = config; }

    // Terminal classification of a released session. Tap wins below the click
    // threshold; otherwise the dominant axis must exceed the swipe threshold.
    static std::optional<GestureType> classify(double dx, double dy, qint64 elapsedMs,
                                               const GestureConfig& config);

signals:
    void gestureRecognized(const GestureEvent& event);
    void longPressActiveChanged(bool active);

private:
    void onLongPressTimeout();
    void deliverTap(const GestureEvent& tap);
    void flushPendingTap();
    void endLongPressIfActive(const PointerSample& sample);
    void clearSession();
    void publish(const GestureEvent& event);

    Scheduler& m_scheduler;
    GestureConfig m_config;

    // Session state
    bool m_sessionActive = false;
    PointerSample m_start;
    PointerSample m_last;
    bool m_leftClickZone = false;
    bool m_longPressActive = false;

    ScheduledTask m_longPressTask;
    ScheduledTask m_pendingTapTask;
    std::optional<GestureEvent> m_pendingTap;
};
