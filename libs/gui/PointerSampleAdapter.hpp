/*
Beacon — PointerSampleAdapter
Role: Boundary between Qt input events and the interaction core. Mouse, touch and
      leave/ungrab events all become PointerSamples, so nothing downstream branches on
      the input source.
Inputs/Outputs: QEvent* in; zero or more PointerSamples out.
Threading: GUI thread only.
Integration: Used by InteractionSurface; samples are stamped with the scheduler clock so
      they share a time base with the core's timers.
Assumptions: Only the left mouse button drives sessions. Mouse events synthesized from a
      touchscreen are dropped because the touch events already produced samples.
*/
#pragma once

#include "interaction/PointerTypes.hpp"
#include <QPointF>
#include <optional>
#include <vector>

class QEvent;
class QMouseEvent;
class QTouchEvent;
class Scheduler;

class PointerSampleAdapter {
public:
    explicit PointerSampleAdapter(const Scheduler& clock);

    // Empty when the event carries nothing for the core.
    std::vector<PointerSample> translate(QEvent* event);

    std::optional<PointerSample> fromMouseEvent(QMouseEvent* event);
    std::vector<PointerSample> fromTouchEvent(QTouchEvent* event);

    // Leave, ungrab and touch-cancel all end the open session as Cancel.
    std::vector<PointerSample> cancelActive();

    bool hasActiveContact() const { return m_mouseDown || !m_activeTouches.empty(); }

private:
    PointerSample makeSample(const QPointF& position, PointerPhase phase, int pointerId) const;

    const Scheduler& m_clock;

    bool m_mouseDown = false;
    QPointF m_lastMousePosition;

    struct ActiveTouch {
        int id;
        QPointF position;
    };
    std::vector<ActiveTouch> m_activeTouches;
};
