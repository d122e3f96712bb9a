/*
Beacon — SwipeActionController
Role: Horizontal swipe-to-reveal affordance for list rows (e.g. stream cards with
      delete / select actions behind them).
Inputs/Outputs: Takes PointerSamples; emits DragDelta events while the row follows the
      pointer and leftActionTriggered / rightActionTriggered on release.
Threading: GUI thread only.
Related: SwipeActionController.cpp, PointerTypes.hpp.
*/
#pragma once

#include "config/InteractionConfig.hpp"
#include "interaction/PointerTypes.hpp"
#include <QObject>

class SwipeActionController : public QObject {
    Q_OBJECT
    Q_PROPERTY(double offset READ offset NOTIFY offsetChanged)

public:
    explicit SwipeActionController(const SwipeActionConfig& config = {}, QObject* parent = nullptr);

    void onSampleStart(const PointerSample& sample);
    void onSampleMove(const PointerSample& sample);
    void onSampleEnd(const PointerSample& sample);
    void onSampleCancel(const PointerSample& sample);

    double offset() const { return m_offset; }
    bool isSwiping() const { return m_swiping; }

signals:
    void gestureRecognized(const GestureEvent& event);
    void offsetChanged(double offset);
    void leftActionTriggered();     // Row dragged right, revealing the left action
    void rightActionTriggered();    // Row dragged left, revealing the right action

private:
    void resetOffset();

    SwipeActionConfig m_config;
    bool m_swiping = false;
    double m_startX = 0.0;
    double m_offset = 0.0;
};
