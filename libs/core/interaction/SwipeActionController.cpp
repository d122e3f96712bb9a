#include "interaction/SwipeActionController.hpp"
#include "BeaconLogging.hpp"
#include <algorithm>

SwipeActionController::SwipeActionController(const SwipeActionConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config) {
}

void SwipeActionController::onSampleStart(const PointerSample& sample) {
    m_swiping = true;
    m_startX = sample.x;
    resetOffset();
}

void SwipeActionController::onSampleMove(const PointerSample& sample) {
    if (!m_swiping) return;

    const double maxOffset = std::max(0.0, m_config.maxOffset);
    const double limited = std::clamp(sample.x - m_startX, -maxOffset, maxOffset);
    const double step = limited - m_offset;
    if (step == 0.0) return;

    m_offset = limited;
    emit offsetChanged(m_offset);
    emit gestureRecognized(GestureEvent::drag(step, sample));
}

void SwipeActionController::onSampleEnd(const PointerSample& sample) {
    if (!m_swiping) {
        bLog_Debug("SwipeActionController: dropping end without start");
        return;
    }
    m_swiping = false;

    if (m_offset > m_config.actionThreshold) {
        bLog_Input("Swipe action: left action at x" << sample.x);
        emit leftActionTriggered();
    } else if (m_offset < -m_config.actionThreshold) {
        bLog_Input("Swipe action: right action at x" << sample.x);
        emit rightActionTriggered();
    }

    resetOffset();
}

void SwipeActionController::onSampleCancel(const PointerSample&) {
    m_swiping = false;
    resetOffset();
}

void SwipeActionController::resetOffset() {
    if (m_offset == 0.0) return;
    m_offset = 0.0;
    emit offsetChanged(m_offset);
}
