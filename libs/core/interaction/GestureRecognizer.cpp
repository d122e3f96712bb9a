/*
Beacon — GestureRecognizer
Role: Implements tap/swipe classification, the long-press timer and drag delta streaming.
Threading: All code runs on the GUI thread.
Related: GestureRecognizer.hpp.
Assumptions: Long press and tap/swipe are mutually exclusive within one session.
*/
#include "interaction/GestureRecognizer.hpp"
#include "BeaconLogging.hpp"
#include <QtMath>
#include <algorithm>
#include <cmath>

GestureRecognizer::GestureRecognizer(Scheduler& scheduler, const GestureConfig& config, QObject* parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_config(config) {
}

GestureRecognizer::~GestureRecognizer() {
    // ScheduledTask members cancel their timers; nothing is emitted from here.
    m_pendingTap.reset();
}

void GestureRecognizer::handleSample(const PointerSample& sample) {
    switch (sample.phase) {
        case PointerPhase::Start:  onSampleStart(sample); break;
        case PointerPhase::Move:   onSampleMove(sample); break;
        case PointerPhase::End:    onSampleEnd(sample); break;
        case PointerPhase::Cancel: onSampleCancel(sample); break;
    }
}

void GestureRecognizer::onSampleStart(const PointerSample& sample, qint64 heldForMs) {
    if (m_sessionActive) {
        bLog_Debug("GestureRecognizer: start while session active, restarting session");
        endLongPressIfActive(m_last);
        clearSession();
    }

    m_sessionActive = true;
    m_start = sample;
    m_last = sample;
    m_leftClickZone = false;

    const qint64 remaining = m_config.longPressThresholdMs - std::max<qint64>(heldForMs, 0);
    if (m_config.longPressThresholdMs > 0 && remaining > 0) {
        m_longPressTask = ScheduledTask(&m_scheduler,
            m_scheduler.schedule(remaining, [this]() { onLongPressTimeout(); }));
    }
}

void GestureRecognizer::onSampleMove(const PointerSample& sample) {
    if (!m_sessionActive) {
        bLog_Debug("GestureRecognizer: dropping move without start");
        return;
    }

    const double dx = sample.x - m_start.x;
    const double dy = sample.y - m_start.y;

    if (!m_longPressActive && m_longPressTask.isArmed()
        && std::hypot(dx, dy) > m_config.longPressMoveTolerance) {
        m_longPressTask.cancel();
    }

    if (std::max(std::abs(dx), std::abs(dy)) >= m_config.clickThreshold) {
        m_leftClickZone = true;
    }

    if (m_config.dragTracking && m_leftClickZone && !m_longPressActive) {
        const double stepDx = sample.x - m_last.x;
        if (stepDx != 0.0) {
            publish(GestureEvent::drag(stepDx, sample));
        }
    }

    m_last = sample;
}

void GestureRecognizer::onSampleEnd(const PointerSample& sample) {
    if (!m_sessionActive) {
        bLog_Debug("GestureRecognizer: dropping end without start");
        return;
    }

    m_longPressTask.cancel();

    if (m_longPressActive) {
        endLongPressIfActive(sample);
        clearSession();
        return;
    }

    const double dx = sample.x - m_start.x;
    const double dy = sample.y - m_start.y;
    const qint64 elapsed = sample.t - m_start.t;
    const auto type = classify(dx, dy, elapsed, m_config);

    clearSession();

    if (!type) {
        bLog_Debug("GestureRecognizer: no gesture for dx" << dx << "dy" << dy << "elapsed" << elapsed);
        return;
    }

    const GestureEvent event = GestureEvent::make(*type, sample);
    if (*type == GestureType::Tap) {
        deliverTap(event);
    } else {
        publish(event);
    }
}

void GestureRecognizer::onSampleCancel(const PointerSample& sample) {
    if (!m_sessionActive) {
        // Pointer left the surface after release: the debounced tap is withdrawn.
        if (m_pendingTapTask.isArmed()) {
            bLog_Input("Tap cancelled before debounce elapsed");
            m_pendingTapTask.cancel();
            m_pendingTap.reset();
        }
        return;
    }

    m_longPressTask.cancel();
    endLongPressIfActive(sample);
    clearSession();
}

void GestureRecognizer::reset() {
    m_longPressTask.cancel();
    m_pendingTapTask.cancel();
    m_pendingTap.reset();
    if (m_longPressActive) {
        m_longPressActive = false;
        emit longPressActiveChanged(false);
    }
    clearSession();
}

std::optional<GestureType> GestureRecognizer::classify(double dx, double dy, qint64 elapsedMs,
                                                       const GestureConfig& config) {
    const double absDx = std::abs(dx);
    const double absDy = std::abs(dy);

    if (std::max(absDx, absDy) < config.clickThreshold && elapsedMs <= config.tapTimeoutMs) {
        return GestureType::Tap;
    }

    if (absDx > absDy && absDx > config.swipeThreshold) {
        return dx > 0 ? GestureType::SwipeRight : GestureType::SwipeLeft;
    }
    if (absDy > config.swipeThreshold) {
        return dy > 0 ? GestureType::SwipeDown : GestureType::SwipeUp;
    }
    return std::nullopt;
}

void GestureRecognizer::onLongPressTimeout() {
    if (!m_sessionActive || m_longPressActive) return;

    m_longPressActive = true;
    emit longPressActiveChanged(true);

    GestureEvent event = GestureEvent::make(GestureType::LongPressStart, m_last);
    event.timestamp = m_start.t + m_config.longPressThresholdMs;
    publish(event);
}

void GestureRecognizer::deliverTap(const GestureEvent& tap) {
    if (m_config.tapDebounceMs <= 0) {
        publish(tap);
        return;
    }

    // A second tap inside the debounce window releases the first one now.
    flushPendingTap();

    m_pendingTap = tap;
    m_pendingTapTask = ScheduledTask(&m_scheduler,
        m_scheduler.schedule(m_config.tapDebounceMs, [this]() { flushPendingTap(); }));
}

void GestureRecognizer::flushPendingTap() {
    m_pendingTapTask.cancel();
    if (!m_pendingTap) return;

    const GestureEvent tap = *m_pendingTap;
    m_pendingTap.reset();
    publish(tap);
}

void GestureRecognizer::endLongPressIfActive(const PointerSample& sample) {
    if (!m_longPressActive) return;

    m_longPressActive = false;
    emit longPressActiveChanged(false);
    publish(GestureEvent::make(GestureType::LongPressEnd, sample));
}

void GestureRecognizer::clearSession() {
    m_sessionActive = false;
    m_start = PointerSample{};
    m_last = PointerSample{};
    m_leftClickZone = false;
    m_longPressTask.cancel();
}

void GestureRecognizer::publish(const GestureEvent& event) {
    if (event.type == GestureType::DragDelta) {
        bLog_DebugN(30, "Drag delta" << event.dragDx);
    } else {
        bLog_Input("Gesture" << toString(event.type) << "at" << event.position);
    }
    emit gestureRecognized(event);
}
