#include "interaction/InteractionRouter.hpp"
#include "interaction/GestureRecognizer.hpp"
#include "interaction/PullToRefreshController.hpp"
#include "interaction/RippleEmitter.hpp"
#include "BeaconLogging.hpp"
#include <cmath>

InteractionRouter::InteractionRouter(GestureRecognizer& recognizer, QObject* parent)
    : QObject(parent)
    , m_recognizer(recognizer) {
    connect(&m_recognizer, &GestureRecognizer::gestureRecognized,
            this, &InteractionRouter::onRecognizerGesture);
}

void InteractionRouter::setPullToRefresh(PullToRefreshController* pull) {
    if (m_pull) {
        disconnect(m_pull, nullptr, this, nullptr);
    }
    m_pull = pull;
    if (m_pull) {
        connect(m_pull, &PullToRefreshController::gestureRecognized,
                this, &InteractionRouter::gestureRecognized);
    }
}

void InteractionRouter::handleSample(const PointerSample& sample) {
    if (m_owner != Owner::None && sample.pointerId != m_sessionStart.pointerId) {
        bLog_Debug("InteractionRouter: ignoring secondary contact" << sample.pointerId);
        return;
    }

    switch (sample.phase) {
        case PointerPhase::Start:  onStart(sample); break;
        case PointerPhase::Move:   onMove(sample); break;
        case PointerPhase::End:    onEnd(sample); break;
        case PointerPhase::Cancel: onCancel(sample); break;
    }
}

void InteractionRouter::reset() {
    if (m_owner == Owner::PullToRefresh && m_pull) {
        m_pull->onSampleCancel(m_sessionStart);
    }
    m_recognizer.reset();
    m_owner = Owner::None;
    m_pullCommitted = false;
}

void InteractionRouter::onStart(const PointerSample& sample) {
    if (m_owner == Owner::PullToRefresh && m_pull) {
        bLog_Debug("InteractionRouter: new start while pull session open, dropping it");
        m_pull->onSampleCancel(sample);
    }

    m_sessionStart = sample;
    m_pullCommitted = false;

    if (m_pull && m_pull->tryClaim(sample, currentScrollOffset())) {
        m_owner = Owner::PullToRefresh;
    } else {
        m_owner = Owner::Gesture;
    }
    // The recognizer also follows a provisional pull claim.
    m_recognizer.onSampleStart(sample);
    emit sessionClaimed(m_owner);
}

void InteractionRouter::onMove(const PointerSample& sample) {
    switch (m_owner) {
        case Owner::None:
            bLog_Debug("InteractionRouter: dropping move without start");
            return;
        case Owner::PullToRefresh:
            if (!m_pullCommitted) {
                onProvisionalPullMove(sample);
                return;
            }
            if (m_pull && m_pull->onSampleMove(sample, currentScrollOffset())) {
                return;
            }
            handOffToRecognizer(sample);
            m_recognizer.onSampleMove(sample);
            return;
        case Owner::Gesture:
            m_recognizer.onSampleMove(sample);
            return;
    }
}

void InteractionRouter::onProvisionalPullMove(const PointerSample& sample) {
    if (!m_pull || !m_pull->onSampleMove(sample, currentScrollOffset())) {
        releasePullToRecognizer();
        m_recognizer.onSampleMove(sample);
        return;
    }

    const double clickThreshold = m_recognizer.config().clickThreshold;
    const double dx = sample.x - m_sessionStart.x;
    const double dy = sample.y - m_sessionStart.y;

    if (dy >= clickThreshold) {
        bLog_Debug("InteractionRouter: pull committed at dy" << dy);
        m_pullCommitted = true;
        m_recognizer.onSampleCancel(sample);
        return;
    }
    if (std::abs(dx) >= clickThreshold) {
        m_pull->onSampleCancel(sample);
        releasePullToRecognizer();
    }
    m_recognizer.onSampleMove(sample);
}

void InteractionRouter::onEnd(const PointerSample& sample) {
    const Owner owner = m_owner;
    const bool committed = m_pullCommitted;
    m_owner = Owner::None;
    m_pullCommitted = false;

    switch (owner) {
        case Owner::None:
            bLog_Debug("InteractionRouter: dropping end without start");
            return;
        case Owner::PullToRefresh:
            if (committed) {
                if (m_pull) m_pull->onSampleEnd(sample);
                return;
            }
            // Released inside the click zone: a tap or press, not a pull.
            if (m_pull) m_pull->onSampleCancel(sample);
            m_recognizer.onSampleEnd(sample);
            return;
        case Owner::Gesture:
            m_recognizer.onSampleEnd(sample);
            return;
    }
}

void InteractionRouter::onCancel(const PointerSample& sample) {
    const Owner owner = m_owner;
    const bool committed = m_pullCommitted;
    m_owner = Owner::None;
    m_pullCommitted = false;

    switch (owner) {
        case Owner::PullToRefresh:
            if (m_pull) m_pull->onSampleCancel(sample);
            if (!committed) m_recognizer.onSampleCancel(sample);
            return;
        case Owner::None:
        case Owner::Gesture:
            // Without a session this withdraws a debounced tap.
            m_recognizer.onSampleCancel(sample);
            return;
    }
}

void InteractionRouter::releasePullToRecognizer() {
    bLog_Debug("InteractionRouter: provisional pull released to gesture recognizer");
    m_owner = Owner::Gesture;
    m_pullCommitted = false;
    emit sessionClaimed(m_owner);
}

void InteractionRouter::handOffToRecognizer(const PointerSample& at) {
    bLog_Debug("InteractionRouter: pull released, handing session to gesture recognizer");
    m_owner = Owner::Gesture;
    m_pullCommitted = false;
    // Time already held during the pull counts toward the long press.
    m_recognizer.onSampleStart(m_sessionStart, at.t - m_sessionStart.t);
    emit sessionClaimed(m_owner);
}

double InteractionRouter::currentScrollOffset() const {
    return m_scrollOffset ? m_scrollOffset() : 0.0;
}

void InteractionRouter::onRecognizerGesture(const GestureEvent& event) {
    if (event.type == GestureType::LongPressStart && m_owner == Owner::PullToRefresh && !m_pullCommitted) {
        if (m_pull) m_pull->onSampleCancel(m_sessionStart);
        releasePullToRecognizer();
    }
    if (m_ripples && !m_rippleTarget.isNull()
        && (event.type == GestureType::Tap || event.type == GestureType::LongPressStart)) {
        m_ripples->createRipple(event.position, m_rippleTarget);
    }
    emit gestureRecognized(event);
}
