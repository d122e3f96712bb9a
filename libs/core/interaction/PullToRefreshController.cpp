#include "interaction/PullToRefreshController.hpp"
#include "BeaconLogging.hpp"
#include <algorithm>
#include <exception>

PullToRefreshController::PullToRefreshController(const PullToRefreshConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config) {
}

bool PullToRefreshController::tryClaim(const PointerSample& start, double scrollTop) {
    if (m_refreshing) {
        bLog_Input("Pull ignored: refresh in progress");
        return false;
    }
    if (scrollTop > 0.0) {
        return false;
    }

    m_claimed = true;
    m_hasPulled = false;
    m_startY = start.y;
    m_distance = 0.0;
    publishState();
    return true;
}

bool PullToRefreshController::onSampleMove(const PointerSample& sample, double scrollTop) {
    if (!m_claimed) return false;

    const double deltaY = sample.y - m_startY;
    if (deltaY <= 0.0 || scrollTop > 0.0) {
        releaseClaim(sample, true);
        return false;
    }

    const double distance = dampedDistance(deltaY, m_config);
    if (distance > 0.0) m_hasPulled = true;

    if (distance != m_distance) {
        m_distance = distance;
        publishState();
    }
    return true;
}

PullToRefreshController::EndOutcome PullToRefreshController::onSampleEnd(const PointerSample& sample) {
    if (!m_claimed) return EndOutcome::NotClaimed;

    if (canRefresh() && !m_refreshing) {
        startRefresh(sample);
        return EndOutcome::Refreshed;
    }

    releaseClaim(sample, false);
    return EndOutcome::Reset;
}

void PullToRefreshController::onSampleCancel(const PointerSample& sample) {
    if (!m_claimed) return;
    releaseClaim(sample, false);
}

PullState PullToRefreshController::state() const {
    return PullState{m_distance, m_claimed, m_refreshing, canRefresh()};
}

double PullToRefreshController::dampedDistance(double deltaY, const PullToRefreshConfig& config) {
    return std::clamp(deltaY * config.damping, 0.0, std::max(0.0, config.maxDistance));
}

void PullToRefreshController::startRefresh(const PointerSample& sample) {
    m_refreshing = true;
    m_claimed = false;
    m_hasPulled = false;
    m_distance = 0.0;
    publishState();

    bLog_Input("🔄 Pull-to-refresh triggered");
    emit gestureRecognized(GestureEvent::make(GestureType::RefreshTriggered, sample));
    emit refreshStarted();

    if (!m_refresh) {
        bLog_Debug("PullToRefreshController: no refresh function set, completing immediately");
        finishRefresh(true);
        return;
    }

    QFuture<void> future;
    try {
        future = m_refresh();
    } catch (const std::exception& e) {
        bLog_Warning("Refresh failed to start:" << e.what());
        finishRefresh(false);
        return;
    }

    // Continuations are delivered on this object's thread and dropped if it is destroyed
    // first. A default or cancelled future lands in onCanceled, so the refreshing flag
    // always clears.
    future.then(this, [this]() {
              finishRefresh(true);
          })
          .onFailed(this, [this]() {
              finishRefresh(false);
          })
          .onCanceled(this, [this]() {
              finishRefresh(false);
          });
}

void PullToRefreshController::finishRefresh(bool succeeded) {
    if (!m_refreshing) return;

    m_refreshing = false;
    publishState();

    if (succeeded) {
        bLog_Input("Refresh completed");
    } else {
        bLog_Warning("Refresh did not complete successfully");
    }
    emit refreshFinished(succeeded);
}

void PullToRefreshController::releaseClaim(const PointerSample& at, bool notify) {
    m_claimed = false;
    m_hasPulled = false;
    m_distance = 0.0;
    publishState();

    if (notify) {
        bLog_Debug("Pull claim released at y" << at.y);
        emit claimReleased(at);
    }
}

void PullToRefreshController::publishState() {
    emit pullStateChanged(state());
}
