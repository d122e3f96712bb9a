/*
Beacon — PullToRefreshController
Role: Claims sessions that start at the top of a scrollable region and turns downward travel
      into a damped pull distance and, past the threshold, an async refresh.
Inputs/Outputs: Takes PointerSamples plus the region's scroll offset; emits pullStateChanged,
      gestureRecognized(RefreshTriggered), refreshStarted/refreshFinished.
Threading: GUI thread. The refresh QFuture may be fulfilled on any thread; completion is
      handled on this object's thread.
Integration: InteractionRouter offers every new session here first.
Observability: bLog_Input for claims, releases and refresh lifecycle; bLog_Warning on failure.
Related: PullToRefreshController.cpp, InteractionRouter.hpp.
Assumptions: refresh() is cheap to call and reports completion through its future.
*/
#pragma once

#include "config/InteractionConfig.hpp"
#include "interaction/PointerTypes.hpp"
#include <QFuture>
#include <QObject>
#include <functional>

struct PullState {
    double distance = 0.0;
    bool isPulling = false;
    bool isRefreshing = false;
    bool canRefresh = false;
};

Q_DECLARE_METATYPE(PullState)

class PullToRefreshController : public QObject {
    Q_OBJECT
    Q_PROPERTY(double pullDistance READ pullDistance NOTIFY pullStateChanged)
    Q_PROPERTY(bool pulling READ isPulling NOTIFY pullStateChanged)
    Q_PROPERTY(bool refreshing READ isRefreshing NOTIFY pullStateChanged)
    Q_PROPERTY(bool canRefresh READ canRefresh NOTIFY pullStateChanged)

public:
    using RefreshFunction = std::function<QFuture<void>()>;

    enum class EndOutcome {
        NotClaimed,
        Reset,          // Released below the threshold
        Refreshed       // Refresh was started
    };

    explicit PullToRefreshController(const PullToRefreshConfig& config = {}, QObject* parent = nullptr);
    ~PullToRefreshController() override = default;

    void setRefreshFunction(RefreshFunction refresh) { m_refresh = std::move(refresh); }

    // Claims the session when the region rests at the top and no refresh is running.
    bool tryClaim(const PointerSample& start, double scrollTop);

    // Returns false once the claim is released (upward travel or region scrolled).
    bool onSampleMove(const PointerSample& sample, double scrollTop);
    EndOutcome onSampleEnd(const PointerSample& sample);
    void onSampleCancel(const PointerSample& sample);

    PullState state() const;
    double pullDistance() const { return m_distance; }
    bool isPulling() const { return m_claimed; }
    bool isRefreshing() const { return m_refreshing; }
    bool canRefresh() const { return m_distance >= m_config.threshold; }
    bool isClaimed() const { return m_claimed; }

    // True once the current claim produced a positive pull distance.
    bool hasPulled() const { return m_hasPulled; }

    const PullToRefreshConfig& config() const { return m_config; }

    // distance = clamp((currentY - startY) * damping, 0, maxDistance)
    static double dampedDistance(double deltaY, const PullToRefreshConfig& config);

signals:
    void pullStateChanged(const PullState& state);
    void gestureRecognized(const GestureEvent& event);
    void claimReleased(const PointerSample& at);
    void refreshStarted();
    void refreshFinished(bool succeeded);

private:
    void startRefresh(const PointerSample& sample);
    void finishRefresh(bool succeeded);
    void releaseClaim(const PointerSample& at, bool notify);
    void publishState();

    PullToRefreshConfig m_config;
    RefreshFunction m_refresh;

    bool m_claimed = false;
    bool m_hasPulled = false;
    bool m_refreshing = false;
    double m_startY = 0.0;
    double m_distance = 0.0;
};
