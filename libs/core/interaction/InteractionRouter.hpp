/*
Beacon — InteractionRouter
Role: Claim arbiter for pointer sessions. Each session belongs to exactly one recognizer:
      pull-to-refresh when it claims the start, otherwise the generic gesture recognizer.
      A pull claim stays provisional until the finger travels past the click threshold;
      until then the gesture recognizer tracks the session too, so taps and long presses
      at the top of the region still resolve.
Inputs/Outputs: Takes the unified PointerSample stream; re-emits every recognized gesture
      on one gestureRecognized signal and spawns ripples for taps and long presses.
Threading: GUI thread only.
Integration: Driven by InteractionSurface (gui) or by beacon_replay.
Observability: bLog_Debug for hand-offs and dropped samples.
Related: InteractionRouter.cpp, GestureRecognizer.hpp, PullToRefreshController.hpp, RippleEmitter.hpp.
Assumptions: One contact point at a time; extra contacts are ignored while a session is open.
*/
#pragma once

#include "interaction/PointerTypes.hpp"
#include <QObject>
#include <QPointer>
#include <QRectF>
#include <functional>

class GestureRecognizer;
class PullToRefreshController;
class RippleEmitter;

class InteractionRouter : public QObject {
    Q_OBJECT

public:
    enum class Owner {
        None,
        PullToRefresh,
        Gesture
    };
    Q_ENUM(Owner)

    explicit InteractionRouter(GestureRecognizer& recognizer, QObject* parent = nullptr);
    ~InteractionRouter() override = default;

    void setPullToRefresh(PullToRefreshController* pull);
    void setRippleEmitter(RippleEmitter* ripples) { m_ripples = ripples; }

    // Current scroll offset of the region pull-to-refresh watches.
    void setScrollOffsetProvider(std::function<double()> provider) { m_scrollOffset = std::move(provider); }

    // Bounds of the pressed target; ripples are positioned relative to it.
    void setRippleTarget(const QRectF& bounds) { m_rippleTarget = bounds; }

    void handleSample(const PointerSample& sample);

    // Teardown: cancels the open session everywhere without emitting terminal gestures.
    void reset();

    Owner sessionOwner() const { return m_owner; }

    // True once a pull claim left the click zone downward and the recognizer was dropped.
    bool isPullCommitted() const { return m_owner == Owner::PullToRefresh && m_pullCommitted; }

signals:
    void gestureRecognized(const GestureEvent& event);
    void sessionClaimed(InteractionRouter::Owner owner);

private slots:
    void onRecognizerGesture(const GestureEvent& event);

private:
    void onStart(const PointerSample& sample);
    void onMove(const PointerSample& sample);
    void onEnd(const PointerSample& sample);
    void onCancel(const PointerSample& sample);
    void onProvisionalPullMove(const PointerSample& sample);
    void releasePullToRecognizer();
    void handOffToRecognizer(const PointerSample& at);
    double currentScrollOffset() const;

    GestureRecognizer& m_recognizer;
    QPointer<PullToRefreshController> m_pull;
    QPointer<RippleEmitter> m_ripples;
    std::function<double()> m_scrollOffset;
    QRectF m_rippleTarget;

    Owner m_owner = Owner::None;
    bool m_pullCommitted = false;
    PointerSample m_sessionStart;
};
