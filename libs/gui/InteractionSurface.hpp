/*
Beacon — InteractionSurface
Role: QQuickItem that turns the mouse and touch input it receives into PointerSamples and
      feeds them to an InteractionRouter.
Inputs/Outputs: Qt Quick mouse/touch/hover events in; router samples out; recognized gestures
      re-emitted to QML as gesture(type, x, y).
Threading: GUI thread. frameSwapped arrives from the render thread and is queued to the
      frame sampler.
Integration: Registered as Beacon.Interaction/InteractionSurface. The app attaches the router,
      the scheduler used as clock and, optionally, the FrameRateSampler.
Observability: bLog_Input for attach/detach and dropped events.
Related: PointerSampleAdapter.hpp, InteractionRouter.hpp, FrameRateSampler.hpp.
*/
#pragma once

#include "interaction/PointerTypes.hpp"
#include <QMetaObject>
#include <QPointer>
#include <QQuickItem>
#include <memory>

class FrameRateSampler;
class InteractionRouter;
class PointerSampleAdapter;
class QQuickWindow;
class Scheduler;

class InteractionSurface : public QQuickItem {
    Q_OBJECT
    Q_PROPERTY(bool attached READ isAttached NOTIFY attachedChanged)

public:
    explicit InteractionSurface(QQuickItem* parent = nullptr);
    ~InteractionSurface() override;

    void attach(InteractionRouter* router, const Scheduler& clock);
    void detach();
    bool isAttached() const { return m_router && m_adapter; }

    // Counts one frame per frameSwapped of the window this item is shown in.
    void setFrameSampler(FrameRateSampler* sampler);

signals:
    void gesture(const QString& type, qreal x, qreal y);
    void attachedChanged();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseUngrabEvent() override;
    void touchEvent(QTouchEvent* event) override;
    void touchUngrabEvent() override;
    void hoverLeaveEvent(QHoverEvent* event) override;

private slots:
    void onRouterGesture(const GestureEvent& event);
    void onWindowChanged(QQuickWindow* window);

private:
    void dispatch(QEvent* event);
    void cancelSession();
    void connectFrameSwapped();

    QPointer<InteractionRouter> m_router;
    std::unique_ptr<PointerSampleAdapter> m_adapter;
    QPointer<FrameRateSampler> m_frameSampler;
    QMetaObject::Connection m_frameConnection;
};
