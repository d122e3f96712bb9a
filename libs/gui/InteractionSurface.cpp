#include "InteractionSurface.hpp"
#include "PointerSampleAdapter.hpp"
#include "adaptive/FrameRateSampler.hpp"
#include "interaction/InteractionRouter.hpp"
#include "BeaconLogging.hpp"
#include <QHoverEvent>
#include <QMouseEvent>
#include <QQuickWindow>
#include <QTouchEvent>

InteractionSurface::InteractionSurface(QQuickItem* parent)
    : QQuickItem(parent) {
    setAcceptedMouseButtons(Qt::LeftButton);
    setAcceptTouchEvents(true);
    setAcceptHoverEvents(true);

    connect(this, &QQuickItem::windowChanged, this, &InteractionSurface::onWindowChanged);
}

InteractionSurface::~InteractionSurface() {
    detach();
}

void InteractionSurface::attach(InteractionRouter* router, const Scheduler& clock) {
    detach();
    if (!router) return;

    m_router = router;
    m_adapter = std::make_unique<PointerSampleAdapter>(clock);
    connect(m_router, &InteractionRouter::gestureRecognized, this, &InteractionSurface::onRouterGesture);

    bLog_Input("InteractionSurface attached to router");
    emit attachedChanged();
}

void InteractionSurface::detach() {
    if (!m_router && !m_adapter) return;

    cancelSession();
    if (m_router) {
        disconnect(m_router, nullptr, this, nullptr);
    }
    m_router = nullptr;
    m_adapter.reset();
    emit attachedChanged();
}

void InteractionSurface::setFrameSampler(FrameRateSampler* sampler) {
    m_frameSampler = sampler;
    connectFrameSwapped();
}

void InteractionSurface::mousePressEvent(QMouseEvent* event) {
    if (!isAttached() || !isVisible() || event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }
    // Ripples are placed relative to this item; samples are in item coordinates too.
    m_router->setRippleTarget(boundingRect());
    dispatch(event);
    event->accept();
}

void InteractionSurface::mouseMoveEvent(QMouseEvent* event) {
    if (!isAttached()) {
        event->ignore();
        return;
    }
    dispatch(event);
    event->accept();
}

void InteractionSurface::mouseReleaseEvent(QMouseEvent* event) {
    if (!isAttached()) {
        event->ignore();
        return;
    }
    dispatch(event);
    event->accept();
}

void InteractionSurface::mouseUngrabEvent() {
    cancelSession();
}

void InteractionSurface::touchEvent(QTouchEvent* event) {
    if (!isAttached() || !isVisible()) {
        event->ignore();
        return;
    }
    if (event->type() == QEvent::TouchBegin) {
        m_router->setRippleTarget(boundingRect());
    }
    dispatch(event);
    event->accept();
}

void InteractionSurface::touchUngrabEvent() {
    cancelSession();
}

void InteractionSurface::hoverLeaveEvent(QHoverEvent* event) {
    dispatch(event);
    QQuickItem::hoverLeaveEvent(event);
}

void InteractionSurface::dispatch(QEvent* event) {
    if (!isAttached()) return;

    for (const PointerSample& sample : m_adapter->translate(event)) {
        m_router->handleSample(sample);
    }
}

void InteractionSurface::cancelSession() {
    if (!isAttached()) return;

    for (const PointerSample& sample : m_adapter->cancelActive()) {
        m_router->handleSample(sample);
    }
}

void InteractionSurface::onRouterGesture(const GestureEvent& event) {
    emit gesture(QString::fromLatin1(toString(event.type)), event.position.x(), event.position.y());
}

void InteractionSurface::onWindowChanged(QQuickWindow*) {
    connectFrameSwapped();
}

void InteractionSurface::connectFrameSwapped() {
    if (m_frameConnection) {
        disconnect(m_frameConnection);
    }
    QQuickWindow* quickWindow = window();
    if (!quickWindow || !m_frameSampler) return;

    // frameSwapped is emitted on the render thread with the threaded render loop.
    m_frameConnection = connect(quickWindow, &QQuickWindow::frameSwapped,
                                m_frameSampler, &FrameRateSampler::recordFrame, Qt::QueuedConnection);
    bLog_Render("InteractionSurface: frame sampler driven by frameSwapped");
}
