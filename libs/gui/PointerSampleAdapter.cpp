#include "PointerSampleAdapter.hpp"
#include "scheduling/Scheduler.hpp"
#include "BeaconLogging.hpp"
#include <QEvent>
#include <QInputDevice>
#include <QMouseEvent>
#include <QPointingDevice>
#include <QTouchEvent>
#include <algorithm>

namespace {

bool isFromTouchScreen(const QMouseEvent* event) {
    const QPointingDevice* device = event->pointingDevice();
    return device && device->type() == QInputDevice::DeviceType::TouchScreen;
}

} // namespace

PointerSampleAdapter::PointerSampleAdapter(const Scheduler& clock)
    : m_clock(clock) {
}

std::vector<PointerSample> PointerSampleAdapter::translate(QEvent* event) {
    if (!event) return {};

    switch (event->type()) {
        case QEvent::MouseButtonPress:
        case QEvent::MouseMove:
        case QEvent::MouseButtonRelease: {
            auto sample = fromMouseEvent(static_cast<QMouseEvent*>(event));
            if (sample) return { *sample };
            return {};
        }
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
            return fromTouchEvent(static_cast<QTouchEvent*>(event));
        case QEvent::TouchCancel:
        case QEvent::Leave:
        case QEvent::HoverLeave:
        case QEvent::UngrabMouse:
            return cancelActive();
        default:
            return {};
    }
}

std::optional<PointerSample> PointerSampleAdapter::fromMouseEvent(QMouseEvent* event) {
    if (!event || isFromTouchScreen(event)) return std::nullopt;

    const QPointF position = event->position();
    switch (event->type()) {
        case QEvent::MouseButtonPress:
            if (event->button() != Qt::LeftButton) return std::nullopt;
            m_mouseDown = true;
            m_lastMousePosition = position;
            return makeSample(position, PointerPhase::Start, 0);

        case QEvent::MouseMove:
            if (!m_mouseDown) return std::nullopt;   // hover
            m_lastMousePosition = position;
            return makeSample(position, PointerPhase::Move, 0);

        case QEvent::MouseButtonRelease:
            if (event->button() != Qt::LeftButton || !m_mouseDown) return std::nullopt;
            m_mouseDown = false;
            return makeSample(position, PointerPhase::End, 0);

        default:
            return std::nullopt;
    }
}

std::vector<PointerSample> PointerSampleAdapter::fromTouchEvent(QTouchEvent* event) {
    std::vector<PointerSample> samples;
    if (!event) return samples;

    for (const QEventPoint& point : event->points()) {
        const int id = point.id();
        const QPointF position = point.position();
        auto active = std::find_if(m_activeTouches.begin(), m_activeTouches.end(),
                                   [id](const ActiveTouch& touch) { return touch.id == id; });

        switch (point.state()) {
            case QEventPoint::State::Pressed:
                if (active == m_activeTouches.end()) {
                    m_activeTouches.push_back({ id, position });
                } else {
                    active->position = position;
                }
                samples.push_back(makeSample(position, PointerPhase::Start, id));
                break;

            case QEventPoint::State::Updated:
                if (active == m_activeTouches.end()) break;
                active->position = position;
                samples.push_back(makeSample(position, PointerPhase::Move, id));
                break;

            case QEventPoint::State::Released:
                if (active == m_activeTouches.end()) break;
                m_activeTouches.erase(active);
                samples.push_back(makeSample(position, PointerPhase::End, id));
                break;

            default:
                break;   // Stationary points carry nothing new
        }
    }
    return samples;
}

std::vector<PointerSample> PointerSampleAdapter::cancelActive() {
    std::vector<PointerSample> samples;

    if (m_mouseDown) {
        m_mouseDown = false;
        samples.push_back(makeSample(m_lastMousePosition, PointerPhase::Cancel, 0));
    }
    for (const ActiveTouch& touch : m_activeTouches) {
        samples.push_back(makeSample(touch.position, PointerPhase::Cancel, touch.id));
    }
    m_activeTouches.clear();

    if (!samples.empty()) {
        bLog_Input("Pointer left or lost grab, cancelling" << samples.size() << "contact(s)");
    }
    return samples;
}

PointerSample PointerSampleAdapter::makeSample(const QPointF& position, PointerPhase phase, int pointerId) const {
    PointerSample sample;
    sample.x = position.x();
    sample.y = position.y();
    sample.t = m_clock.nowMs();
    sample.phase = phase;
    sample.pointerId = pointerId;
    return sample;
}
