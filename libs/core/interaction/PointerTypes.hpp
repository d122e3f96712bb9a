/*
Beacon — PointerTypes
Role: Value types shared by every recognizer: pointer samples in, gesture events out.
Inputs/Outputs: PointerSample is produced by PointerSampleAdapter (gui) or a replay trace.
Threading: Plain values; copied freely across signal connections.
Related: GestureRecognizer.hpp, PullToRefreshController.hpp, PointerSampleAdapter.hpp.
*/
#pragma once

#include <QMetaType>
#include <QPointF>
#include <QString>
#include <QtGlobal>

enum class PointerPhase {
    Start,
    Move,
    End,
    Cancel
};

// One normalized mouse/touch sample. t is monotonic milliseconds.
struct PointerSample {
    double x = 0.0;
    double y = 0.0;
    qint64 t = 0;
    PointerPhase phase = PointerPhase::Start;
    int pointerId = 0;

    QPointF position() const { return QPointF(x, y); }
};

enum class GestureType {
    Tap,
    SwipeLeft,
    SwipeRight,
    SwipeUp,
    SwipeDown,
    LongPressStart,
    LongPressEnd,
    DragDelta,
    RefreshTriggered
};

struct GestureEvent {
    GestureType type = GestureType::Tap;
    QPointF position;       // Sample position that produced the event
    qint64 timestamp = 0;
    double dragDx = 0.0;    // Only meaningful for DragDelta

    bool isTerminal() const {
        switch (type) {
            case GestureType::Tap:
            case GestureType::SwipeLeft:
            case GestureType::SwipeRight:
            case GestureType::SwipeUp:
            case GestureType::SwipeDown:
            case GestureType::RefreshTriggered:
                return true;
            default:
                return false;
        }
    }

    static GestureEvent make(GestureType type, const PointerSample& sample) {
        return GestureEvent{type, sample.position(), sample.t, 0.0};
    }

    static GestureEvent drag(double dx, const PointerSample& sample) {
        return GestureEvent{GestureType::DragDelta, sample.position(), sample.t, dx};
    }
};

inline const char* toString(PointerPhase phase) {
    switch (phase) {
        case PointerPhase::Start:  return "start";
        case PointerPhase::Move:   return "move";
        case PointerPhase::End:    return "end";
        case PointerPhase::Cancel: return "cancel";
    }
    return "unknown";
}

inline const char* toString(GestureType type) {
    switch (type) {
        case GestureType::Tap:              return "Tap";
        case GestureType::SwipeLeft:        return "SwipeLeft";
        case GestureType::SwipeRight:       return "SwipeRight";
        case GestureType::SwipeUp:          return "SwipeUp";
        case GestureType::SwipeDown:        return "SwipeDown";
        case GestureType::LongPressStart:   return "LongPressStart";
        case GestureType::LongPressEnd:     return "LongPressEnd";
        case GestureType::DragDelta:        return "DragDelta";
        case GestureType::RefreshTriggered: return "RefreshTriggered";
    }
    return "Unknown";
}

Q_DECLARE_METATYPE(PointerSample)
Q_DECLARE_METATYPE(GestureEvent)
