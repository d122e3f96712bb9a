#pragma once

#include "config/BeaconSettings.hpp"
#include "interaction/PointerTypes.hpp"
#include "replay/TraceReader.hpp"
#include <QRectF>
#include <vector>

struct ReplayResult {
    std::vector<GestureEvent> gestures;
    int refreshesStarted = 0;
    int refreshesSucceeded = 0;
    int refreshesFailed = 0;
    size_t ripplesCreated = 0;
    qint64 endTimeMs = 0;
};

/**
 * Feeds a recorded trace through the full interaction stack (router, gesture
 * recognizer, pull-to-refresh, ripples) on a virtual clock. The clock follows
 * the sample timestamps, so timers fire exactly where they would have live.
 */
class TraceReplayer {
public:
    explicit TraceReplayer(const BeaconSettings& settings = BeaconSettings{});

    // Target rect for ripples; a null rect disables them.
    void setRippleTarget(const QRectF& bounds) { m_rippleTarget = bounds; }

    ReplayResult run(const PointerTrace& trace) const;

private:
    BeaconSettings m_settings;
    QRectF m_rippleTarget;
};
