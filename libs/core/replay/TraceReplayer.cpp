#include "replay/TraceReplayer.hpp"
#include "interaction/GestureRecognizer.hpp"
#include "interaction/InteractionRouter.hpp"
#include "interaction/PullToRefreshController.hpp"
#include "interaction/RippleEmitter.hpp"
#include "scheduling/VirtualClockScheduler.hpp"
#include "BeaconLogging.hpp"
#include <QCoreApplication>
#include <QFuture>
#include <QPromise>
#include <algorithm>
#include <memory>
#include <stdexcept>

TraceReplayer::TraceReplayer(const BeaconSettings& settings)
    : m_settings(settings) {
}

ReplayResult TraceReplayer::run(const PointerTrace& trace) const {
    ReplayResult result;
    const qint64 startMs = trace.samples.empty() ? 0 : trace.samples.front().t;

    // Declared first so every task owner below is gone before the clock.
    VirtualClockScheduler clock(startMs);

    GestureRecognizer recognizer(clock, m_settings.gesture);
    PullToRefreshController pull(m_settings.pull);
    RippleEmitter ripples(clock, m_settings.ripple);
    InteractionRouter router(recognizer);

    router.setPullToRefresh(&pull);
    router.setRippleEmitter(&ripples);
    router.setRippleTarget(m_rippleTarget);
    const double scrollTop = trace.scrollTop;
    router.setScrollOffsetProvider([scrollTop]() { return scrollTop; });

    const qint64 refreshMs = trace.refreshMs;
    const bool refreshFails = trace.refreshFails;
    pull.setRefreshFunction([&clock, &pull, refreshMs, refreshFails]() {
        auto promise = std::make_shared<QPromise<void>>();
        promise->start();
        QFuture<void> future = promise->future();
        clock.schedule(refreshMs, [&pull, promise, refreshFails]() {
            if (refreshFails) {
                promise->setException(std::make_exception_ptr(std::runtime_error("simulated refresh failure")));
            }
            promise->finish();
            // No event loop runs during replay; deliver the completion queued on the controller.
            QCoreApplication::sendPostedEvents(&pull);
        });
        return future;
    });

    QObject::connect(&router, &InteractionRouter::gestureRecognized, [&result](const GestureEvent& event) {
        result.gestures.push_back(event);
    });
    QObject::connect(&pull, &PullToRefreshController::refreshStarted, [&result]() {
        ++result.refreshesStarted;
    });
    QObject::connect(&pull, &PullToRefreshController::refreshFinished, [&result](bool succeeded) {
        if (succeeded) ++result.refreshesSucceeded;
        else ++result.refreshesFailed;
    });
    QObject::connect(&ripples, &RippleEmitter::rippleCreated, [&result](const RippleToken&) {
        ++result.ripplesCreated;
    });

    for (const PointerSample& sample : trace.samples) {
        clock.advanceTo(sample.t);
        router.handleSample(sample);
    }

    // Let debounced taps, long-press timers, ripples and the refresh settle.
    const qint64 settleMs = std::max({ m_settings.gesture.tapDebounceMs,
                                       m_settings.gesture.longPressThresholdMs,
                                       m_settings.ripple.expiryMs,
                                       refreshMs }) + 1;
    clock.advanceBy(settleMs);
    result.endTimeMs = clock.nowMs();

    bLog_Debug("Replay finished:" << result.gestures.size() << "gestures," << result.refreshesStarted << "refreshes");
    return result;
}
