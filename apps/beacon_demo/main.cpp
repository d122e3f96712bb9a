/*
Beacon — beacon_demo
Role: Interactive harness for the interaction core. A QQuickView hosts an InteractionSurface
      over a virtualized list so gestures, pull-to-refresh, ripples and the adaptive policy
      can be exercised by hand. Refresh timings are logged through PerformanceMetrics.
*/
#include "InteractionSurface.hpp"
#include "QtNetworkMonitor.hpp"
#include "QtPlatformProbe.hpp"
#include "adaptive/AdaptivePerformanceController.hpp"
#include "adaptive/DeviceCapabilities.hpp"
#include "adaptive/FrameRateSampler.hpp"
#include "adaptive/MemoryMonitor.hpp"
#include "adaptive/NetworkStatus.hpp"
#include "adaptive/PerformanceMetrics.hpp"
#include "config/BeaconSettings.hpp"
#include "interaction/GestureRecognizer.hpp"
#include "interaction/InteractionRouter.hpp"
#include "interaction/PullToRefreshController.hpp"
#include "interaction/RippleEmitter.hpp"
#include "list/VirtualScrollController.hpp"
#include "scheduling/QtScheduler.hpp"
#include "BeaconLogging.hpp"
#include <QFuture>
#include <QGuiApplication>
#include <QPromise>
#include <QQmlContext>
#include <QQmlEngine>
#include <QQuickView>
#include <memory>

namespace {

constexpr int DEMO_ITEM_COUNT = 10000;
constexpr double DEMO_ITEM_HEIGHT = 48.0;
constexpr qint64 DEMO_REFRESH_MS = 1200;

void registerMetaTypesAndQml() {
    qRegisterMetaType<GestureEvent>();
    qRegisterMetaType<PullState>();
    qRegisterMetaType<RenderPolicy>();
    qRegisterMetaType<VirtualWindow>();
    qRegisterMetaType<CapabilityProfile>();
    qRegisterMetaType<NetworkSnapshot>();

    qmlRegisterType<InteractionSurface>("Beacon.Interaction", 1, 0, "InteractionSurface");
}

} // namespace

int main(int argc, char* argv[]) {
    bLog_App("[Beacon demo starting...]");

    QGuiApplication app(argc, argv);
    registerMetaTypesAndQml();

    const BeaconSettings settings = BeaconSettings::load();

    QtScheduler scheduler;

    // Interaction stack
    GestureRecognizer recognizer(scheduler, settings.gesture);
    PullToRefreshController pull(settings.pull);
    RippleEmitter ripples(scheduler, settings.ripple);
    InteractionRouter router(recognizer);
    VirtualScrollController list(settings.list.overscan);

    list.setItemCount(DEMO_ITEM_COUNT);
    list.setItemHeight(DEMO_ITEM_HEIGHT);

    router.setPullToRefresh(&pull);
    router.setRippleEmitter(&ripples);
    router.setScrollOffsetProvider([&list]() { return list.scrollTop(); });

    PerformanceMetrics metrics(scheduler);
    pull.setRefreshFunction([&scheduler, &metrics]() {
        auto promise = std::make_shared<QPromise<void>>();
        promise->start();
        QFuture<void> future = promise->future();
        scheduler.schedule(DEMO_REFRESH_MS, [promise]() { promise->finish(); });
        metrics.measureAsync(QStringLiteral("refresh"), future).then(&metrics, [&metrics](double) {
            if (const auto stats = metrics.stats(QStringLiteral("refresh"))) {
                bLog_App("Refresh took avg" << stats->average << "ms, p95" << stats->p95
                         << "over" << stats->count);
            }
        });
        return future;
    });

    // Adaptive stack
    QtPlatformProbe probe;
    DeviceCapabilitySampler capabilities(probe, settings.deviceOverrides);
    FrameRateSampler frames(scheduler, settings.frame);
    MemoryMonitor memory(scheduler, settings.memory);
    AdaptivePerformanceController performance(settings.accessibility);

    NetworkStatus network;
    QtNetworkMonitor networkMonitor(network);

    capabilities.sample();
    network.attachCapabilitySampler(&capabilities);
    networkMonitor.start();
    performance.attachCapabilitySampler(&capabilities);
    performance.attachFrameSampler(&frames);
    QObject::connect(&performance, &AdaptivePerformanceController::policyChanged,
                     &list, &VirtualScrollController::applyPolicy);
    list.applyPolicy(performance.policy());
    memory.start();

    QQuickView view;
    view.setResizeMode(QQuickView::SizeRootObjectToView);
    view.rootContext()->setContextProperty("pull", &pull);
    view.rootContext()->setContextProperty("list", &list);
    view.rootContext()->setContextProperty("performance", &performance);
    view.rootContext()->setContextProperty("memory", &memory);
    view.rootContext()->setContextProperty("ripples", &ripples);
    view.rootContext()->setContextProperty("network", &network);
    view.setSource(QUrl("qrc:/Beacon/qml/Main.qml"));

    if (view.status() == QQuickView::Error) {
        bLog_Error("QML failed to load:" << view.errors());
        return 1;
    }

    auto* surface = view.rootObject() ? view.rootObject()->findChild<InteractionSurface*>("surface") : nullptr;
    if (!surface) {
        bLog_Error("Main.qml has no InteractionSurface named 'surface'");
        return 1;
    }
    surface->attach(&router, scheduler);
    surface->setFrameSampler(&frames);

    QObject::connect(&view, &QQuickView::widthChanged, &capabilities, [&capabilities](int width) {
        capabilities.refreshViewport(width);
    });
    QObject::connect(&view, &QQuickView::heightChanged, &list, [&list](int height) {
        list.setViewportHeight(height);
    });

    view.resize(420, 760);
    view.show();
    list.setViewportHeight(view.height());

    bLog_App("Starting Qt event loop with app.exec()...");
    const int result = app.exec();

    surface->detach();
    memory.stop();
    router.reset();
    return result;
}
