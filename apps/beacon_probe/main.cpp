/*
Beacon — beacon_probe
Role: Prints what the adaptive layer sees on this machine: the probed platform signals, the
      resulting capability profile, the live network state, a one-window FPS measurement on the real scheduler, memory
      usage and the resolved render policy.
Usage: QT_QPA_PLATFORM=offscreen beacon_probe [config.ini]
*/
#include "Log.hpp"
#include "QtNetworkMonitor.hpp"
#include "QtPlatformProbe.hpp"
#include "adaptive/DeviceCapabilities.hpp"
#include "adaptive/FrameRateSampler.hpp"
#include "adaptive/MemoryMonitor.hpp"
#include "adaptive/NetworkStatus.hpp"
#include "adaptive/RenderPolicy.hpp"
#include "adaptive/SystemResources.hpp"
#include "config/BeaconSettings.hpp"
#include "scheduling/QtScheduler.hpp"
#include <QGuiApplication>
#include <QTimer>
#include <fmt/format.h>

namespace {

template <typename T>
std::string describe(const std::optional<T>& value) {
    return value ? fmt::format("{}", *value) : std::string("n/a");
}

std::string describe(const std::optional<QString>& value) {
    return value ? value->toStdString() : std::string("n/a");
}

} // namespace

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);

    const BeaconSettings settings = BeaconSettings::load(argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString());

    QtPlatformProbe probe;
    const PlatformSignals probed = probe.probe();
    fmt::print("Platform signals\n");
    fmt::print("  cores            {}\n", describe(probed.hardwareConcurrency));
    fmt::print("  memory (GB)      {}\n", describe(probed.deviceMemoryGB));
    fmt::print("  gpu renderer     {}\n", describe(probed.gpuRenderer));
    fmt::print("  gpu vendor       {}\n", describe(probed.gpuVendor));
    fmt::print("  connection       {}\n", describe(probed.effectiveConnectionType));
    fmt::print("  save data        {}\n", describe(probed.saveData));
    fmt::print("  touch            {}\n", describe(probed.hasTouchSupport));
    fmt::print("  viewport width   {}\n", describe(probed.viewportWidth));

    DeviceCapabilitySampler capabilities(probe, settings.deviceOverrides);
    const CapabilityProfile profile = capabilities.sample();
    fmt::print("Capability profile\n");
    fmt::print("  cores {} | memory tier {:.1f} GB | gpu {} | connection {} | saveData {}\n",
               profile.cores, profile.memoryTierGB, DeviceCapabilities::toString(profile.gpuTier),
               DeviceCapabilities::toString(profile.connectionTier), profile.saveData);
    fmt::print("  lowEnd {} | highEnd {} | touch device {} | slow connection {}\n",
               profile.isLowEnd, profile.isHighEnd, profile.isTouchDevice, profile.isSlowConnection());

    NetworkStatus network;
    QtNetworkMonitor networkMonitor(network);
    fmt::print("Network\n");
    if (networkMonitor.start()) {
        const NetworkSnapshot& snapshot = network.snapshot();
        fmt::print("  online {} | transport {} | metered {} | slow {}\n",
                   describe(snapshot.online), NetworkHints::toString(snapshot.transport),
                   describe(snapshot.metered), network.isSlowConnection());
    } else {
        fmt::print("  no backend\n");
    }

    const MemoryReading memory = MemoryMonitor::platformReading();
    fmt::print("Memory\n  resident {} of {}\n",
               SystemResources::formatMemorySize(memory.usedBytes).toStdString(),
               SystemResources::formatMemorySize(memory.limitBytes).toStdString());

    QtScheduler scheduler;
    FrameRateSampler frames(scheduler, settings.frame);
    QObject::connect(&frames, &FrameRateSampler::fpsChanged, &app, [&](double fps) {
        frames.stop();
        const RenderPolicy policy = RenderPolicyResolver::resolve(fps, settings.accessibility.prefersReducedMotion, profile);
        fmt::print("Render policy (tick loop at {:.1f} fps)\n", fps);
        fmt::print("  reducedMotion {} | animation {} ms | frame budget {:.2f} ms | overscan {}\n",
                   policy.reducedMotion, policy.animationDurationMs, policy.frameBudgetMs, policy.recommendedOverscan);
        app.quit();
    });

    // Guard against a stalled event loop.
    QTimer::singleShot(static_cast<int>(settings.frame.windowMs * 3), &app, [&app]() {
        LOG_W("probe", "No FPS window completed, giving up");
        app.exit(1);
    });

    frames.start();
    return app.exec();
}
