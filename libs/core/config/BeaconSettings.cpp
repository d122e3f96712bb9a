#include "config/BeaconSettings.hpp"
#include "BeaconLogging.hpp"
#include <QFile>
#include <QSettings>
#include <limits>
#include <optional>

namespace {

constexpr double POSITIVE = std::numeric_limits<double>::min();
constexpr double UNBOUNDED = std::numeric_limits<double>::max();
constexpr int MAX_OVERSCAN = 1000;

QString keyPath(const QSettings& settings, const char* key) {
    const QString name = QString::fromLatin1(key);
    const QString group = settings.group();
    if (group.isEmpty()) return name;
    return group + QLatin1Char('/') + name;
}

// Values that do not parse or fall outside [lo, hi] keep the default.
double boundedDouble(QSettings& settings, const char* key, double fallback,
                     double lo, double hi = UNBOUNDED) {
    if (!settings.contains(QLatin1String(key))) return fallback;

    bool ok = false;
    const double value = settings.value(QLatin1String(key)).toDouble(&ok);
    if (!ok || !(value >= lo && value <= hi)) {
        bLog_Warning("Config" << keyPath(settings, key) << "=" << settings.value(QLatin1String(key)).toString()
                     << "out of range, using" << fallback);
        return fallback;
    }
    return value;
}

qint64 boundedInt(QSettings& settings, const char* key, qint64 fallback,
                  qint64 lo, qint64 hi = std::numeric_limits<qint64>::max()) {
    if (!settings.contains(QLatin1String(key))) return fallback;

    bool ok = false;
    const qint64 value = settings.value(QLatin1String(key)).toLongLong(&ok);
    if (!ok || value < lo || value > hi) {
        bLog_Warning("Config" << keyPath(settings, key) << "=" << settings.value(QLatin1String(key)).toString()
                     << "out of range, using" << fallback);
        return fallback;
    }
    return value;
}

template <typename T>
std::optional<T> optionalValue(QSettings& settings, const char* key) {
    if (!settings.contains(QLatin1String(key))) return std::nullopt;
    return settings.value(QLatin1String(key)).value<T>();
}

// Device overrides that do not parse or are out of range are dropped, leaving the probed value.
template <typename T>
std::optional<T> optionalBounded(QSettings& settings, const char* key, double lo, double hi) {
    if (!settings.contains(QLatin1String(key))) return std::nullopt;

    bool ok = false;
    const double value = settings.value(QLatin1String(key)).toDouble(&ok);
    if (!ok || !(value >= lo && value <= hi)) {
        bLog_Warning("Config" << keyPath(settings, key) << "out of range, ignoring override");
        return std::nullopt;
    }
    return static_cast<T>(value);
}

} // namespace

QString BeaconSettings::resolvePath() {
    const QString env = qEnvironmentVariable(PATH_ENV);
    if (!env.isEmpty()) return env;  // Override
    return QString::fromLatin1(DEFAULT_PATH);
}

BeaconSettings BeaconSettings::load(const QString& path) {
    const QString resolved = path.isEmpty() ? resolvePath() : path;

    if (!QFile::exists(resolved)) {
        bLog_App("No config at" << resolved << "- using defaults");
        return BeaconSettings{};
    }

    QSettings settings(resolved, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        bLog_Warning("Config" << resolved << "could not be parsed, using defaults");
        return BeaconSettings{};
    }

    bLog_App("⚙️ Loaded config from" << resolved);
    return fromSettings(settings);
}

BeaconSettings BeaconSettings::fromSettings(QSettings& settings) {
    BeaconSettings s;

    settings.beginGroup("gesture");
    s.gesture.clickThreshold = boundedDouble(settings, "clickThreshold", s.gesture.clickThreshold, POSITIVE);
    s.gesture.swipeThreshold = boundedDouble(settings, "swipeThreshold", s.gesture.swipeThreshold, POSITIVE);
    s.gesture.tapTimeoutMs = boundedInt(settings, "tapTimeoutMs", s.gesture.tapTimeoutMs, 1);
    s.gesture.tapDebounceMs = boundedInt(settings, "tapDebounceMs", s.gesture.tapDebounceMs, 0);
    s.gesture.longPressThresholdMs = boundedInt(settings, "longPressMs", s.gesture.longPressThresholdMs, 0);
    s.gesture.longPressMoveTolerance = boundedDouble(settings, "longPressTolerance", s.gesture.longPressMoveTolerance, 0.0);
    s.gesture.dragTracking = settings.value("dragTracking", s.gesture.dragTracking).toBool();
    settings.endGroup();

    settings.beginGroup("pull");
    s.pull.threshold = boundedDouble(settings, "threshold", s.pull.threshold, POSITIVE);
    s.pull.maxDistance = boundedDouble(settings, "maxDistance", s.pull.maxDistance, POSITIVE);
    s.pull.damping = boundedDouble(settings, "damping", s.pull.damping, POSITIVE);
    settings.endGroup();
    if (s.pull.threshold > s.pull.maxDistance) {
        bLog_Warning("Config pull/threshold" << s.pull.threshold << "exceeds maxDistance" << s.pull.maxDistance
                     << ", clamping");
        s.pull.threshold = s.pull.maxDistance;
    }

    s.ripple.expiryMs = boundedInt(settings, "ripple/expiryMs", s.ripple.expiryMs, 1);

    settings.beginGroup("swipe");
    s.swipe.maxOffset = boundedDouble(settings, "maxOffset", s.swipe.maxOffset, POSITIVE);
    s.swipe.actionThreshold = boundedDouble(settings, "actionThreshold", s.swipe.actionThreshold, POSITIVE);
    settings.endGroup();
    if (s.swipe.actionThreshold > s.swipe.maxOffset) {
        bLog_Warning("Config swipe/actionThreshold" << s.swipe.actionThreshold << "exceeds maxOffset"
                     << s.swipe.maxOffset << ", clamping");
        s.swipe.actionThreshold = s.swipe.maxOffset;
    }

    s.list.overscan = static_cast<int>(boundedInt(settings, "list/overscan", s.list.overscan, 0, MAX_OVERSCAN));
    s.accessibility.prefersReducedMotion =
        settings.value("accessibility/reducedMotion", s.accessibility.prefersReducedMotion).toBool();

    settings.beginGroup("frame");
    s.frame.tickIntervalMs = boundedInt(settings, "intervalMs", s.frame.tickIntervalMs, 1);
    s.frame.windowMs = boundedInt(settings, "windowMs", s.frame.windowMs, 1);
    s.frame.idleGapMs = boundedInt(settings, "idleGapMs", s.frame.idleGapMs, 1);
    settings.endGroup();

    settings.beginGroup("memory");
    s.memory.intervalMs = boundedInt(settings, "intervalMs", s.memory.intervalMs, 1);
    s.memory.highUsagePercent = boundedDouble(settings, "highUsagePercent", s.memory.highUsagePercent, POSITIVE, 100.0);
    settings.endGroup();

    settings.beginGroup("device");
    s.deviceOverrides.hardwareConcurrency = optionalBounded<int>(settings, "cores", 1, 4096);
    s.deviceOverrides.deviceMemoryGB = optionalBounded<double>(settings, "memoryGB", POSITIVE, UNBOUNDED);
    s.deviceOverrides.gpuRenderer = optionalValue<QString>(settings, "gpuRenderer");
    s.deviceOverrides.gpuVendor = optionalValue<QString>(settings, "gpuVendor");
    s.deviceOverrides.effectiveConnectionType = optionalValue<QString>(settings, "connection");
    s.deviceOverrides.saveData = optionalValue<bool>(settings, "saveData");
    s.deviceOverrides.hasTouchSupport = optionalValue<bool>(settings, "touch");
    s.deviceOverrides.hasCoarsePointer = optionalValue<bool>(settings, "coarsePointer");
    s.deviceOverrides.viewportWidth = optionalBounded<int>(settings, "viewportWidth", 0, 1 << 20);
    settings.endGroup();

    return s;
}
