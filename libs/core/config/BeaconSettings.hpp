/*
Beacon — BeaconSettings
Role: Reads config.ini into the plain tunable structs used by the interaction and adaptive cores.
Inputs/Outputs: INI file (path from BEACON_CONFIG, else ./config.ini) in; BeaconSettings value out.
Threading: Load once at startup; the result is a value type.
Observability: Logs the resolved path, a warning when the file cannot be parsed and one per
      rejected value.
Assumptions: Missing keys and a missing file fall back to the compiled-in defaults. Values that
      do not parse or are out of range fall back too; pull/threshold and swipe/actionThreshold
      are clamped to their maxima.
*/
#pragma once

#include "adaptive/DeviceCapabilities.hpp"
#include "config/InteractionConfig.hpp"
#include <QString>

class QSettings;

struct BeaconSettings {
    GestureConfig gesture;
    PullToRefreshConfig pull;
    RippleConfig ripple;
    SwipeActionConfig swipe;
    ListConfig list;
    FrameSamplingConfig frame;
    MemoryMonitorConfig memory;
    AccessibilityConfig accessibility;
    PlatformSignals deviceOverrides;   // [device] keys, replace probed values when present

    static constexpr const char* DEFAULT_PATH = "config.ini";
    static constexpr const char* PATH_ENV = "BEACON_CONFIG";

    static QString resolvePath();

    // Empty path means resolvePath().
    static BeaconSettings load(const QString& path = QString());
    static BeaconSettings fromSettings(QSettings& settings);
};
