#pragma once

#include <QtGlobal>

// Tunables for the interaction core. Defaults match the shipped UI; BeaconSettings
// overrides them from config.ini.

struct GestureConfig {
    double clickThreshold = 10.0;          // px, max(|dx|,|dy|) below this is a tap
    double swipeThreshold = 50.0;          // px, dominant-axis travel above this is a swipe
    qint64 tapTimeoutMs = 500;             // Presses held longer than this are not taps
    qint64 tapDebounceMs = 50;             // Delay before Tap is reported; 0 reports immediately
    qint64 longPressThresholdMs = 500;
    double longPressMoveTolerance = 15.0;  // px of travel that disarms a pending long press
    bool dragTracking = false;             // Emit DragDelta while the pointer moves
};

struct PullToRefreshConfig {
    double threshold = 80.0;       // Pull distance that arms a refresh
    double maxDistance = 150.0;
    double damping = 0.5;          // Finger travel to pull distance ratio
};

struct RippleConfig {
    qint64 expiryMs = 600;
};

struct SwipeActionConfig {
    double maxOffset = 100.0;
    double actionThreshold = 50.0;
};

struct ListConfig {
    int overscan = 5;
};

struct FrameSamplingConfig {
    qint64 tickIntervalMs = 16;    // Self-driven loop cadence when no frame signal is connected
    qint64 windowMs = 1000;
    qint64 idleGapMs = 500;        // A longer pause between frames means the scene was idle
};

struct MemoryMonitorConfig {
    qint64 intervalMs = 5000;
    double highUsagePercent = 80.0;
};

struct AccessibilityConfig {
    bool prefersReducedMotion = false;
};
