#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// BEACON LOGGING CATEGORIES
// =============================================================================
// Four categories, each with per-call-site atomic throttling for hot paths
// (pointer moves and frame ticks arrive at 60-144 Hz).

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logInput)    // Input: pointer samples, gestures, pull-to-refresh, ripples
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: frame rate, render policy, virtual window
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace beacon::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event (low frequency)
    inline constexpr int kInput  = 1;    // Gestures are discrete; log each one
    inline constexpr int kRender = 60;   // Log every 60th render operation
    inline constexpr int kDebug  = 10;   // Log every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define BLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("BEACON_LOG_" #cat "_INTERVAL");          \
            int value = env ? std::atoi(env) : (defaultInterval);                    \
            return value > 0 ? value : 1;                                            \
        }();                                                                         \
        if ((++_counter % _interval) == 1 || _interval == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define bLog_App(...)     BLOG_THROTTLED(App, beacon::log_throttle::kApp, __VA_ARGS__)
#define bLog_Input(...)   BLOG_THROTTLED(Input, beacon::log_throttle::kInput, __VA_ARGS__)
#define bLog_Render(...)  BLOG_THROTTLED(Render, beacon::log_throttle::kRender, __VA_ARGS__)
#define bLog_Debug(...)   BLOG_THROTTLED(Debug, beacon::log_throttle::kDebug, __VA_ARGS__)

// Override macros for specific throttle intervals
#define bLog_AppN(n, ...)    BLOG_THROTTLED(App, n, __VA_ARGS__)
#define bLog_InputN(n, ...)  BLOG_THROTTLED(Input, n, __VA_ARGS__)
#define bLog_RenderN(n, ...) BLOG_THROTTLED(Render, n, __VA_ARGS__)
#define bLog_DebugN(n, ...)  BLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define bLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define bLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export BEACON_LOG_Input_INTERVAL=1       # every input message
//   export BEACON_LOG_Render_INTERVAL=10     # every 10th render message
//   export QT_LOGGING_RULES="beacon.*.debug=true"
