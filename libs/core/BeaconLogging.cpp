#include "BeaconLogging.hpp"

// =============================================================================
// BEACON LOGGING CATEGORY DEFINITIONS
// =============================================================================

Q_LOGGING_CATEGORY(logApp, "beacon.app")         // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logInput, "beacon.input")     // Input: pointer samples, gestures, pull-to-refresh
Q_LOGGING_CATEGORY(logRender, "beacon.render")   // Render: frame rate, render policy, virtual window
Q_LOGGING_CATEGORY(logDebug, "beacon.debug", QtWarningMsg)  // Debug: off unless enabled via rules
