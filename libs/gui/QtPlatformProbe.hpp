#pragma once

#include "adaptive/IPlatformProbe.hpp"

/**
 * Reads platform hints through Qt and the OS:
 *  - cores from QThread::idealThreadCount()
 *  - memory from the OS physical memory query
 *  - GPU renderer/vendor from a throwaway offscreen OpenGL context
 *  - touch from the registered QInputDevices
 *  - viewport width from the primary screen
 *  - transport medium and metering from QNetworkInformation
 *
 * Requires a QGuiApplication. Anything Qt cannot answer is left empty.
 */
class QtPlatformProbe : public IPlatformProbe {
public:
    QtPlatformProbe() = default;

    PlatformSignals probe() override;

    // Individual readers, public for beacon_probe's verbose output.
    static std::optional<int> readCores();
    static std::optional<double> readMemoryGB();
    static void readGpu(PlatformSignals& out);
    static void readInputDevices(PlatformSignals& out);
    static std::optional<int> readViewportWidth();
    static void readNetwork(PlatformSignals& out);
};
