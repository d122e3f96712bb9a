#pragma once

#include "adaptive/DeviceCapabilities.hpp"

/**
 * Strategy for reading hardware and network hints from the host platform.
 * Implementations leave a field empty when the platform does not expose it;
 * they never fail.
 */
class IPlatformProbe {
public:
    virtual ~IPlatformProbe() = default;

    virtual PlatformSignals probe() = 0;
};
