/*
Beacon — DeviceCapabilities
Role: Turns raw platform hints into a coarse CapabilityProfile used to steer adaptive rendering.
Inputs/Outputs: PlatformSignals (each field optional) in; CapabilityProfile out.
Threading: Pure functions; the sampler object lives on the GUI thread.
Integration: QtPlatformProbe (gui) supplies signals; AdaptivePerformanceController consumes the profile.
Observability: The sampler logs the resolved profile once via bLog_App.
Related: DeviceCapabilities.cpp, IPlatformProbe.hpp, RenderPolicy.hpp.
Assumptions: A missing signal means "unknown", which resolves to the high-end default.
*/
#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>
#include <optional>

enum class GpuTier {
    Low,
    Medium,
    High
};

enum class ConnectionTier {
    Slow2G,
    TwoG,
    ThreeG,
    FourG,
    Wifi,
    Unknown
};

// What a probe managed to read. std::nullopt means the platform did not expose it.
struct PlatformSignals {
    std::optional<int> hardwareConcurrency;
    std::optional<double> deviceMemoryGB;
    std::optional<QString> gpuRenderer;
    std::optional<QString> gpuVendor;
    std::optional<QString> effectiveConnectionType;   // "slow-2g", "2g", "3g", "4g", "wifi"
    std::optional<bool> saveData;
    std::optional<bool> hasTouchSupport;
    std::optional<bool> hasCoarsePointer;
    std::optional<int> viewportWidth;
};

struct CapabilityProfile {
    int cores = 4;
    double memoryTierGB = 8.0;
    GpuTier gpuTier = GpuTier::High;
    ConnectionTier connectionTier = ConnectionTier::Unknown;
    bool saveData = false;

    bool isLowEnd = false;
    bool isHighEnd = true;
    bool hasTouch = false;
    bool isTouchDevice = false;

    bool isSlowConnection() const {
        return connectionTier == ConnectionTier::Slow2G
            || connectionTier == ConnectionTier::TwoG
            || connectionTier == ConnectionTier::ThreeG;
    }

    bool operator==(const CapabilityProfile& other) const = default;
};

Q_DECLARE_METATYPE(CapabilityProfile)

namespace DeviceCapabilities {

inline constexpr int TOUCH_VIEWPORT_MAX_WIDTH = 1024;

// Fallback ladder when memory cannot be read directly.
double estimateMemoryTier(int cores);

// Renderer/vendor substring match; unmatched renderers are Medium, no renderer at all is High.
GpuTier classifyGpu(const std::optional<QString>& renderer, const std::optional<QString>& vendor);

// saveData forces the slowest tier regardless of the reported effective type.
ConnectionTier classifyConnection(const std::optional<QString>& effectiveType, bool saveData);

bool isTouchDevice(bool hasCoarsePointer, std::optional<int> viewportWidth);

CapabilityProfile buildProfile(const PlatformSignals& platformSignals);

// Fields set in overrides replace the probed ones.
PlatformSignals merge(const PlatformSignals& probed, const PlatformSignals& overrides);

const char* toString(GpuTier tier);
const char* toString(ConnectionTier tier);

} // namespace DeviceCapabilities

class IPlatformProbe;

/**
 * One-shot capability sampling at startup, with a cheap re-evaluation of the
 * viewport-derived touch classification on resize.
 */
class DeviceCapabilitySampler : public QObject {
    Q_OBJECT

public:
    explicit DeviceCapabilitySampler(IPlatformProbe& probe, const PlatformSignals& overrides = {},
                                     QObject* parent = nullptr);

    const CapabilityProfile& sample();
    void refreshViewport(int viewportWidth, std::optional<bool> hasCoarsePointer = std::nullopt);

    // Live connection hints (NetworkStatus). Ignored until the first sample().
    void updateConnection(const std::optional<QString>& effectiveType, std::optional<bool> saveData);

    const CapabilityProfile& profile() const { return m_profile; }
    bool hasSampled() const { return m_sampled; }

signals:
    void profileChanged(const CapabilityProfile& profile);

private:
    IPlatformProbe& m_probe;
    PlatformSignals m_overrides;
    PlatformSignals m_signals;
    CapabilityProfile m_profile;
    bool m_sampled = false;
};
