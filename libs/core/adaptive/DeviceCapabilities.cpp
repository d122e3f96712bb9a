#include "adaptive/DeviceCapabilities.hpp"
#include "adaptive/IPlatformProbe.hpp"
#include "BeaconLogging.hpp"
#include <array>

namespace {

constexpr std::array<const char*, 7> LOW_END_GPUS = {
    "mali-400", "adreno 305", "adreno 306", "adreno 320",
    "powervr sgx", "tegra 3", "tegra 4"
};

constexpr std::array<const char*, 5> HIGH_END_GPUS = {
    "nvidia", "radeon", "adreno 6", "mali-g", "apple a"
};

template <size_t N>
bool containsAny(const QString& haystack, const std::array<const char*, N>& needles) {
    const QString lower = haystack.toLower();
    for (const char* needle : needles) {
        if (lower.contains(QLatin1String(needle))) return true;
    }
    return false;
}

template <typename T>
void overrideIfSet(std::optional<T>& target, const std::optional<T>& source) {
    if (source) target = source;
}

} // namespace

namespace DeviceCapabilities {

double estimateMemoryTier(int cores) {
    if (cores <= 2) return 2.0;
    if (cores <= 4) return 4.0;
    if (cores <= 8) return 8.0;
    return 16.0;
}

GpuTier classifyGpu(const std::optional<QString>& renderer, const std::optional<QString>& vendor) {
    if (!renderer || renderer->isEmpty()) {
        return GpuTier::High;
    }

    if (containsAny(*renderer, LOW_END_GPUS)) {
        return GpuTier::Low;
    }

    if (containsAny(*renderer, HIGH_END_GPUS) || (vendor && containsAny(*vendor, HIGH_END_GPUS))) {
        return GpuTier::High;
    }
    return GpuTier::Medium;
}

ConnectionTier classifyConnection(const std::optional<QString>& effectiveType, bool saveData) {
    if (saveData) return ConnectionTier::Slow2G;
    if (!effectiveType) return ConnectionTier::Unknown;

    const QString type = effectiveType->trimmed().toLower();
    if (type == QLatin1String("slow-2g")) return ConnectionTier::Slow2G;
    if (type == QLatin1String("2g"))      return ConnectionTier::TwoG;
    if (type == QLatin1String("3g"))      return ConnectionTier::ThreeG;
    if (type == QLatin1String("4g"))      return ConnectionTier::FourG;
    if (type == QLatin1String("wifi") || type == QLatin1String("ethernet")) return ConnectionTier::Wifi;
    return ConnectionTier::Unknown;
}

bool isTouchDevice(bool hasCoarsePointer, std::optional<int> viewportWidth) {
    return hasCoarsePointer || (viewportWidth && *viewportWidth < TOUCH_VIEWPORT_MAX_WIDTH);
}

CapabilityProfile buildProfile(const PlatformSignals& platformSignals) {
    CapabilityProfile profile;

    const bool coresKnown = platformSignals.hardwareConcurrency && *platformSignals.hardwareConcurrency > 0;
    if (coresKnown) {
        profile.cores = *platformSignals.hardwareConcurrency;
    }

    if (platformSignals.deviceMemoryGB && *platformSignals.deviceMemoryGB > 0.0) {
        profile.memoryTierGB = *platformSignals.deviceMemoryGB;
    } else if (coresKnown) {
        profile.memoryTierGB = estimateMemoryTier(profile.cores);
    }

    profile.gpuTier = classifyGpu(platformSignals.gpuRenderer, platformSignals.gpuVendor);
    profile.saveData = platformSignals.saveData.value_or(false);
    profile.connectionTier = classifyConnection(platformSignals.effectiveConnectionType, profile.saveData);

    // The tier flags stay at the high-end default until real hardware numbers arrive.
    if (coresKnown || platformSignals.deviceMemoryGB) {
        profile.isLowEnd = profile.cores <= 2 || profile.memoryTierGB <= 2.0;
        profile.isHighEnd = profile.cores >= 6 && profile.memoryTierGB >= 8.0;
    }

    profile.hasTouch = platformSignals.hasTouchSupport.value_or(false);
    profile.isTouchDevice = isTouchDevice(platformSignals.hasCoarsePointer.value_or(false),
                                          platformSignals.viewportWidth);
    return profile;
}

PlatformSignals merge(const PlatformSignals& probed, const PlatformSignals& overrides) {
    PlatformSignals merged = probed;
    overrideIfSet(merged.hardwareConcurrency, overrides.hardwareConcurrency);
    overrideIfSet(merged.deviceMemoryGB, overrides.deviceMemoryGB);
    overrideIfSet(merged.gpuRenderer, overrides.gpuRenderer);
    overrideIfSet(merged.gpuVendor, overrides.gpuVendor);
    overrideIfSet(merged.effectiveConnectionType, overrides.effectiveConnectionType);
    overrideIfSet(merged.saveData, overrides.saveData);
    overrideIfSet(merged.hasTouchSupport, overrides.hasTouchSupport);
    overrideIfSet(merged.hasCoarsePointer, overrides.hasCoarsePointer);
    overrideIfSet(merged.viewportWidth, overrides.viewportWidth);
    return merged;
}

const char* toString(GpuTier tier) {
    switch (tier) {
        case GpuTier::Low:    return "low";
        case GpuTier::Medium: return "medium";
        case GpuTier::High:   return "high";
    }
    return "unknown";
}

const char* toString(ConnectionTier tier) {
    switch (tier) {
        case ConnectionTier::Slow2G:  return "slow-2g";
        case ConnectionTier::TwoG:    return "2g";
        case ConnectionTier::ThreeG:  return "3g";
        case ConnectionTier::FourG:   return "4g";
        case ConnectionTier::Wifi:    return "wifi";
        case ConnectionTier::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace DeviceCapabilities

DeviceCapabilitySampler::DeviceCapabilitySampler(IPlatformProbe& probe, const PlatformSignals& overrides,
                                                 QObject* parent)
    : QObject(parent)
    , m_probe(probe)
    , m_overrides(overrides) {
}

const CapabilityProfile& DeviceCapabilitySampler::sample() {
    m_signals = DeviceCapabilities::merge(m_probe.probe(), m_overrides);
    m_profile = DeviceCapabilities::buildProfile(m_signals);
    m_sampled = true;

    bLog_App("📱 Device profile: cores" << m_profile.cores
             << "memory" << m_profile.memoryTierGB << "GB"
             << "gpu" << DeviceCapabilities::toString(m_profile.gpuTier)
             << "connection" << DeviceCapabilities::toString(m_profile.connectionTier)
             << "touch" << m_profile.isTouchDevice
             << (m_profile.isLowEnd ? "[low-end]" : (m_profile.isHighEnd ? "[high-end]" : "")));

    emit profileChanged(m_profile);
    return m_profile;
}

void DeviceCapabilitySampler::refreshViewport(int viewportWidth, std::optional<bool> hasCoarsePointer) {
    m_signals.viewportWidth = viewportWidth;
    if (hasCoarsePointer) {
        m_signals.hasCoarsePointer = hasCoarsePointer;
    }
    // Configured overrides still win over live readings.
    if (m_overrides.viewportWidth) m_signals.viewportWidth = m_overrides.viewportWidth;
    if (m_overrides.hasCoarsePointer) m_signals.hasCoarsePointer = m_overrides.hasCoarsePointer;

    const bool touch = DeviceCapabilities::isTouchDevice(m_signals.hasCoarsePointer.value_or(false),
                                                         m_signals.viewportWidth);
    if (touch == m_profile.isTouchDevice) return;

    m_profile.isTouchDevice = touch;
    bLog_App("Viewport" << viewportWidth << "px, touch device:" << touch);
    emit profileChanged(m_profile);
}

void DeviceCapabilitySampler::updateConnection(const std::optional<QString>& effectiveType,
                                               std::optional<bool> saveData) {
    if (!m_sampled) return;

    m_signals.effectiveConnectionType = effectiveType;
    m_signals.saveData = saveData;
    if (m_overrides.effectiveConnectionType) m_signals.effectiveConnectionType = m_overrides.effectiveConnectionType;
    if (m_overrides.saveData) m_signals.saveData = m_overrides.saveData;

    const CapabilityProfile updated = DeviceCapabilities::buildProfile(m_signals);
    if (updated == m_profile) return;

    m_profile = updated;
    bLog_App("Connection now" << DeviceCapabilities::toString(m_profile.connectionTier)
             << "saveData" << m_profile.saveData);
    emit profileChanged(m_profile);
}
