/*
Beacon — DeviceCapabilities Tests
Role: Verify the capability heuristics and the sampler's override and viewport handling
Testing Strategy: Pure helpers with literal inputs; sampler driven by FakePlatformProbe
*/
#include <gtest/gtest.h>
#include <QSignalSpy>
#include "adaptive/DeviceCapabilities.hpp"
#include "../fixtures/fake_platform_probe.hpp"

using namespace DeviceCapabilities;

// =============================================================================
// Heuristics
// =============================================================================

TEST(DeviceCapabilities, MemoryLadderFromCores) {
    EXPECT_DOUBLE_EQ(estimateMemoryTier(1), 2.0);
    EXPECT_DOUBLE_EQ(estimateMemoryTier(2), 2.0);
    EXPECT_DOUBLE_EQ(estimateMemoryTier(3), 4.0);
    EXPECT_DOUBLE_EQ(estimateMemoryTier(4), 4.0);
    EXPECT_DOUBLE_EQ(estimateMemoryTier(8), 8.0);
    EXPECT_DOUBLE_EQ(estimateMemoryTier(12), 16.0);
}

TEST(DeviceCapabilities, GpuTierFromRenderer) {
    EXPECT_EQ(classifyGpu(std::nullopt, std::nullopt), GpuTier::High);
    EXPECT_EQ(classifyGpu(QString(), std::nullopt), GpuTier::High);

    EXPECT_EQ(classifyGpu(QStringLiteral("Mali-400 MP"), std::nullopt), GpuTier::Low);
    EXPECT_EQ(classifyGpu(QStringLiteral("PowerVR SGX 544MP"), std::nullopt), GpuTier::Low);
    EXPECT_EQ(classifyGpu(QStringLiteral("NVIDIA GeForce RTX 3070/PCIe/SSE2"), std::nullopt), GpuTier::High);
    EXPECT_EQ(classifyGpu(QStringLiteral("Adreno 630"), std::nullopt), GpuTier::High);
    EXPECT_EQ(classifyGpu(QStringLiteral("Apple A15 GPU"), std::nullopt), GpuTier::High);

    EXPECT_EQ(classifyGpu(QStringLiteral("Mesa Intel(R) UHD Graphics 620 (KBL GT2)"), std::nullopt), GpuTier::Medium);
}

TEST(DeviceCapabilities, GpuVendorCanPromoteToHigh) {
    EXPECT_EQ(classifyGpu(QStringLiteral("Quadro P400"), QStringLiteral("NVIDIA Corporation")), GpuTier::High);
    EXPECT_EQ(classifyGpu(QStringLiteral("llvmpipe (LLVM 15.0.6, 256 bits)"), QStringLiteral("Mesa")), GpuTier::Medium);
}

TEST(DeviceCapabilities, ConnectionTier) {
    EXPECT_EQ(classifyConnection(std::nullopt, false), ConnectionTier::Unknown);
    EXPECT_EQ(classifyConnection(QStringLiteral("slow-2g"), false), ConnectionTier::Slow2G);
    EXPECT_EQ(classifyConnection(QStringLiteral("2g"), false), ConnectionTier::TwoG);
    EXPECT_EQ(classifyConnection(QStringLiteral("3G"), false), ConnectionTier::ThreeG);
    EXPECT_EQ(classifyConnection(QStringLiteral("4g"), false), ConnectionTier::FourG);
    EXPECT_EQ(classifyConnection(QStringLiteral("wifi"), false), ConnectionTier::Wifi);
    EXPECT_EQ(classifyConnection(QStringLiteral("5g"), false), ConnectionTier::Unknown);

    // saveData wins over whatever the link reports
    EXPECT_EQ(classifyConnection(QStringLiteral("wifi"), true), ConnectionTier::Slow2G);
}

TEST(DeviceCapabilities, TouchDeviceRule) {
    EXPECT_TRUE(isTouchDevice(true, 1920));
    EXPECT_TRUE(isTouchDevice(false, 1023));
    EXPECT_FALSE(isTouchDevice(false, 1024));
    EXPECT_FALSE(isTouchDevice(false, std::nullopt));
}

// =============================================================================
// Profile
// =============================================================================

TEST(DeviceCapabilities, AbsentSignalsGiveHighEndDefaults) {
    const CapabilityProfile profile = buildProfile(PlatformSignals{});

    EXPECT_EQ(profile.cores, 4);
    EXPECT_DOUBLE_EQ(profile.memoryTierGB, 8.0);
    EXPECT_EQ(profile.gpuTier, GpuTier::High);
    EXPECT_EQ(profile.connectionTier, ConnectionTier::Unknown);
    EXPECT_FALSE(profile.saveData);
    EXPECT_TRUE(profile.isHighEnd);
    EXPECT_FALSE(profile.isLowEnd);
    EXPECT_FALSE(profile.isTouchDevice);
    EXPECT_FALSE(profile.isSlowConnection());
}

TEST(DeviceCapabilities, DualCoreWithoutMemoryReadingIsLowEnd) {
    PlatformSignals in;
    in.hardwareConcurrency = 2;

    const CapabilityProfile profile = buildProfile(in);
    EXPECT_DOUBLE_EQ(profile.memoryTierGB, 2.0);
    EXPECT_TRUE(profile.isLowEnd);
    EXPECT_FALSE(profile.isHighEnd);
}

TEST(DeviceCapabilities, DirectMemoryReadingWins) {
    PlatformSignals in;
    in.hardwareConcurrency = 8;
    in.deviceMemoryGB = 31.2;

    const CapabilityProfile profile = buildProfile(in);
    EXPECT_DOUBLE_EQ(profile.memoryTierGB, 31.2);
    EXPECT_TRUE(profile.isHighEnd);
}

TEST(DeviceCapabilities, MidRangeIsNeitherLowNorHigh) {
    PlatformSignals in;
    in.hardwareConcurrency = 4;

    const CapabilityProfile profile = buildProfile(in);
    EXPECT_DOUBLE_EQ(profile.memoryTierGB, 4.0);
    EXPECT_FALSE(profile.isLowEnd);
    EXPECT_FALSE(profile.isHighEnd);
}

TEST(DeviceCapabilities, SlowConnectionFlag) {
    PlatformSignals in;
    in.effectiveConnectionType = QStringLiteral("3g");
    EXPECT_TRUE(buildProfile(in).isSlowConnection());

    in.effectiveConnectionType = QStringLiteral("4g");
    EXPECT_FALSE(buildProfile(in).isSlowConnection());

    in.saveData = true;
    EXPECT_TRUE(buildProfile(in).isSlowConnection());
}

TEST(DeviceCapabilities, MergeOnlyReplacesSetFields) {
    PlatformSignals probed;
    probed.hardwareConcurrency = 16;
    probed.gpuRenderer = QStringLiteral("Radeon RX 6800");
    probed.viewportWidth = 2560;

    PlatformSignals overrides;
    overrides.hardwareConcurrency = 2;
    overrides.effectiveConnectionType = QStringLiteral("2g");

    const PlatformSignals merged = merge(probed, overrides);
    EXPECT_EQ(merged.hardwareConcurrency, 2);
    EXPECT_EQ(merged.gpuRenderer, QStringLiteral("Radeon RX 6800"));
    EXPECT_EQ(merged.viewportWidth, 2560);
    EXPECT_EQ(merged.effectiveConnectionType, QStringLiteral("2g"));
}

// =============================================================================
// Sampler
// =============================================================================

TEST(DeviceCapabilitySampler, SampleAppliesOverrides) {
    PlatformSignals probed;
    probed.hardwareConcurrency = 12;
    probed.deviceMemoryGB = 32.0;
    FakePlatformProbe probe(probed);

    PlatformSignals overrides;
    overrides.hardwareConcurrency = 2;
    overrides.deviceMemoryGB = 2.0;

    DeviceCapabilitySampler sampler(probe, overrides);
    QSignalSpy changedSpy(&sampler, &DeviceCapabilitySampler::profileChanged);
    EXPECT_FALSE(sampler.hasSampled());

    const CapabilityProfile& profile = sampler.sample();
    EXPECT_EQ(probe.probeCount(), 1);
    EXPECT_TRUE(sampler.hasSampled());
    EXPECT_EQ(profile.cores, 2);
    EXPECT_TRUE(profile.isLowEnd);
    EXPECT_EQ(changedSpy.count(), 1);
}

TEST(DeviceCapabilitySampler, ViewportResizeReclassifiesTouch) {
    PlatformSignals probed;
    probed.viewportWidth = 1920;
    FakePlatformProbe probe(probed);
    DeviceCapabilitySampler sampler(probe);
    sampler.sample();
    ASSERT_FALSE(sampler.profile().isTouchDevice);

    QSignalSpy changedSpy(&sampler, &DeviceCapabilitySampler::profileChanged);

    sampler.refreshViewport(800);
    EXPECT_TRUE(sampler.profile().isTouchDevice);
    EXPECT_EQ(changedSpy.count(), 1);

    sampler.refreshViewport(900);   // still narrow, no change
    EXPECT_EQ(changedSpy.count(), 1);

    sampler.refreshViewport(1400);
    EXPECT_FALSE(sampler.profile().isTouchDevice);
    EXPECT_EQ(changedSpy.count(), 2);

    sampler.refreshViewport(1400, true);
    EXPECT_TRUE(sampler.profile().isTouchDevice);
    EXPECT_EQ(probe.probeCount(), 1);
}

TEST(DeviceCapabilitySampler, ConfiguredViewportOverrideWins) {
    FakePlatformProbe probe;
    PlatformSignals overrides;
    overrides.viewportWidth = 600;

    DeviceCapabilitySampler sampler(probe, overrides);
    sampler.sample();
    EXPECT_TRUE(sampler.profile().isTouchDevice);

    sampler.refreshViewport(1920);
    EXPECT_TRUE(sampler.profile().isTouchDevice);
}
