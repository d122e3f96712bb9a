/*
Beacon — NetworkStatus Tests
Role: Verify online/connection change signals and the hints pushed into the capability profile
*/
#include <gtest/gtest.h>
#include <QSignalSpy>
#include "adaptive/DeviceCapabilities.hpp"
#include "adaptive/NetworkStatus.hpp"
#include "../fixtures/fake_platform_probe.hpp"

namespace {

NetworkSnapshot snapshot(std::optional<bool> online, NetworkTransport transport, std::optional<bool> metered) {
    NetworkSnapshot s;
    s.online = online;
    s.transport = transport;
    s.metered = metered;
    return s;
}

} // namespace

class NetworkStatusTest : public ::testing::Test {
protected:
    NetworkStatus status;
};

TEST_F(NetworkStatusTest, UnknownReachabilityCountsAsOnline) {
    EXPECT_TRUE(status.isOnline());
    EXPECT_FALSE(status.isSlowConnection());
}

TEST_F(NetworkStatusTest, OnlineChangesAreSignalledOnce) {
    QSignalSpy onlineSpy(&status, &NetworkStatus::onlineChanged);

    status.update(snapshot(true, NetworkTransport::WiFi, false));
    status.update(snapshot(true, NetworkTransport::WiFi, false));
    status.update(snapshot(false, NetworkTransport::WiFi, false));

    ASSERT_EQ(onlineSpy.count(), 2);
    EXPECT_TRUE(onlineSpy.at(0).at(0).toBool());
    EXPECT_FALSE(onlineSpy.at(1).at(0).toBool());
    EXPECT_FALSE(status.isOnline());
}

TEST_F(NetworkStatusTest, ConnectionChangesOnlyOnTransportOrMetering) {
    QSignalSpy connectionSpy(&status, &NetworkStatus::connectionChanged);

    status.update(snapshot(true, NetworkTransport::Ethernet, false));
    status.update(snapshot(false, NetworkTransport::Ethernet, false));
    EXPECT_EQ(connectionSpy.count(), 1);

    status.update(snapshot(false, NetworkTransport::Cellular, false));
    status.update(snapshot(false, NetworkTransport::Cellular, true));
    EXPECT_EQ(connectionSpy.count(), 3);
    EXPECT_TRUE(status.isSlowConnection());
}

TEST_F(NetworkStatusTest, HintsMapFixedLineMediaToWifi) {
    EXPECT_EQ(NetworkHints::effectiveConnectionType(snapshot(true, NetworkTransport::Ethernet, {})),
              QStringLiteral("wifi"));
    EXPECT_EQ(NetworkHints::effectiveConnectionType(snapshot(true, NetworkTransport::WiFi, {})),
              QStringLiteral("wifi"));
    EXPECT_FALSE(NetworkHints::effectiveConnectionType(snapshot(true, NetworkTransport::Cellular, {})).has_value());
    EXPECT_FALSE(NetworkHints::effectiveConnectionType(NetworkSnapshot{}).has_value());
}

TEST_F(NetworkStatusTest, FeedsConnectionIntoCapabilityProfile) {
    PlatformSignals probed;
    probed.hardwareConcurrency = 8;
    FakePlatformProbe probe(probed);
    DeviceCapabilitySampler capabilities(probe);
    capabilities.sample();
    ASSERT_EQ(capabilities.profile().connectionTier, ConnectionTier::Unknown);

    QSignalSpy profileSpy(&capabilities, &DeviceCapabilitySampler::profileChanged);
    status.attachCapabilitySampler(&capabilities);
    EXPECT_EQ(profileSpy.count(), 0);

    status.update(snapshot(true, NetworkTransport::WiFi, false));
    EXPECT_EQ(capabilities.profile().connectionTier, ConnectionTier::Wifi);
    EXPECT_EQ(profileSpy.count(), 1);

    // Switching to a metered cellular link forces the slowest tier
    status.update(snapshot(true, NetworkTransport::Cellular, true));
    EXPECT_EQ(capabilities.profile().connectionTier, ConnectionTier::Slow2G);
    EXPECT_TRUE(capabilities.profile().saveData);
    EXPECT_EQ(profileSpy.count(), 2);

    // Going offline alone does not touch the profile
    status.update(snapshot(false, NetworkTransport::Cellular, true));
    EXPECT_EQ(profileSpy.count(), 2);
    EXPECT_EQ(capabilities.profile().cores, 8);
}

TEST_F(NetworkStatusTest, ConfiguredConnectionOverridesLiveUpdates) {
    PlatformSignals overrides;
    overrides.effectiveConnectionType = QStringLiteral("3g");
    FakePlatformProbe probe;
    DeviceCapabilitySampler capabilities(probe, overrides);
    capabilities.sample();
    status.attachCapabilitySampler(&capabilities);

    status.update(snapshot(true, NetworkTransport::Ethernet, false));
    EXPECT_EQ(capabilities.profile().connectionTier, ConnectionTier::ThreeG);
}

TEST_F(NetworkStatusTest, UpdatesBeforeFirstSampleAreIgnored) {
    FakePlatformProbe probe;
    DeviceCapabilitySampler capabilities(probe);
    status.attachCapabilitySampler(&capabilities);

    status.update(snapshot(true, NetworkTransport::WiFi, false));
    EXPECT_FALSE(capabilities.hasSampled());
    EXPECT_EQ(capabilities.profile().connectionTier, ConnectionTier::Unknown);
}
