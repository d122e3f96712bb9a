#include "adaptive/NetworkStatus.hpp"
#include "adaptive/DeviceCapabilities.hpp"
#include "BeaconLogging.hpp"

namespace NetworkHints {

std::optional<QString> effectiveConnectionType(const NetworkSnapshot& snapshot) {
    switch (snapshot.transport) {
        case NetworkTransport::Ethernet:
        case NetworkTransport::WiFi:
            return QStringLiteral("wifi");
        case NetworkTransport::Cellular:
        case NetworkTransport::Bluetooth:
        case NetworkTransport::Unknown:
            break;
    }
    return std::nullopt;
}

const char* toString(NetworkTransport transport) {
    switch (transport) {
        case NetworkTransport::Ethernet:  return "ethernet";
        case NetworkTransport::WiFi:      return "wifi";
        case NetworkTransport::Cellular:  return "cellular";
        case NetworkTransport::Bluetooth: return "bluetooth";
        case NetworkTransport::Unknown:   break;
    }
    return "unknown";
}

} // namespace NetworkHints

NetworkStatus::NetworkStatus(QObject* parent)
    : QObject(parent) {
}

void NetworkStatus::update(const NetworkSnapshot& snapshot) {
    const bool first = !m_hasSnapshot;
    const NetworkSnapshot previous = m_snapshot;
    m_snapshot = snapshot;
    m_hasSnapshot = true;

    if (first || isOnline() != previous.online.value_or(true)) {
        bLog_App("🌐 Network" << (isOnline() ? "online" : "offline"));
        emit onlineChanged(isOnline());
    }
    if (first || snapshot.transport != previous.transport || snapshot.metered != previous.metered) {
        bLog_App("Network transport" << NetworkHints::toString(snapshot.transport)
                 << "metered" << snapshot.metered.value_or(false));
        pushHints();
        emit connectionChanged(m_snapshot);
    }
}

bool NetworkStatus::isSlowConnection() const {
    const ConnectionTier tier = DeviceCapabilities::classifyConnection(
        NetworkHints::effectiveConnectionType(m_snapshot), m_snapshot.metered.value_or(false));
    return tier == ConnectionTier::Slow2G || tier == ConnectionTier::TwoG || tier == ConnectionTier::ThreeG;
}

void NetworkStatus::attachCapabilitySampler(DeviceCapabilitySampler* sampler) {
    m_sampler = sampler;
    if (m_hasSnapshot) pushHints();
}

void NetworkStatus::pushHints() {
    if (!m_sampler) return;
    m_sampler->updateConnection(NetworkHints::effectiveConnectionType(m_snapshot), m_snapshot.metered);
}
