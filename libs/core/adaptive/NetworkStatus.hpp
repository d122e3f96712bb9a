/*
Beacon — NetworkStatus
Role: Live view of connectivity: online/offline, transport medium and metering.
Inputs/Outputs: NetworkSnapshot updates in (QtNetworkMonitor in the gui layer, or tests);
      onlineChanged/connectionChanged out, and connection hints pushed into an attached
      DeviceCapabilitySampler.
Threading: GUI thread.
Related: DeviceCapabilities.hpp, QtNetworkMonitor.hpp.
*/
#pragma once

#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QString>
#include <optional>

class DeviceCapabilitySampler;

enum class NetworkTransport {
    Unknown,
    Ethernet,
    WiFi,
    Cellular,
    Bluetooth
};

struct NetworkSnapshot {
    std::optional<bool> online;      // nullopt: reachability not reported
    NetworkTransport transport = NetworkTransport::Unknown;
    std::optional<bool> metered;

    bool operator==(const NetworkSnapshot& other) const = default;
};

Q_DECLARE_METATYPE(NetworkSnapshot)

namespace NetworkHints {

// Qt reports the medium, not an effective speed class. Only fixed-line media map onto a
// tier; everything else stays unknown.
std::optional<QString> effectiveConnectionType(const NetworkSnapshot& snapshot);

const char* toString(NetworkTransport transport);

} // namespace NetworkHints

class NetworkStatus : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool online READ isOnline NOTIFY onlineChanged)
    Q_PROPERTY(bool slowConnection READ isSlowConnection NOTIFY connectionChanged)

public:
    explicit NetworkStatus(QObject* parent = nullptr);

    void update(const NetworkSnapshot& snapshot);
    const NetworkSnapshot& snapshot() const { return m_snapshot; }

    // Unknown reachability counts as online.
    bool isOnline() const { return m_snapshot.online.value_or(true); }
    bool isSlowConnection() const;

    // Pushes the current hints now and on every connection change.
    void attachCapabilitySampler(DeviceCapabilitySampler* sampler);

signals:
    void onlineChanged(bool online);
    void connectionChanged(const NetworkSnapshot& snapshot);

private:
    void pushHints();

    NetworkSnapshot m_snapshot;
    bool m_hasSnapshot = false;
    QPointer<DeviceCapabilitySampler> m_sampler;
};
