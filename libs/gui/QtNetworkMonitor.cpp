#include "QtNetworkMonitor.hpp"
#include "BeaconLogging.hpp"
#include <QNetworkInformation>

QtNetworkMonitor::QtNetworkMonitor(NetworkStatus& status, QObject* parent)
    : QObject(parent)
    , m_status(status) {
}

bool QtNetworkMonitor::start() {
    if (m_info) return true;

    if (!QNetworkInformation::loadDefaultBackend() || !QNetworkInformation::instance()) {
        bLog_App("QtNetworkMonitor: no network information backend");
        return false;
    }
    m_info = QNetworkInformation::instance();

    connect(m_info, &QNetworkInformation::reachabilityChanged, this, &QtNetworkMonitor::refresh);
    connect(m_info, &QNetworkInformation::transportMediumChanged, this, &QtNetworkMonitor::refresh);
    connect(m_info, &QNetworkInformation::isMeteredChanged, this, &QtNetworkMonitor::refresh);

    bLog_App("QtNetworkMonitor using backend" << m_info->backendName());
    refresh();
    return true;
}

NetworkSnapshot QtNetworkMonitor::readSnapshot(const QNetworkInformation& info) {
    NetworkSnapshot snapshot;

    if (info.supports(QNetworkInformation::Feature::Reachability)) {
        switch (info.reachability()) {
            case QNetworkInformation::Reachability::Unknown:
                break;
            case QNetworkInformation::Reachability::Disconnected:
                snapshot.online = false;
                break;
            case QNetworkInformation::Reachability::Local:
            case QNetworkInformation::Reachability::Site:
            case QNetworkInformation::Reachability::Online:
                snapshot.online = true;
                break;
        }
    }

    if (info.supports(QNetworkInformation::Feature::TransportMedium)) {
        switch (info.transportMedium()) {
            case QNetworkInformation::TransportMedium::Ethernet:  snapshot.transport = NetworkTransport::Ethernet; break;
            case QNetworkInformation::TransportMedium::WiFi:      snapshot.transport = NetworkTransport::WiFi; break;
            case QNetworkInformation::TransportMedium::Cellular:  snapshot.transport = NetworkTransport::Cellular; break;
            case QNetworkInformation::TransportMedium::Bluetooth: snapshot.transport = NetworkTransport::Bluetooth; break;
            default: break;
        }
    }

    if (info.supports(QNetworkInformation::Feature::Metered)) {
        snapshot.metered = info.isMetered();
    }
    return snapshot;
}

void QtNetworkMonitor::refresh() {
    if (!m_info) return;
    m_status.update(readSnapshot(*m_info));
}
