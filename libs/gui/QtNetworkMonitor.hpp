#pragma once

#include "adaptive/NetworkStatus.hpp"
#include <QObject>
#include <QPointer>

class QNetworkInformation;

/**
 * Follows QNetworkInformation and feeds NetworkStatus: reachability, transport medium
 * and metering are re-read on each of their change signals.
 *
 * start() loads the platform's default backend; without one the status keeps its
 * unknown snapshot.
 */
class QtNetworkMonitor : public QObject {
    Q_OBJECT

public:
    explicit QtNetworkMonitor(NetworkStatus& status, QObject* parent = nullptr);

    bool start();
    bool isActive() const { return !m_info.isNull(); }

    static NetworkSnapshot readSnapshot(const QNetworkInformation& info);

private slots:
    void refresh();

private:
    NetworkStatus& m_status;
    QPointer<QNetworkInformation> m_info;
};
