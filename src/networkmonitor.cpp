module;
#include <QHostAddress>
#include <QNetworkAddressEntry>
#include <QNetworkInformation>
#include <QNetworkInterface>
#include <QObject>
#include <QString>

module vlesstunnel.core.networkmonitor;

QString NetworkEvent::describe() const
{
    if (const auto *available = get<NetworkAvailable>()) {
        if (available->handle.isNull()) {
            return QStringLiteral("network available");
        }
        return QStringLiteral("network available on %1 (%2)")
            .arg(available->handle.interfaceName, available->handle.localAddress.toString());
    }
    if (get<NetworkLost>()) {
        return QStringLiteral("network lost");
    }
    if (const auto *changed = get<NetworkChanged>()) {
        if (changed->isWifi) {
            return QStringLiteral("network changed to Wi-Fi");
        }
        if (changed->isCellular) {
            return QStringLiteral("network changed to cellular");
        }
        return QStringLiteral("network medium changed");
    }
    return QStringLiteral("network unavailable");
}

NetworkMonitor::NetworkMonitor(QObject *parent)
    : QObject(parent)
{
}

SystemNetworkMonitor::SystemNetworkMonitor(QObject *parent)
    : NetworkMonitor(parent)
{
}

bool SystemNetworkMonitor::start(QString *errorMessage)
{
    if (!QNetworkInformation::loadDefaultBackend()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No network information backend is available on this platform.");
        }
        return false;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    if (!info) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Network information backend failed to initialize.");
        }
        return false;
    }

    connect(info, &QNetworkInformation::reachabilityChanged, this, &SystemNetworkMonitor::onReachabilityChanged);
    if (info->supports(QNetworkInformation::Feature::TransportMedium)) {
        connect(info, &QNetworkInformation::transportMediumChanged, this, &SystemNetworkMonitor::onTransportMediumChanged);
    }

    return true;
}

void SystemNetworkMonitor::setPreferredInterface(const QString& name)
{
    m_preferredInterface = name.trimmed();
}

NetworkHandle SystemNetworkMonitor::handleForInterface(const QString& name)
{
    NetworkHandle handle;
    if (name.trimmed().isEmpty()) {
        return handle;
    }

    const QNetworkInterface iface = QNetworkInterface::interfaceFromName(name.trimmed());
    if (!iface.isValid()) {
        return handle;
    }

    const auto flags = iface.flags();
    if (!flags.testFlag(QNetworkInterface::IsUp) || !flags.testFlag(QNetworkInterface::IsRunning)) {
        return handle;
    }

    QHostAddress fallback;
    const QList<QNetworkAddressEntry> entries = iface.addressEntries();
    for (const QNetworkAddressEntry& entry : entries) {
        const QHostAddress address = entry.ip();
        if (address.protocol() == QAbstractSocket::IPv4Protocol) {
            handle.interfaceName = iface.name();
            handle.localAddress = address;
            return handle;
        }
        if (fallback.isNull() && address.protocol() == QAbstractSocket::IPv6Protocol && !address.isLinkLocal()) {
            fallback = address;
        }
    }

    if (!fallback.isNull()) {
        handle.interfaceName = iface.name();
        handle.localAddress = fallback;
    }
    return handle;
}

void SystemNetworkMonitor::onReachabilityChanged(QNetworkInformation::Reachability reachability)
{
    switch (reachability) {
    case QNetworkInformation::Reachability::Online:
        emit networkEvent(NetworkEvent(NetworkAvailable{handleForInterface(m_preferredInterface)}));
        break;
    case QNetworkInformation::Reachability::Disconnected:
        emit networkEvent(NetworkEvent(NetworkUnavailable{}));
        break;
    case QNetworkInformation::Reachability::Local:
    case QNetworkInformation::Reachability::Site:
        emit networkEvent(NetworkEvent(NetworkLost{}));
        break;
    case QNetworkInformation::Reachability::Unknown:
        break;
    }
}

void SystemNetworkMonitor::onTransportMediumChanged(QNetworkInformation::TransportMedium medium)
{
    NetworkChanged changed;
    changed.isWifi = medium == QNetworkInformation::TransportMedium::WiFi;
    changed.isCellular = medium == QNetworkInformation::TransportMedium::Cellular;
    emit networkEvent(NetworkEvent(changed));
}
