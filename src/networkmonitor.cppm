/*!
 * @file        networkmonitor.cppm
 * @brief       Host network availability events.
 *
 * @details
 * Defines the network handle that transports may bind to, the
 * `NetworkEvent` sum type, the abstract `NetworkMonitor` signal source and
 * `SystemNetworkMonitor`, which maps `QNetworkInformation` reachability
 * and transport-medium changes into events.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QHostAddress>
#include <QNetworkInformation>
#include <QObject>
#include <QString>

#include <type_traits>
#include <utility>
#include <variant>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.networkmonitor;
#endif

#ifdef Q_MOC_RUN
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @struct NetworkHandle
 * @brief Local interface a transport socket should be bound to.
 *
 * @details
 * A null handle means the operating system default route is used.
 */
VLESSTUNNEL_MODULE_EXPORT struct NetworkHandle {
    QString interfaceName;      //!< Interface name, for logs.
    QHostAddress localAddress;  //!< Address the socket binds to before connecting.

    /**
     * @brief Whether no binding is requested.
     * @return True when `localAddress` is null.
     */
    bool isNull() const
    {
        return localAddress.isNull();
    }

    bool operator==(const NetworkHandle& other) const
    {
        return interfaceName == other.interfaceName && localAddress == other.localAddress;
    }
};

//! A usable network appeared.
VLESSTUNNEL_MODULE_EXPORT struct NetworkAvailable {
    NetworkHandle handle;
};

//! The network in use was lost.
VLESSTUNNEL_MODULE_EXPORT struct NetworkLost {
};

//! The medium of the current network changed.
VLESSTUNNEL_MODULE_EXPORT struct NetworkChanged {
    bool isWifi = false;
    bool isCellular = false;
};

//! No network is reachable.
VLESSTUNNEL_MODULE_EXPORT struct NetworkUnavailable {
};

/**
 * @class NetworkEvent
 * @brief Tagged union of network notifications.
 */
VLESSTUNNEL_MODULE_EXPORT class NetworkEvent
{
public:
    using Value = std::variant<NetworkAvailable, NetworkLost, NetworkChanged, NetworkUnavailable>;

    NetworkEvent() = default;

    /**
     * @brief Wrap one notification.
     * @param value Event alternative.
     */
    template<class T>
        requires std::is_constructible_v<Value, T&&>
    NetworkEvent(T&& value)
        : m_value(std::forward<T>(value))
    {
    }

    /**
     * @brief Access the alternative when it is of type `T`.
     * @return Pointer to the event or nullptr.
     */
    template<class T>
    const T *get() const
    {
        return std::get_if<T>(&m_value);
    }

    /**
     * @brief Whether the event reports connectivity loss.
     * @return True for `NetworkLost` and `NetworkUnavailable`.
     */
    bool isLoss() const
    {
        return get<NetworkLost>() != nullptr || get<NetworkUnavailable>() != nullptr;
    }

    /**
     * @brief One-line description for logs.
     * @return Event text.
     */
    QString describe() const;

private:
    Value m_value = NetworkUnavailable{};
};

/**
 * @class NetworkMonitor
 * @brief Source of host network events.
 */
VLESSTUNNEL_MODULE_EXPORT class NetworkMonitor : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct monitor.
     * @param parent Optional QObject parent.
     */
    explicit NetworkMonitor(QObject *parent = nullptr);

    /**
     * @brief Begin delivering events.
     * @param errorMessage Optional output message on failure.
     * @return True when monitoring is active.
     */
    virtual bool start(QString *errorMessage = nullptr) = 0;

signals:
    //! Emitted for each network notification.
    void networkEvent(const NetworkEvent& event);
};

/**
 * @class SystemNetworkMonitor
 * @brief `QNetworkInformation` backed network monitor.
 *
 * @details
 * Reachability `Online` maps to `NetworkAvailable`, `Disconnected` to
 * `NetworkUnavailable`, `Local`/`Site` to `NetworkLost`. Transport medium
 * changes map to `NetworkChanged`. A handle is attached only when a
 * preferred interface is configured.
 */
VLESSTUNNEL_MODULE_EXPORT class SystemNetworkMonitor : public NetworkMonitor
{
    Q_OBJECT

public:
    /**
     * @brief Construct monitor.
     * @param parent Optional QObject parent.
     */
    explicit SystemNetworkMonitor(QObject *parent = nullptr);

    /**
     * @brief Load the platform backend and subscribe to changes.
     * @param errorMessage Optional output message on failure.
     * @return True when a backend is available.
     */
    bool start(QString *errorMessage = nullptr) override;

    /**
     * @brief Interface whose address is reported in `NetworkAvailable`.
     * @param name Interface name, empty for the default route.
     */
    void setPreferredInterface(const QString& name);

    /**
     * @brief Resolve a handle for an interface.
     * @param name Interface name.
     * @return Handle with the first IPv4 (or IPv6) address of an up interface, null otherwise.
     */
    static NetworkHandle handleForInterface(const QString& name);

private slots:
    //! Handle reachability change from the backend.
    void onReachabilityChanged(QNetworkInformation::Reachability reachability);
    //! Handle transport medium change from the backend.
    void onTransportMediumChanged(QNetworkInformation::TransportMedium medium);

private:
    QString m_preferredInterface; //!< Interface to bind to, empty for default route.
};

#include "networkmonitor.moc"
