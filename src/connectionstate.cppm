/*!
 * @file        connectionstate.cppm
 * @brief       Connection lifecycle state exports for VlessTunnel.
 *
 * @details
 * Provides the canonical connection phase enum used across core modules,
 * the tagged `ConnectionState` value published by the connection manager,
 * and the traffic statistics carried by the connected state. The phase
 * enum is registered with the Qt meta-object system so it can travel
 * through properties and signals.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QObject>
#include <QString>
#include <QtTypes>

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.connectionstate;
#endif

namespace Tunnel {
Q_NAMESPACE

/**
 * @enum ConnectionPhase
 * @brief High-level tunnel lifecycle phase.
 *
 * @details
 * Flat projection of `ConnectionState` used for properties, logging and
 * quick comparisons.
 */
enum class ConnectionPhase
{
    Disconnected,  //!< No session exists.
    Connecting,    //!< Transport and handshake are in progress.
    Connected,     //!< Handshake completed, payload flows.
    Disconnecting, //!< Session teardown is in progress.
    Error          //!< Last attempt or session failed.
};

Q_ENUM_NS(ConnectionPhase)

} // namespace Tunnel

#ifndef Q_MOC_RUN

//! Convenience alias exported from the internal Tunnel namespace.
export using ConnectionPhase = Tunnel::ConnectionPhase;

/**
 * @brief Return Qt meta-object for the `Tunnel` namespace.
 * @return Namespace meta-object containing exported enums.
 */
export const QMetaObject& connectionPhaseMetaObject()
{
    return Tunnel::staticMetaObject;
}

/**
 * @brief Readable name of a connection phase.
 * @param phase Phase value.
 * @return Phase name as used in logs.
 */
export QString connectionPhaseName(ConnectionPhase phase)
{
    switch (phase) {
    case ConnectionPhase::Disconnected:
        return QStringLiteral("Disconnected");
    case ConnectionPhase::Connecting:
        return QStringLiteral("Connecting");
    case ConnectionPhase::Connected:
        return QStringLiteral("Connected");
    case ConnectionPhase::Disconnecting:
        return QStringLiteral("Disconnecting");
    case ConnectionPhase::Error:
        return QStringLiteral("Error");
    }
    return QStringLiteral("Unknown");
}

/**
 * @struct ConnectionStatistics
 * @brief Traffic snapshot of the active session.
 *
 * @details
 * Byte counters are monotonic for the lifetime of one session. Rates are
 * derived from counter deltas on the manager's sampling cadence.
 */
export struct ConnectionStatistics {
    quint64 bytesReceived = 0;             //!< Payload bytes received from the server.
    quint64 bytesSent = 0;                 //!< Payload bytes forwarded to the server.
    quint64 downloadRateBps = 0;           //!< Download rate in bytes per second.
    quint64 uploadRateBps = 0;             //!< Upload rate in bytes per second.
    QDateTime connectedSince;              //!< Time the handshake completed.
    std::optional<qint64> lastRoundtripMs; //!< Handshake round trip, when measured.

    bool operator==(const ConnectionStatistics& other) const = default;
};

//! No session exists.
export struct DisconnectedState {
    bool operator==(const DisconnectedState&) const = default;
};

//! A connect attempt for `profileId` is running.
export struct ConnectingState {
    QString profileId;

    bool operator==(const ConnectingState&) const = default;
};

//! A session for `profileId` is established.
export struct ConnectedState {
    QString profileId;
    ConnectionStatistics statistics;

    bool operator==(const ConnectedState&) const = default;
};

//! The active session is being torn down.
export struct DisconnectingState {
    bool operator==(const DisconnectingState&) const = default;
};

/**
 * @struct ErrorState
 * @brief Failure with a sanitized reason.
 *
 * @details
 * `recoverable` is true for transport and protocol failures that the
 * reconnect supervisor may retry, false for profile, vault and
 * configuration failures.
 */
export struct ErrorState {
    QString reason;
    bool recoverable = true;

    bool operator==(const ErrorState&) const = default;
};

/**
 * @brief Helper combining several lambdas into one visitor.
 */
export template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

export template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/**
 * @class ConnectionState
 * @brief Tagged union over the tunnel lifecycle states.
 *
 * @details
 * Exactly one state is held at a time. Consumers branch with `match()`,
 * so adding a new state breaks every exhaustive visitor at compile time.
 */
export class ConnectionState
{
public:
    using Value = std::variant<DisconnectedState, ConnectingState, ConnectedState, DisconnectingState, ErrorState>;

    ConnectionState() = default;

    /**
     * @brief Wrap one concrete state.
     * @param value State value.
     */
    template<class T>
        requires std::is_constructible_v<Value, T&&>
    ConnectionState(T&& value)
        : m_value(std::forward<T>(value))
    {
    }

    /**
     * @brief Flat phase of the held state.
     * @return Phase enum value.
     */
    ConnectionPhase phase() const
    {
        return match(
            [](const DisconnectedState&) { return ConnectionPhase::Disconnected; },
            [](const ConnectingState&) { return ConnectionPhase::Connecting; },
            [](const ConnectedState&) { return ConnectionPhase::Connected; },
            [](const DisconnectingState&) { return ConnectionPhase::Disconnecting; },
            [](const ErrorState&) { return ConnectionPhase::Error; });
    }

    /**
     * @brief Visit the held state with one handler per alternative.
     * @param handlers Callables, one per state type.
     * @return Result of the selected handler.
     */
    template<class... Handlers>
    decltype(auto) match(Handlers&&... handlers) const
    {
        return std::visit(Overloaded{std::forward<Handlers>(handlers)...}, m_value);
    }

    /**
     * @brief Access the held state when it is of type `T`.
     * @return Pointer to the state or nullptr.
     */
    template<class T>
    const T *get() const
    {
        return std::get_if<T>(&m_value);
    }

    /**
     * @brief Mutable access used by the owner to refresh statistics.
     * @return Pointer to the state or nullptr.
     */
    template<class T>
    T *get()
    {
        return std::get_if<T>(&m_value);
    }

    /**
     * @brief Underlying variant.
     * @return Held value.
     */
    const Value& value() const
    {
        return m_value;
    }

    /**
     * @brief One-line description for logs.
     * @return Phase name, with profile or reason when present.
     */
    QString describe() const
    {
        return match(
            [](const DisconnectedState&) { return QStringLiteral("Disconnected"); },
            [](const ConnectingState& state) { return QStringLiteral("Connecting (%1)").arg(state.profileId); },
            [](const ConnectedState& state) { return QStringLiteral("Connected (%1)").arg(state.profileId); },
            [](const DisconnectingState&) { return QStringLiteral("Disconnecting"); },
            [](const ErrorState& state) {
                return QStringLiteral("Error: %1%2")
                    .arg(state.reason, state.recoverable ? QString() : QStringLiteral(" (not recoverable)"));
            });
    }

    bool operator==(const ConnectionState& other) const = default;

private:
    Value m_value = DisconnectedState{};
};
#endif

#include "connectionstate.moc"
