/*!
 * @file        serverprofile.cppm
 * @brief       Server profile data model for VlessTunnel.
 *
 * @details
 * Defines the endpoint, destination, flow and transport configuration
 * value types that describe one tunnel server, plus the `ServerProfile`
 * aggregate with its validation and labelling helpers. Credentials are
 * deliberately not part of a profile; they live in the credential vault.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QMap>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

export module vlesstunnel.core.serverprofile;

/**
 * @enum FlowControl
 * @brief Flow negotiation flag carried into the protocol codec.
 */
export enum class FlowControl
{
    None,       //!< Plain payload forwarding.
    XtlsVision  //!< `xtls-rprx-vision` flow requested in the request addons.
};

/**
 * @brief Wire name of a flow mode.
 * @param flow Flow value.
 * @return `none` or `xtls-rprx-vision`.
 */
export QString flowControlName(FlowControl flow);

/**
 * @brief Parse a flow name.
 * @param name Flow text, empty meaning none.
 * @return Flow value or empty optional for unknown names.
 */
export std::optional<FlowControl> flowControlFromName(const QString& name);

/**
 * @struct ServerEndpoint
 * @brief Network location and TLS identity of a tunnel server.
 */
export struct ServerEndpoint {
    QString hostname;               //!< Host name or IP literal to dial.
    quint16 port = 0;               //!< Server port.
    QString serverName;             //!< TLS SNI, independent of `hostname`.
    QStringList alpn;               //!< Ordered ALPN protocol list.
    bool allowInsecureTls = false;  //!< Disable certificate validation (testing only).

    /**
     * @brief Validate host and port.
     * @param errorMessage Optional output message on failure.
     * @return True when the endpoint can be dialled.
     */
    bool isValid(QString *errorMessage = nullptr) const;

    bool operator==(const ServerEndpoint&) const = default;
};

/**
 * @struct Destination
 * @brief Target the server is asked to reach on behalf of the client.
 */
export struct Destination {
    QString host;      //!< Host name or IP literal.
    quint16 port = 0;  //!< Target port.

    bool operator==(const Destination&) const = default;
};

/**
 * @enum TransportKind
 * @brief Discriminator of `TransportConfig` alternatives.
 */
export enum class TransportKind
{
    Plain,
    Tls,
    WebSocket,
    Grpc,
    Http2
};

//! Raw TCP, no stream security.
export struct PlainConfig {
    bool operator==(const PlainConfig&) const = default;
};

//! TLS over TCP.
export struct TlsConfig {
    QString serverName;          //!< SNI presented during the handshake.
    QStringList alpn;            //!< ALPN protocols offered.
    bool allowInsecure = false;  //!< Disable certificate validation (testing only).

    bool operator==(const TlsConfig&) const = default;
};

//! WebSocket framing.
export struct WebSocketConfig {
    QString path = QStringLiteral("/");  //!< Request path.
    QString hostHeader;                  //!< Host header override.
    QMap<QString, QString> headers;      //!< Extra request headers.
    bool secure = false;                 //!< Run under TLS.

    bool operator==(const WebSocketConfig&) const = default;
};

//! gRPC framing.
export struct GrpcConfig {
    QString serviceName;     //!< gRPC service name, mandatory.
    bool multiMode = false;  //!< Use multi-stream mode.
    bool secure = false;     //!< Run under TLS.

    bool operator==(const GrpcConfig&) const = default;
};

//! HTTP/2 framing.
export struct Http2Config {
    QString path = QStringLiteral("/");  //!< Request path.
    QStringList hosts;                   //!< Allowed authority values.
    bool secure = false;                 //!< Run under TLS.

    bool operator==(const Http2Config&) const = default;
};

/**
 * @class TransportConfig
 * @brief Tagged union of transport settings.
 *
 * @details
 * Exactly one alternative is held per profile; the transport factory
 * dispatches on it to build the concrete transport.
 */
export class TransportConfig
{
public:
    using Value = std::variant<PlainConfig, TlsConfig, WebSocketConfig, GrpcConfig, Http2Config>;

    TransportConfig() = default;

    /**
     * @brief Wrap one concrete configuration.
     * @param value Configuration alternative.
     */
    template<class T>
        requires std::is_constructible_v<Value, T&&>
    TransportConfig(T&& value)
        : m_value(std::forward<T>(value))
    {
    }

    /**
     * @brief Discriminator of the held alternative.
     * @return Transport kind.
     */
    TransportKind kind() const;

    /**
     * @brief Short transport name (`tcp`, `tls`, `ws`, `grpc`, `h2`).
     * @return Name used in logs and labels.
     */
    QString name() const;

    /**
     * @brief Whether the transport runs under TLS.
     * @return True for TLS and secure framed transports.
     */
    bool isSecure() const;

    /**
     * @brief Held alternative.
     * @return Variant value.
     */
    const Value& value() const;

    /**
     * @brief Access the alternative when it is of type `T`.
     * @return Pointer to the configuration or nullptr.
     */
    template<class T>
    const T *get() const
    {
        return std::get_if<T>(&m_value);
    }

    bool operator==(const TransportConfig&) const = default;

private:
    Value m_value = PlainConfig{};
};

/**
 * @brief Short name of a transport kind.
 * @param kind Transport kind.
 * @return Name used in logs.
 */
export QString transportKindName(TransportKind kind);

/**
 * @struct ServerProfile
 * @brief Canonical connection profile used by VlessTunnel.
 *
 * @details
 * Contains the endpoint, transport and flow settings parsed from a share
 * link or supplied by the profile store.
 */
export struct ServerProfile {
    QString id;                              //!< Stable profile identifier.
    QString name;                            //!< Human-readable profile name.
    ServerEndpoint endpoint;                 //!< Server location and TLS identity.
    TransportConfig transport;               //!< Transport alternative.
    FlowControl flow = FlowControl::None;    //!< Requested flow mode.
    std::optional<Destination> destination;  //!< Tunnel target, endpoint when unset.

    /**
     * @brief Validate endpoint, transport and flow combination.
     * @param errorMessage Optional output message on failure.
     * @return True when the profile can be connected.
     */
    bool isValid(QString *errorMessage = nullptr) const;

    /**
     * @brief Build a compact UI label for list usage.
     * @return Display-ready profile label.
     */
    QString displayLabel() const;

    /**
     * @brief Destination written into the request header.
     * @return Configured destination or the server endpoint.
     */
    Destination effectiveDestination() const;

    bool operator==(const ServerProfile&) const = default;
};
