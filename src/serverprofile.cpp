module;
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>
#include <variant>

module vlesstunnel.core.serverprofile;

namespace {
void setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}

template<class... Ts>
struct Visitor : Ts... {
    using Ts::operator()...;
};

template<class... Ts>
Visitor(Ts...) -> Visitor<Ts...>;
}

QString flowControlName(FlowControl flow)
{
    switch (flow) {
    case FlowControl::None:
        return QStringLiteral("none");
    case FlowControl::XtlsVision:
        return QStringLiteral("xtls-rprx-vision");
    }
    return QStringLiteral("none");
}

std::optional<FlowControl> flowControlFromName(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized.isEmpty() || normalized == QStringLiteral("none")) {
        return FlowControl::None;
    }
    if (normalized == QStringLiteral("xtls-rprx-vision")) {
        return FlowControl::XtlsVision;
    }
    return std::nullopt;
}

bool ServerEndpoint::isValid(QString *errorMessage) const
{
    if (hostname.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Server host is empty."));
        return false;
    }

    if (port == 0) {
        setError(errorMessage, QStringLiteral("Server port must be between 1 and 65535."));
        return false;
    }

    return true;
}

TransportKind TransportConfig::kind() const
{
    return std::visit(Visitor{
        [](const PlainConfig&) { return TransportKind::Plain; },
        [](const TlsConfig&) { return TransportKind::Tls; },
        [](const WebSocketConfig&) { return TransportKind::WebSocket; },
        [](const GrpcConfig&) { return TransportKind::Grpc; },
        [](const Http2Config&) { return TransportKind::Http2; },
    }, m_value);
}

QString TransportConfig::name() const
{
    return transportKindName(kind());
}

bool TransportConfig::isSecure() const
{
    return std::visit(Visitor{
        [](const PlainConfig&) { return false; },
        [](const TlsConfig&) { return true; },
        [](const WebSocketConfig& config) { return config.secure; },
        [](const GrpcConfig& config) { return config.secure; },
        [](const Http2Config& config) { return config.secure; },
    }, m_value);
}

const TransportConfig::Value& TransportConfig::value() const
{
    return m_value;
}

QString transportKindName(TransportKind kind)
{
    switch (kind) {
    case TransportKind::Plain:
        return QStringLiteral("tcp");
    case TransportKind::Tls:
        return QStringLiteral("tls");
    case TransportKind::WebSocket:
        return QStringLiteral("ws");
    case TransportKind::Grpc:
        return QStringLiteral("grpc");
    case TransportKind::Http2:
        return QStringLiteral("h2");
    }
    return QStringLiteral("tcp");
}

bool ServerProfile::isValid(QString *errorMessage) const
{
    if (!endpoint.isValid(errorMessage)) {
        return false;
    }

    if (const auto *tls = transport.get<TlsConfig>()) {
        if (tls->serverName.trimmed().isEmpty()) {
            setError(errorMessage, QStringLiteral("TLS transport requires a server name (SNI)."));
            return false;
        }
    } else if (transport.isSecure() && endpoint.serverName.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Secure %1 transport requires a server name (SNI).").arg(transport.name()));
        return false;
    }

    if (const auto *grpc = transport.get<GrpcConfig>()) {
        if (grpc->serviceName.trimmed().isEmpty()) {
            setError(errorMessage, QStringLiteral("gRPC transport requires a serviceName."));
            return false;
        }
    }

    if (const auto *ws = transport.get<WebSocketConfig>()) {
        if (!ws->path.startsWith('/')) {
            setError(errorMessage, QStringLiteral("WebSocket path must start with '/'."));
            return false;
        }
    }

    if (const auto *h2 = transport.get<Http2Config>()) {
        if (!h2->path.startsWith('/')) {
            setError(errorMessage, QStringLiteral("HTTP/2 path must start with '/'."));
            return false;
        }
    }

    if (flow == FlowControl::XtlsVision && !transport.isSecure()) {
        setError(errorMessage, QStringLiteral("Flow xtls-rprx-vision requires a TLS transport."));
        return false;
    }

    if (destination.has_value()) {
        if (destination->host.trimmed().isEmpty() || destination->port == 0) {
            setError(errorMessage, QStringLiteral("Destination requires a host and a port."));
            return false;
        }
    }

    return true;
}

QString ServerProfile::displayLabel() const
{
    if (!name.trimmed().isEmpty()) {
        return name.trimmed();
    }

    return QStringLiteral("%1:%2 (%3)")
        .arg(endpoint.hostname.trimmed(), QString::number(endpoint.port), transport.name().toUpper());
}

Destination ServerProfile::effectiveDestination() const
{
    if (destination.has_value()) {
        return *destination;
    }
    return Destination{endpoint.hostname.trimmed(), endpoint.port};
}
