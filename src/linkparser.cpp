module;
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>
#include <QUuid>

#include <optional>

module vlesstunnel.core.linkparser;

namespace {
const QString kScheme = QStringLiteral("vless");

QString createProfileId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool isTruthy(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QStringLiteral("1") || normalized == QStringLiteral("true");
}
}

std::optional<ParsedLink> LinkParser::parse(const QString& rawLink, QString *errorMessage)
{
    const QString link = rawLink.trimmed();
    if (link.isEmpty()) {
        setError(errorMessage, QStringLiteral("Import link is empty."));
        return std::nullopt;
    }

    if (!link.startsWith(kScheme + QStringLiteral("://"), Qt::CaseInsensitive)) {
        setError(errorMessage, QStringLiteral("Unsupported link format. Links must start with vless://"));
        return std::nullopt;
    }

    const QUrl url(link, QUrl::TolerantMode);
    if (!url.isValid()) {
        setError(errorMessage, QStringLiteral("VLESS link is not a valid URL: %1").arg(url.errorString()));
        return std::nullopt;
    }

    const QString userId = QUrl::fromPercentEncoding(url.userName(QUrl::FullyEncoded).toUtf8()).trimmed();
    if (userId.isEmpty()) {
        setError(errorMessage, QStringLiteral("VLESS link is missing the UUID."));
        return std::nullopt;
    }

    QString credentialError;
    const auto credential = Credential::fromString(userId, &credentialError);
    if (!credential.has_value()) {
        setError(errorMessage, QStringLiteral("Invalid UUID in VLESS link: %1").arg(credentialError));
        return std::nullopt;
    }

    const QString host = url.host().trimmed();
    if (host.isEmpty()) {
        setError(errorMessage, QStringLiteral("VLESS link is missing the server host."));
        return std::nullopt;
    }

    const int port = url.port(-1);
    if (port < 1 || port > 65535) {
        setError(errorMessage, QStringLiteral("VLESS link is missing a valid port."));
        return std::nullopt;
    }

    const QUrlQuery query(url);
    auto queryValue = [&query](const QString& key) {
        return query.queryItemValue(key, QUrl::FullyDecoded).trimmed();
    };

    ServerProfile profile;
    profile.id = createProfileId();
    profile.name = url.fragment(QUrl::FullyDecoded).trimmed();
    if (profile.name.isEmpty()) {
        profile.name = host;
    }
    profile.endpoint.hostname = host;
    profile.endpoint.port = static_cast<quint16>(port);

    const QString security = queryValue(QStringLiteral("security")).toLower();
    bool secure = false;
    if (security.isEmpty() || security == QStringLiteral("none")) {
        secure = false;
    } else if (security == QStringLiteral("tls")) {
        secure = true;
    } else {
        setError(errorMessage, QStringLiteral("Unsupported security mode: %1").arg(security));
        return std::nullopt;
    }

    if (secure) {
        profile.endpoint.serverName = queryValue(QStringLiteral("sni"));
        if (profile.endpoint.serverName.isEmpty()) {
            profile.endpoint.serverName = queryValue(QStringLiteral("serverName"));
        }
        if (profile.endpoint.serverName.isEmpty()) {
            profile.endpoint.serverName = host;
        }
        profile.endpoint.alpn = splitList(queryValue(QStringLiteral("alpn")));
        profile.endpoint.allowInsecureTls = isTruthy(queryValue(QStringLiteral("allowInsecure")));
    }

    const QString flow = queryValue(QStringLiteral("flow"));
    const auto flowControl = flowControlFromName(flow);
    if (!flowControl.has_value()) {
        setError(errorMessage, QStringLiteral("Unsupported flow control: %1").arg(flow));
        return std::nullopt;
    }
    profile.flow = *flowControl;

    QString type = queryValue(QStringLiteral("type")).toLower();
    if (type.isEmpty()) {
        type = QStringLiteral("tcp");
    }

    const QString hostHeader = queryValue(QStringLiteral("host"));
    if (type == QStringLiteral("tcp")) {
        if (secure) {
            profile.transport = TlsConfig{
                profile.endpoint.serverName,
                profile.endpoint.alpn,
                profile.endpoint.allowInsecureTls,
            };
        } else {
            profile.transport = PlainConfig{};
        }
    } else if (type == QStringLiteral("ws") || type == QStringLiteral("websocket")) {
        WebSocketConfig ws;
        ws.path = normalizePath(queryValue(QStringLiteral("path")));
        ws.hostHeader = hostHeader;
        if (!hostHeader.isEmpty()) {
            ws.headers.insert(QStringLiteral("Host"), hostHeader);
        }
        ws.secure = secure;
        profile.transport = ws;
    } else if (type == QStringLiteral("grpc")) {
        GrpcConfig grpc;
        grpc.serviceName = queryValue(QStringLiteral("serviceName"));
        if (grpc.serviceName.isEmpty()) {
            setError(errorMessage, QStringLiteral("gRPC transport requires a serviceName parameter."));
            return std::nullopt;
        }
        grpc.multiMode = queryValue(QStringLiteral("mode")).toLower() == QStringLiteral("multi");
        grpc.secure = secure;
        profile.transport = grpc;
    } else if (type == QStringLiteral("h2") || type == QStringLiteral("http")) {
        Http2Config h2;
        h2.path = normalizePath(queryValue(QStringLiteral("path")));
        h2.hosts = splitList(hostHeader);
        h2.secure = secure;
        profile.transport = h2;
    } else {
        setError(errorMessage, QStringLiteral("Unsupported transport type: %1").arg(type));
        return std::nullopt;
    }

    QString validationError;
    if (!profile.isValid(&validationError)) {
        setError(errorMessage, validationError);
        return std::nullopt;
    }

    return ParsedLink{profile, *credential};
}

std::optional<QString> LinkParser::compose(const ServerProfile& profile, const Credential& credential,
                                           QString *errorMessage)
{
    if (credential.isNull()) {
        setError(errorMessage, QStringLiteral("Cannot export a profile without a UUID."));
        return std::nullopt;
    }

    QString validationError;
    if (!profile.isValid(&validationError)) {
        setError(errorMessage, validationError);
        return std::nullopt;
    }

    QUrl url;
    url.setScheme(kScheme);
    url.setUserName(credential.toString());
    url.setHost(profile.endpoint.hostname);
    url.setPort(profile.endpoint.port);

    QUrlQuery query;
    const TransportKind kind = profile.transport.kind();
    query.addQueryItem(QStringLiteral("type"), kind == TransportKind::Tls ? QStringLiteral("tcp") : profile.transport.name());

    if (profile.flow != FlowControl::None) {
        query.addQueryItem(QStringLiteral("flow"), flowControlName(profile.flow));
    }

    if (profile.transport.isSecure()) {
        QString serverName = profile.endpoint.serverName;
        QStringList alpn = profile.endpoint.alpn;
        bool allowInsecure = profile.endpoint.allowInsecureTls;
        if (const auto *tls = profile.transport.get<TlsConfig>()) {
            serverName = tls->serverName;
            alpn = tls->alpn;
            allowInsecure = tls->allowInsecure;
        }

        query.addQueryItem(QStringLiteral("security"), QStringLiteral("tls"));
        query.addQueryItem(QStringLiteral("sni"), serverName);
        if (!alpn.isEmpty()) {
            query.addQueryItem(QStringLiteral("alpn"), alpn.join(','));
        }
        if (allowInsecure) {
            query.addQueryItem(QStringLiteral("allowInsecure"), QStringLiteral("1"));
        }
    } else {
        query.addQueryItem(QStringLiteral("security"), QStringLiteral("none"));
    }

    if (const auto *ws = profile.transport.get<WebSocketConfig>()) {
        query.addQueryItem(QStringLiteral("path"), ws->path);
        if (!ws->hostHeader.isEmpty()) {
            query.addQueryItem(QStringLiteral("host"), ws->hostHeader);
        }
    } else if (const auto *grpc = profile.transport.get<GrpcConfig>()) {
        query.addQueryItem(QStringLiteral("serviceName"), grpc->serviceName);
        if (grpc->multiMode) {
            query.addQueryItem(QStringLiteral("mode"), QStringLiteral("multi"));
        }
    } else if (const auto *h2 = profile.transport.get<Http2Config>()) {
        query.addQueryItem(QStringLiteral("path"), h2->path);
        if (!h2->hosts.isEmpty()) {
            query.addQueryItem(QStringLiteral("host"), h2->hosts.join(','));
        }
    }

    url.setQuery(query);
    url.setFragment(profile.name.trimmed().isEmpty() ? profile.endpoint.hostname : profile.name.trimmed());

    return url.toString(QUrl::FullyEncoded);
}

QStringList LinkParser::splitList(const QString& value)
{
    QStringList items;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString item = part.trimmed();
        if (!item.isEmpty()) {
            items.append(item);
        }
    }
    return items;
}

QString LinkParser::normalizePath(const QString& path)
{
    if (path.trimmed().isEmpty()) {
        return QStringLiteral("/");
    }

    if (path.startsWith('/')) {
        return path;
    }

    return QStringLiteral("/") + path;
}

void LinkParser::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
