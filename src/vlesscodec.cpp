module;
#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <QUrl>

#include <optional>

module vlesstunnel.core.vlesscodec;

namespace {
constexpr int kUuidLength = 16;
constexpr int kIPv4Length = 4;
constexpr int kIPv6Length = 16;
constexpr char kAddonsFlowTag = 0x0A;

void appendPort(QByteArray& out, quint16 port)
{
    out.append(static_cast<char>((port >> 8) & 0xFF));
    out.append(static_cast<char>(port & 0xFF));
}

quint8 byteAt(const QByteArray& data, qsizetype index)
{
    return static_cast<quint8>(data.at(index));
}
}

QString ProtocolError::describe() const
{
    QString kindText;
    switch (kind) {
    case Kind::BadResponseHeader:
        kindText = QStringLiteral("bad response header");
        break;
    case Kind::UnsupportedVersion:
        kindText = QStringLiteral("unsupported version");
        break;
    case Kind::InvalidRequest:
        kindText = QStringLiteral("invalid request");
        break;
    }
    if (message.isEmpty()) {
        return kindText;
    }
    return QStringLiteral("%1: %2").arg(kindText, message);
}

VlessCodec::VlessCodec(FlowControl flow)
    : m_flow(flow)
{
}

FlowControl VlessCodec::flow() const
{
    return m_flow;
}

std::optional<QByteArray> VlessCodec::encodeRequest(const Credential& credential, const QString& address, quint16 port,
                                                    ProtocolError *error) const
{
    if (credential.isNull()) {
        setError(error, ProtocolError::Kind::InvalidRequest, QStringLiteral("Request requires a UUID."));
        return std::nullopt;
    }

    QString host = address.trimmed();
    if (host.startsWith('[') && host.endsWith(']')) {
        host = host.mid(1, host.size() - 2);
    }
    if (host.isEmpty()) {
        setError(error, ProtocolError::Kind::InvalidRequest, QStringLiteral("Destination address is empty."));
        return std::nullopt;
    }

    QByteArray out;
    out.reserve(1 + kUuidLength + 1 + 1 + 2 + 1 + kMaxDomainLength + 1);
    out.append(static_cast<char>(kVersion));
    out.append(credential.toRfc4122());

    const QByteArray addons = flowAddons(m_flow);
    out.append(static_cast<char>(addons.size()));
    out.append(addons);

    out.append(static_cast<char>(VlessCommand::Tcp));
    appendPort(out, port);

    QHostAddress ip;
    if (ip.setAddress(host) && ip.protocol() == QAbstractSocket::IPv4Protocol) {
        out.append(static_cast<char>(AddressType::IPv4));
        const quint32 value = ip.toIPv4Address();
        out.append(static_cast<char>((value >> 24) & 0xFF));
        out.append(static_cast<char>((value >> 16) & 0xFF));
        out.append(static_cast<char>((value >> 8) & 0xFF));
        out.append(static_cast<char>(value & 0xFF));
        return out;
    }

    if (!ip.isNull() && ip.protocol() == QAbstractSocket::IPv6Protocol) {
        out.append(static_cast<char>(AddressType::IPv6));
        const Q_IPV6ADDR value = ip.toIPv6Address();
        for (int i = 0; i < kIPv6Length; ++i) {
            out.append(static_cast<char>(value[i]));
        }
        return out;
    }

    const QByteArray domain = QUrl::toAce(host);
    if (domain.isEmpty()) {
        setError(error, ProtocolError::Kind::InvalidRequest,
                 QStringLiteral("Destination '%1' is not a valid host name.").arg(host));
        return std::nullopt;
    }
    if (domain.size() > kMaxDomainLength) {
        setError(error, ProtocolError::Kind::InvalidRequest,
                 QStringLiteral("Destination host name exceeds %1 bytes.").arg(kMaxDomainLength));
        return std::nullopt;
    }

    out.append(static_cast<char>(AddressType::Domain));
    out.append(static_cast<char>(domain.size()));
    out.append(domain);
    return out;
}

VlessCodec::ParseStatus VlessCodec::decodeRequest(const QByteArray& buffer, RequestHeader *header, qsizetype *consumed,
                                                  ProtocolError *error)
{
    qsizetype offset = 0;
    if (buffer.size() < 1 + kUuidLength + 1) {
        return ParseStatus::NeedMoreData;
    }

    RequestHeader decoded;
    decoded.version = byteAt(buffer, offset++);
    if (decoded.version != kVersion) {
        setError(error, ProtocolError::Kind::UnsupportedVersion,
                 QStringLiteral("Request version %1 is not supported.").arg(int(decoded.version)));
        return ParseStatus::Failed;
    }

    QString credentialError;
    const auto credential = Credential::fromRfc4122(buffer.mid(offset, kUuidLength), &credentialError);
    if (!credential.has_value()) {
        setError(error, ProtocolError::Kind::InvalidRequest, credentialError);
        return ParseStatus::Failed;
    }
    decoded.credential = *credential;
    offset += kUuidLength;

    const int addonsLength = byteAt(buffer, offset++);
    if (buffer.size() < offset + addonsLength + 1 + 2 + 1) {
        return ParseStatus::NeedMoreData;
    }
    decoded.addons = buffer.mid(offset, addonsLength);
    offset += addonsLength;

    const quint8 command = byteAt(buffer, offset++);
    if (command < static_cast<quint8>(VlessCommand::Tcp) || command > static_cast<quint8>(VlessCommand::Mux)) {
        setError(error, ProtocolError::Kind::InvalidRequest, QStringLiteral("Unknown command 0x%1.").arg(int(command), 2, 16, QLatin1Char('0')));
        return ParseStatus::Failed;
    }
    decoded.command = static_cast<VlessCommand>(command);

    decoded.port = static_cast<quint16>((byteAt(buffer, offset) << 8) | byteAt(buffer, offset + 1));
    offset += 2;

    const quint8 addressType = byteAt(buffer, offset++);
    switch (addressType) {
    case static_cast<quint8>(AddressType::IPv4): {
        if (buffer.size() < offset + kIPv4Length) {
            return ParseStatus::NeedMoreData;
        }
        const quint32 value = (static_cast<quint32>(byteAt(buffer, offset)) << 24)
            | (static_cast<quint32>(byteAt(buffer, offset + 1)) << 16)
            | (static_cast<quint32>(byteAt(buffer, offset + 2)) << 8)
            | static_cast<quint32>(byteAt(buffer, offset + 3));
        decoded.addressType = AddressType::IPv4;
        decoded.address = QHostAddress(value).toString();
        offset += kIPv4Length;
        break;
    }
    case static_cast<quint8>(AddressType::Domain): {
        if (buffer.size() < offset + 1) {
            return ParseStatus::NeedMoreData;
        }
        const int length = byteAt(buffer, offset++);
        if (length == 0) {
            setError(error, ProtocolError::Kind::InvalidRequest, QStringLiteral("Domain address is empty."));
            return ParseStatus::Failed;
        }
        if (buffer.size() < offset + length) {
            return ParseStatus::NeedMoreData;
        }
        decoded.addressType = AddressType::Domain;
        decoded.address = QUrl::fromAce(buffer.mid(offset, length));
        offset += length;
        break;
    }
    case static_cast<quint8>(AddressType::IPv6): {
        if (buffer.size() < offset + kIPv6Length) {
            return ParseStatus::NeedMoreData;
        }
        decoded.addressType = AddressType::IPv6;
        Q_IPV6ADDR value{};
        for (int i = 0; i < kIPv6Length; ++i) {
            value[i] = byteAt(buffer, offset + i);
        }
        decoded.address = QHostAddress(value).toString();
        offset += kIPv6Length;
        break;
    }
    default:
        setError(error, ProtocolError::Kind::InvalidRequest,
                 QStringLiteral("Unknown address type 0x%1.").arg(int(addressType), 2, 16, QLatin1Char('0')));
        return ParseStatus::Failed;
    }

    if (header) {
        *header = decoded;
    }
    if (consumed) {
        *consumed = offset;
    }
    return ParseStatus::Complete;
}

QByteArray VlessCodec::encodeResponse(const ResponseHeader& header)
{
    QByteArray out;
    out.append(static_cast<char>(header.version));
    out.append(static_cast<char>(header.addons.size()));
    out.append(header.addons);
    return out;
}

VlessCodec::ParseStatus VlessCodec::parseResponse(QByteArray& buffer, ResponseHeader *header, ProtocolError *error)
{
    if (m_responseParsed) {
        setError(error, ProtocolError::Kind::BadResponseHeader, QStringLiteral("Response header was already parsed."));
        return ParseStatus::Failed;
    }

    if (buffer.size() < 2) {
        return ParseStatus::NeedMoreData;
    }

    const quint8 version = byteAt(buffer, 0);
    if (version != kVersion) {
        setError(error, ProtocolError::Kind::UnsupportedVersion,
                 QStringLiteral("Server answered with version %1, expected %2.").arg(int(version)).arg(int(kVersion)));
        return ParseStatus::Failed;
    }

    const int addonsLength = byteAt(buffer, 1);
    if (buffer.size() < 2 + addonsLength) {
        return ParseStatus::NeedMoreData;
    }

    if (header) {
        header->version = version;
        header->addons = buffer.mid(2, addonsLength);
    }

    buffer.remove(0, 2 + addonsLength);
    m_responseParsed = true;
    return ParseStatus::Complete;
}

FlowControl VlessCodec::negotiateFlow()
{
    m_flowNegotiated = true;
    return m_flow;
}

bool VlessCodec::isFlowNegotiated() const
{
    return m_flowNegotiated;
}

QByteArray VlessCodec::flowAddons(FlowControl flow)
{
    if (flow == FlowControl::None) {
        return {};
    }

    const QByteArray name = flowControlName(flow).toLatin1();
    QByteArray addons;
    addons.append(kAddonsFlowTag);
    addons.append(static_cast<char>(name.size()));
    addons.append(name);
    return addons;
}

QByteArray VlessCodec::encodePayload(const QByteArray& payload) const
{
    return payload;
}

QByteArray VlessCodec::decodePayload(const QByteArray& data) const
{
    return data;
}

void VlessCodec::setError(ProtocolError *error, ProtocolError::Kind kind, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}
