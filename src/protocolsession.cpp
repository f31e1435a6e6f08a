module;
#include <QByteArray>
#include <QElapsedTimer>
#include <QObject>
#include <QString>

#include <memory>
#include <optional>
#include <utility>

module vlesstunnel.core.protocolsession;

namespace {
constexpr qint64 kReadChunkSize = 16 * 1024;

SessionError transportFailure(const TransportError& error)
{
    return SessionError{error};
}

SessionError protocolFailure(ProtocolError::Kind kind, const QString& message)
{
    return SessionError{ProtocolError{kind, message}};
}

void setError(SessionError *target, SessionError error)
{
    if (target) {
        *target = std::move(error);
    }
}
}

ProtocolSession::ProtocolSession(std::unique_ptr<Transport> transport, FlowControl flow, QObject *parent)
    : QObject(parent)
    , m_transport(transport.release())
    , m_codec(flow)
{
    if (m_transport) {
        m_transport->setParent(this);
        connect(m_transport, &Transport::readyRead, this, &ProtocolSession::onTransportReadyRead);
        connect(m_transport, &Transport::disconnected, this, &ProtocolSession::onTransportDisconnected);
    }
}

ProtocolSession::~ProtocolSession()
{
    close();
}

bool ProtocolSession::connectToServer(const ServerEndpoint& endpoint, Credential credential,
                                      const Destination& destination, SessionError *error)
{
    if (!m_transport) {
        setError(error, transportFailure(TransportError{TransportError::Kind::ConnectFailed,
                                                        QStringLiteral("Session has no transport.")}));
        credential.clear();
        return false;
    }

    if (m_established) {
        setError(error, transportFailure(TransportError{TransportError::Kind::ConnectFailed,
                                                        QStringLiteral("Session is already established.")}));
        credential.clear();
        return false;
    }

    ProtocolError protocolError;
    const auto request = m_codec.encodeRequest(credential, destination.host, destination.port, &protocolError);
    credential.clear();
    if (!request.has_value()) {
        setError(error, SessionError{protocolError});
        return false;
    }

    TransportError transportError;
    if (!m_transport->open(endpoint.hostname, endpoint.port, &transportError)) {
        setError(error, transportFailure(transportError));
        return false;
    }

    QElapsedTimer roundtrip;
    roundtrip.start();

    if (!m_transport->send(*request, &transportError)) {
        m_transport->close();
        setError(error, transportFailure(transportError));
        return false;
    }

    if (!readResponseHeader(error)) {
        m_transport->close();
        return false;
    }

    m_roundtripMs = roundtrip.elapsed();
    m_codec.negotiateFlow();
    m_established = true;
    return true;
}

bool ProtocolSession::forward(const QByteArray& payload, SessionError *error)
{
    if (!isOpen()) {
        setError(error, transportFailure(TransportError{TransportError::Kind::NotConnected,
                                                        QStringLiteral("Session is not established.")}));
        return false;
    }

    if (payload.isEmpty()) {
        return true;
    }

    TransportError transportError;
    if (!m_transport->send(m_codec.encodePayload(payload), &transportError)) {
        setError(error, transportFailure(transportError));
        return false;
    }

    m_bytesSent += static_cast<quint64>(payload.size());
    return true;
}

std::optional<QByteArray> ProtocolSession::pull(SessionError *error)
{
    QByteArray data;
    data.swap(m_pending);

    while (m_transport && m_transport->bytesAvailable() > 0) {
        QByteArray chunk(static_cast<qsizetype>(qMin(m_transport->bytesAvailable(), kReadChunkSize)), Qt::Uninitialized);
        TransportError transportError;
        const qint64 read = m_transport->receive(chunk.data(), chunk.size(), &transportError);
        if (read < 0) {
            if (data.isEmpty()) {
                setError(error, transportFailure(transportError));
                return std::nullopt;
            }
            break;
        }
        chunk.truncate(static_cast<qsizetype>(read));
        data.append(m_codec.decodePayload(chunk));
    }

    m_bytesReceived += static_cast<quint64>(data.size());
    return data;
}

bool ProtocolSession::hasPendingData() const
{
    return !m_pending.isEmpty() || (m_transport && m_transport->bytesAvailable() > 0);
}

void ProtocolSession::close()
{
    m_established = false;
    if (m_transport) {
        m_transport->close();
    }
}

bool ProtocolSession::isOpen() const
{
    return m_established && m_transport && m_transport->isConnected();
}

FlowControl ProtocolSession::negotiatedFlow() const
{
    return m_codec.isFlowNegotiated() ? m_codec.flow() : FlowControl::None;
}

quint64 ProtocolSession::bytesSent() const
{
    return m_bytesSent.load();
}

quint64 ProtocolSession::bytesReceived() const
{
    return m_bytesReceived.load();
}

std::optional<qint64> ProtocolSession::roundtripMs() const
{
    return m_roundtripMs;
}

void ProtocolSession::onTransportReadyRead()
{
    if (m_established) {
        emit readyRead();
    }
}

void ProtocolSession::onTransportDisconnected()
{
    if (!m_established) {
        return;
    }
    m_established = false;
    emit closed();
}

bool ProtocolSession::readResponseHeader(SessionError *error)
{
    QByteArray buffer;
    char chunk[kReadChunkSize];

    while (true) {
        ProtocolError protocolError;
        const VlessCodec::ParseStatus status = m_codec.parseResponse(buffer, nullptr, &protocolError);
        if (status == VlessCodec::ParseStatus::Complete) {
            m_pending = buffer;
            return true;
        }
        if (status == VlessCodec::ParseStatus::Failed) {
            setError(error, SessionError{protocolError});
            return false;
        }

        TransportError transportError;
        const qint64 read = m_transport->receive(chunk, kReadChunkSize, &transportError);
        if (read < 0) {
            if (transportError.kind == TransportError::Kind::PeerClosed) {
                setError(error, protocolFailure(ProtocolError::Kind::BadResponseHeader,
                                                QStringLiteral("Server closed the connection before a complete response header.")));
            } else {
                setError(error, transportFailure(transportError));
            }
            return false;
        }
        buffer.append(chunk, static_cast<qsizetype>(read));
    }
}
