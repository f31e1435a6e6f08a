/*!
 * @file        protocolsession.cppm
 * @brief       One tunnel session: a transport paired with the codec.
 *
 * @details
 * `ProtocolSession` opens its transport, performs the request/response
 * header exchange, negotiates the flow mode and then forwards payload in
 * both directions while counting bytes. Errors are reported as a
 * `SessionError` that keeps the transport/protocol distinction.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QElapsedTimer>
#include <QObject>
#include <QString>

#include <atomic>
#include <memory>
#include <optional>
#include <variant>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.protocolsession;
import vlesstunnel.core.credential;
import vlesstunnel.core.serverprofile;
import vlesstunnel.core.transport;
import vlesstunnel.core.vlesscodec;
#endif

#ifdef Q_MOC_RUN
class Transport;
struct ServerEndpoint;
struct Destination;
class Credential;
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @struct SessionError
 * @brief Transport or protocol failure of a session.
 */
VLESSTUNNEL_MODULE_EXPORT struct SessionError {
    std::variant<TransportError, ProtocolError> cause; //!< Underlying failure.

    /**
     * @brief Whether the failure came from the transport.
     * @return True for transport failures.
     */
    bool isTransportError() const
    {
        return std::holds_alternative<TransportError>(cause);
    }

    /**
     * @brief One-line description for logs and error states.
     * @return Formatted failure text.
     */
    QString describe() const
    {
        if (const auto *transport = std::get_if<TransportError>(&cause)) {
            return transport->describe();
        }
        return std::get<ProtocolError>(cause).describe();
    }
};

/**
 * @class ProtocolSession
 * @brief Owns one transport and one codec for the lifetime of a tunnel.
 *
 * @details
 * `connectToServer()` blocks the calling thread. After it returns true the
 * session may be moved to another thread; `readyRead()` then announces
 * payload that `pull()` returns, starting with any bytes that arrived
 * together with the response header.
 */
VLESSTUNNEL_MODULE_EXPORT class ProtocolSession : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct session.
     * @param transport Unopened transport, owned by the session.
     * @param flow Flow requested by the profile.
     * @param parent Optional QObject parent.
     */
    ProtocolSession(std::unique_ptr<Transport> transport, FlowControl flow, QObject *parent = nullptr);

    /**
     * @brief Close the transport on destruction.
     */
    ~ProtocolSession() override;

    /**
     * @brief Open the transport and run the header exchange.
     * @param endpoint Server to dial.
     * @param credential User UUID, dropped when the call returns.
     * @param destination Target written into the request header.
     * @param error Optional output error on failure.
     * @return True when the session is established.
     */
    bool connectToServer(const ServerEndpoint& endpoint, Credential credential, const Destination& destination,
                         SessionError *error = nullptr);

    /**
     * @brief Send payload to the server.
     * @param payload Application bytes.
     * @param error Optional output error on failure.
     * @return True when all bytes were accepted.
     */
    bool forward(const QByteArray& payload, SessionError *error = nullptr);

    /**
     * @brief Take all payload readable without blocking.
     * @param error Optional output error on failure.
     * @return Payload bytes, possibly empty, or empty optional when the
     * transport failed before any byte was read.
     */
    std::optional<QByteArray> pull(SessionError *error = nullptr);

    /**
     * @brief Whether payload is readable without blocking.
     * @return True when `pull()` would return data.
     */
    bool hasPendingData() const;

    /**
     * @brief Close the transport. Safe to call repeatedly.
     */
    void close();

    /**
     * @brief Whether the session is established and its transport open.
     * @return True while payload may flow.
     */
    bool isOpen() const;

    /**
     * @brief Flow mode settled during the handshake.
     * @return Negotiated flow.
     */
    FlowControl negotiatedFlow() const;

    /**
     * @brief Payload bytes sent so far.
     * @return Monotonic byte count.
     */
    quint64 bytesSent() const;

    /**
     * @brief Payload bytes received so far.
     * @return Monotonic byte count.
     */
    quint64 bytesReceived() const;

    /**
     * @brief Time from sending the request header to a complete response.
     * @return Round trip in milliseconds, when the handshake completed.
     */
    std::optional<qint64> roundtripMs() const;

signals:
    //! Emitted when payload becomes readable.
    void readyRead();
    //! Emitted once when the transport of an established session drops.
    void closed();

private slots:
    //! Forward transport readiness once established.
    void onTransportReadyRead();
    //! Handle transport closure.
    void onTransportDisconnected();

private:
    /**
     * @brief Read the response header, keeping trailing payload.
     * @param error Optional output error on failure.
     * @return True when the header is complete.
     */
    bool readResponseHeader(SessionError *error);

    Transport *m_transport = nullptr;        //!< Child transport, moves with the session.
    VlessCodec m_codec;                      //!< Header codec and flow state.
    QByteArray m_pending;                    //!< Payload received with the response header.
    bool m_established = false;              //!< Handshake completed and not closed.
    std::atomic<quint64> m_bytesSent{0};     //!< Payload bytes sent.
    std::atomic<quint64> m_bytesReceived{0}; //!< Payload bytes received.
    std::optional<qint64> m_roundtripMs;     //!< Measured handshake round trip.
};

#include "protocolsession.moc"
