/*!
 * @file        transport.cppm
 * @brief       Byte-stream transports used by tunnel sessions.
 *
 * @details
 * Declares the transport contract consumed by the protocol session and
 * its concrete implementations:
 * - `TcpTransport` over `QTcpSocket`
 * - `TlsTransport` over `QSslSocket` with SNI and ALPN
 * - `FramedTransport`, the seam for WebSocket/gRPC/HTTP2 framing
 *
 * Calls block the calling thread on a local event loop, honour per
 * transport timeouts, and can be interrupted through a cancellation
 * callback. Failures are reported through `TransportError`.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QObject>
#include <QSslSocket>
#include <QString>
#include <QStringList>
#include <QTcpSocket>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.transport;
import vlesstunnel.core.networkmonitor;
#endif

#ifdef Q_MOC_RUN
struct NetworkHandle;
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @struct TransportError
 * @brief Typed transport failure.
 */
VLESSTUNNEL_MODULE_EXPORT struct TransportError {
    enum class Kind
    {
        ConnectFailed,       //!< DNS, bind or TCP connect failed.
        NotConnected,        //!< Operation requires an open transport.
        PeerClosed,          //!< Remote side closed the stream.
        Timeout,             //!< Connect or read deadline expired.
        TlsHandshakeFailed,  //!< TLS negotiation or certificate validation failed.
        Cancelled            //!< Interrupted by a disconnect request.
    };

    Kind kind = Kind::ConnectFailed;  //!< Failure category.
    QString message;                  //!< Human-readable detail.

    /**
     * @brief Category name used in logs.
     * @param kind Failure category.
     * @return Short name.
     */
    static QString kindName(Kind kind);

    /**
     * @brief Category and detail in one line.
     * @return Formatted text.
     */
    QString describe() const;
};

/**
 * @struct TransportOptions
 * @brief Per-transport tuning and cancellation hook.
 */
VLESSTUNNEL_MODULE_EXPORT struct TransportOptions {
    std::chrono::milliseconds connectTimeout{15000};  //!< Deadline for connect and TLS handshake.
    std::chrono::milliseconds readTimeout{30000};     //!< Deadline for a blocking read.
    std::optional<NetworkHandle> network;             //!< Interface to bind to, if any.
    std::function<bool()> isCancelled;                //!< Polled while blocking; true aborts the wait.
};

/**
 * @class Transport
 * @brief Abstract reliable byte stream.
 *
 * @details
 * `open`, `send` and `receive` may block the calling thread; `close` is
 * idempotent and never fails. In steady state the owner reacts to
 * `readyRead()` and `disconnected()` on its own event loop.
 */
VLESSTUNNEL_MODULE_EXPORT class Transport : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct transport.
     * @param options Timeouts, binding and cancellation hook.
     * @param parent Optional QObject parent.
     */
    explicit Transport(TransportOptions options, QObject *parent = nullptr);

    /**
     * @brief Open the stream to `host:port`.
     * @param host Host name or IP literal.
     * @param port Remote port.
     * @param error Optional output error on failure.
     * @return True when the stream is ready for payload.
     */
    virtual bool open(const QString& host, quint16 port, TransportError *error = nullptr) = 0;

    /**
     * @brief Queue bytes for sending.
     * @param data Bytes to send.
     * @param error Optional output error on failure.
     * @return True when all bytes were accepted.
     */
    virtual bool send(const QByteArray& data, TransportError *error = nullptr) = 0;

    /**
     * @brief Read up to `maxSize` bytes.
     * @param data Destination buffer.
     * @param maxSize Buffer capacity.
     * @param error Optional output error on failure.
     * @return Bytes read (> 0) or -1 on failure.
     *
     * @details Returns buffered bytes immediately, otherwise waits up to
     * the read timeout for data.
     */
    virtual qint64 receive(char *data, qint64 maxSize, TransportError *error = nullptr) = 0;

    /**
     * @brief Bytes readable without blocking.
     * @return Buffered byte count.
     */
    virtual qint64 bytesAvailable() const = 0;

    /**
     * @brief Whether the stream is open.
     * @return True when connected.
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Close the stream. Safe to call repeatedly.
     */
    virtual void close() = 0;

    /**
     * @brief Options this transport was built with.
     * @return Options reference.
     */
    const TransportOptions& options() const;

signals:
    //! Emitted when new bytes are readable.
    void readyRead();
    //! Emitted once when an open stream closes.
    void disconnected();

protected:
    /**
     * @brief Whether the owner requested cancellation.
     * @return True when the cancellation hook reports true.
     */
    bool isCancelled() const;

    /**
     * @brief Helper to write typed errors.
     * @param error Optional output pointer.
     * @param kind Failure category.
     * @param message Detail text.
     */
    static void setError(TransportError *error, TransportError::Kind kind, const QString& message);

private:
    TransportOptions m_options; //!< Timeouts, binding and cancellation hook.
};

/**
 * @class TcpTransport
 * @brief Plain TCP transport over `QTcpSocket`.
 *
 * @details
 * Enables TCP no-delay and keep-alive once connected. When the options
 * carry a network handle, the socket is bound to its local address first.
 */
VLESSTUNNEL_MODULE_EXPORT class TcpTransport : public Transport
{
    Q_OBJECT

public:
    /**
     * @brief Construct transport.
     * @param options Timeouts, binding and cancellation hook.
     * @param parent Optional QObject parent.
     */
    explicit TcpTransport(TransportOptions options, QObject *parent = nullptr);

    /**
     * @brief Close the socket on destruction.
     */
    ~TcpTransport() override;

    bool open(const QString& host, quint16 port, TransportError *error = nullptr) override;
    bool send(const QByteArray& data, TransportError *error = nullptr) override;
    qint64 receive(char *data, qint64 maxSize, TransportError *error = nullptr) override;
    qint64 bytesAvailable() const override;
    bool isConnected() const override;
    void close() override;

protected:
    //! Outcome of a blocking wait.
    enum class WaitResult
    {
        Ready,
        TimedOut,
        Cancelled,
        Failed
    };

    /**
     * @brief Create the socket used by `open()`.
     * @return New unparented socket.
     */
    virtual QTcpSocket *createSocket();

    /**
     * @brief Hook run after TCP connect succeeds.
     * @param error Optional output error on failure.
     * @return True when the stream is ready for payload.
     */
    virtual bool finishOpen(TransportError *error);

    /**
     * @brief Spin a local event loop until `ready` holds.
     * @param ready Completion predicate.
     * @param timeoutMs Deadline in milliseconds.
     * @param failureMessage Output socket error text for `Failed`.
     * @return Wait outcome.
     */
    WaitResult waitFor(const std::function<bool()>& ready, qint64 timeoutMs, QString *failureMessage);

    /**
     * @brief Socket created by the last `open()`.
     * @return Socket or nullptr.
     */
    QTcpSocket *socket() const;

private:
    QTcpSocket *m_socket = nullptr; //!< Child socket, replaced per open.
    bool m_open = false;            //!< True between successful open and close.
};

/**
 * @class TlsTransport
 * @brief TLS over TCP using `QSslSocket`.
 *
 * @details
 * The TCP connection is made to the dialled host; the handshake then
 * presents `serverName` as SNI and verification name, and offers the
 * ALPN list. Certificate validation is enforced unless `allowInsecure`
 * is set, which must only be used against test servers.
 */
VLESSTUNNEL_MODULE_EXPORT class TlsTransport : public TcpTransport
{
    Q_OBJECT

public:
    /**
     * @brief Construct transport.
     * @param serverName SNI and certificate verification name.
     * @param alpn ALPN protocols in preference order.
     * @param allowInsecure Disable peer verification.
     * @param options Timeouts, binding and cancellation hook.
     * @param parent Optional QObject parent.
     */
    TlsTransport(const QString& serverName, const QStringList& alpn, bool allowInsecure,
                 TransportOptions options, QObject *parent = nullptr);

    /**
     * @brief ALPN protocol selected by the server.
     * @return Protocol name or empty string.
     */
    QString negotiatedProtocol() const;

protected:
    QTcpSocket *createSocket() override;
    bool finishOpen(TransportError *error) override;

private:
    QString m_serverName;       //!< SNI value.
    QStringList m_alpn;         //!< Offered ALPN protocols.
    bool m_allowInsecure;       //!< Peer verification disabled.
};

/**
 * @class FramedTransport
 * @brief Seam for transports that frame payload inside another protocol.
 *
 * @details
 * Wraps an inner byte stream (TCP or TLS). After the inner stream opens,
 * `negotiateFraming()` runs once; afterwards `send` and `receive` are
 * delegated to the inner stream unless a subclass overrides them to add
 * per-message framing.
 */
VLESSTUNNEL_MODULE_EXPORT class FramedTransport : public Transport
{
    Q_OBJECT

public:
    /**
     * @brief Construct transport.
     * @param inner Underlying byte stream, owned.
     * @param parent Optional QObject parent.
     */
    explicit FramedTransport(std::unique_ptr<Transport> inner, QObject *parent = nullptr);

    bool open(const QString& host, quint16 port, TransportError *error = nullptr) override;
    bool send(const QByteArray& data, TransportError *error = nullptr) override;
    qint64 receive(char *data, qint64 maxSize, TransportError *error = nullptr) override;
    qint64 bytesAvailable() const override;
    bool isConnected() const override;
    void close() override;

protected:
    /**
     * @brief Run the framing handshake over the open inner stream.
     * @param host Host that was dialled.
     * @param error Optional output error on failure.
     * @return True when payload may flow.
     */
    virtual bool negotiateFraming(const QString& host, TransportError *error) = 0;

    /**
     * @brief Underlying byte stream.
     * @return Inner transport.
     */
    Transport *inner() const;

private:
    Transport *m_inner = nullptr; //!< Child inner transport.
    bool m_framed = false;        //!< True once framing negotiated.
};

#include "transport.moc"
