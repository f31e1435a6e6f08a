module;
#include <QByteArray>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QList>
#include <QSslConfiguration>
#include <QSslError>
#include <QSslSocket>
#include <QStringList>
#include <QTcpSocket>
#include <QTimer>

#include <functional>
#include <memory>
#include <utility>

module vlesstunnel.core.transport;

namespace {
constexpr int kCancelPollIntervalMs = 100;
}

QString TransportError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::ConnectFailed:
        return QStringLiteral("connect failed");
    case Kind::NotConnected:
        return QStringLiteral("not connected");
    case Kind::PeerClosed:
        return QStringLiteral("peer closed");
    case Kind::Timeout:
        return QStringLiteral("timeout");
    case Kind::TlsHandshakeFailed:
        return QStringLiteral("TLS handshake failed");
    case Kind::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QStringLiteral("transport error");
}

QString TransportError::describe() const
{
    if (message.isEmpty()) {
        return kindName(kind);
    }
    return QStringLiteral("%1: %2").arg(kindName(kind), message);
}

Transport::Transport(TransportOptions options, QObject *parent)
    : QObject(parent)
    , m_options(std::move(options))
{
}

const TransportOptions& Transport::options() const
{
    return m_options;
}

bool Transport::isCancelled() const
{
    return m_options.isCancelled && m_options.isCancelled();
}

void Transport::setError(TransportError *error, TransportError::Kind kind, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

TcpTransport::TcpTransport(TransportOptions options, QObject *parent)
    : Transport(std::move(options), parent)
{
}

TcpTransport::~TcpTransport()
{
    close();
}

bool TcpTransport::open(const QString& host, quint16 port, TransportError *error)
{
    close();

    if (isCancelled()) {
        setError(error, TransportError::Kind::Cancelled, QStringLiteral("Connect was cancelled."));
        return false;
    }

    if (!m_socket) {
        m_socket = createSocket();
        m_socket->setParent(this);
        connect(m_socket, &QIODevice::readyRead, this, &Transport::readyRead);
        connect(m_socket, &QAbstractSocket::disconnected, this, [this]() {
            if (!m_open) {
                return;
            }
            m_open = false;
            emit disconnected();
        });
    }

    if (options().network.has_value() && !options().network->isNull()) {
        const NetworkHandle& handle = *options().network;
        if (!m_socket->bind(handle.localAddress)) {
            setError(error, TransportError::Kind::ConnectFailed,
                     QStringLiteral("Could not bind to %1 (%2): %3")
                         .arg(handle.interfaceName, handle.localAddress.toString(), m_socket->errorString()));
            m_socket->abort();
            return false;
        }
    }

    m_socket->connectToHost(host, port);

    QString failure;
    const WaitResult result = waitFor([this]() {
        return m_socket->state() == QAbstractSocket::ConnectedState;
    }, options().connectTimeout.count(), &failure);

    switch (result) {
    case WaitResult::Ready:
        break;
    case WaitResult::TimedOut:
        m_socket->abort();
        setError(error, TransportError::Kind::Timeout,
                 QStringLiteral("Connecting to %1:%2 timed out after %3 ms.")
                     .arg(host).arg(port).arg(options().connectTimeout.count()));
        return false;
    case WaitResult::Cancelled:
        m_socket->abort();
        setError(error, TransportError::Kind::Cancelled, QStringLiteral("Connect was cancelled."));
        return false;
    case WaitResult::Failed:
        m_socket->abort();
        setError(error, TransportError::Kind::ConnectFailed,
                 QStringLiteral("Could not connect to %1:%2: %3").arg(host).arg(port).arg(failure));
        return false;
    }

    m_socket->setSocketOption(QAbstractSocket::LowDelayOption, 1);
    m_socket->setSocketOption(QAbstractSocket::KeepAliveOption, 1);

    if (!finishOpen(error)) {
        m_socket->abort();
        return false;
    }

    m_open = true;
    return true;
}

bool TcpTransport::send(const QByteArray& data, TransportError *error)
{
    if (!isConnected()) {
        setError(error, TransportError::Kind::NotConnected, QStringLiteral("Transport is not connected."));
        return false;
    }

    if (data.isEmpty()) {
        return true;
    }

    const qint64 written = m_socket->write(data);
    if (written != data.size()) {
        setError(error, TransportError::Kind::PeerClosed,
                 QStringLiteral("Write failed: %1").arg(m_socket->errorString()));
        return false;
    }

    m_socket->flush();
    return true;
}

qint64 TcpTransport::receive(char *data, qint64 maxSize, TransportError *error)
{
    if (!m_socket) {
        setError(error, TransportError::Kind::NotConnected, QStringLiteral("Transport is not connected."));
        return -1;
    }

    if (maxSize <= 0) {
        return 0;
    }

    if (m_socket->bytesAvailable() == 0) {
        if (m_socket->state() != QAbstractSocket::ConnectedState) {
            setError(error, TransportError::Kind::PeerClosed, QStringLiteral("Connection closed by peer."));
            return -1;
        }

        QString failure;
        const WaitResult result = waitFor([this]() {
            return m_socket->bytesAvailable() > 0 || m_socket->state() != QAbstractSocket::ConnectedState;
        }, options().readTimeout.count(), &failure);

        switch (result) {
        case WaitResult::Ready:
            break;
        case WaitResult::TimedOut:
            setError(error, TransportError::Kind::Timeout,
                     QStringLiteral("No data received within %1 ms.").arg(options().readTimeout.count()));
            return -1;
        case WaitResult::Cancelled:
            setError(error, TransportError::Kind::Cancelled, QStringLiteral("Read was cancelled."));
            return -1;
        case WaitResult::Failed:
            if (m_socket->bytesAvailable() == 0) {
                setError(error, TransportError::Kind::PeerClosed, failure);
                return -1;
            }
            break;
        }
    }

    if (m_socket->bytesAvailable() > 0) {
        return m_socket->read(data, maxSize);
    }

    setError(error, TransportError::Kind::PeerClosed, QStringLiteral("Connection closed by peer."));
    return -1;
}

qint64 TcpTransport::bytesAvailable() const
{
    return m_socket ? m_socket->bytesAvailable() : 0;
}

bool TcpTransport::isConnected() const
{
    return m_open && m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

void TcpTransport::close()
{
    m_open = false;
    if (m_socket && m_socket->state() != QAbstractSocket::UnconnectedState) {
        m_socket->abort();
    }
}

QTcpSocket *TcpTransport::createSocket()
{
    return new QTcpSocket;
}

bool TcpTransport::finishOpen(TransportError *error)
{
    Q_UNUSED(error)
    return true;
}

TcpTransport::WaitResult TcpTransport::waitFor(const std::function<bool()>& ready, qint64 timeoutMs, QString *failureMessage)
{
    if (ready()) {
        return WaitResult::Ready;
    }
    if (isCancelled()) {
        return WaitResult::Cancelled;
    }

    QEventLoop loop;
    QElapsedTimer elapsed;
    elapsed.start();
    WaitResult result = WaitResult::TimedOut;

    auto evaluate = [&]() {
        if (ready()) {
            result = WaitResult::Ready;
            loop.quit();
            return;
        }
        if (isCancelled()) {
            result = WaitResult::Cancelled;
            loop.quit();
            return;
        }
        if (elapsed.elapsed() >= timeoutMs) {
            result = WaitResult::TimedOut;
            loop.quit();
        }
    };

    auto onFailure = [&](QAbstractSocket::SocketError) {
        if (ready()) {
            result = WaitResult::Ready;
        } else {
            result = WaitResult::Failed;
            if (failureMessage) {
                *failureMessage = m_socket->errorString();
            }
        }
        loop.quit();
    };

    QTimer poll;
    poll.setInterval(kCancelPollIntervalMs);
    connect(&poll, &QTimer::timeout, &loop, evaluate);
    connect(m_socket, &QAbstractSocket::connected, &loop, evaluate);
    connect(m_socket, &QIODevice::readyRead, &loop, evaluate);
    connect(m_socket, &QAbstractSocket::disconnected, &loop, evaluate);
    connect(m_socket, &QAbstractSocket::errorOccurred, &loop, onFailure);
    if (auto *ssl = qobject_cast<QSslSocket *>(m_socket)) {
        connect(ssl, &QSslSocket::encrypted, &loop, evaluate);
    }
    poll.start();

    loop.exec();
    return result;
}

QTcpSocket *TcpTransport::socket() const
{
    return m_socket;
}

TlsTransport::TlsTransport(const QString& serverName, const QStringList& alpn, bool allowInsecure,
                           TransportOptions options, QObject *parent)
    : TcpTransport(std::move(options), parent)
    , m_serverName(serverName)
    , m_alpn(alpn)
    , m_allowInsecure(allowInsecure)
{
}

QString TlsTransport::negotiatedProtocol() const
{
    auto *ssl = qobject_cast<QSslSocket *>(socket());
    if (!ssl) {
        return {};
    }
    return QString::fromLatin1(ssl->sslConfiguration().nextNegotiatedProtocol());
}

QTcpSocket *TlsTransport::createSocket()
{
    auto *socket = new QSslSocket;

    QSslConfiguration configuration = socket->sslConfiguration();
    QList<QByteArray> protocols;
    for (const QString& protocol : m_alpn) {
        protocols.append(protocol.toLatin1());
    }
    configuration.setAllowedNextProtocols(protocols);
    if (m_allowInsecure) {
        configuration.setPeerVerifyMode(QSslSocket::VerifyNone);
    }
    socket->setSslConfiguration(configuration);
    socket->setPeerVerifyName(m_serverName);

    return socket;
}

bool TlsTransport::finishOpen(TransportError *error)
{
    auto *ssl = qobject_cast<QSslSocket *>(socket());
    if (!ssl) {
        setError(error, TransportError::Kind::TlsHandshakeFailed, QStringLiteral("TLS socket is unavailable."));
        return false;
    }

    if (!QSslSocket::supportsSsl()) {
        setError(error, TransportError::Kind::TlsHandshakeFailed, QStringLiteral("No TLS backend is available."));
        return false;
    }

    ssl->startClientEncryption();

    QString failure;
    const WaitResult result = waitFor([ssl]() { return ssl->isEncrypted(); }, options().connectTimeout.count(), &failure);

    switch (result) {
    case WaitResult::Ready:
        return true;
    case WaitResult::TimedOut:
        setError(error, TransportError::Kind::Timeout,
                 QStringLiteral("TLS handshake with %1 timed out.").arg(m_serverName));
        return false;
    case WaitResult::Cancelled:
        setError(error, TransportError::Kind::Cancelled, QStringLiteral("TLS handshake was cancelled."));
        return false;
    case WaitResult::Failed:
        break;
    }

    QStringList details;
    const QList<QSslError> sslErrors = ssl->sslHandshakeErrors();
    for (const QSslError& sslError : sslErrors) {
        details.append(sslError.errorString());
    }
    if (details.isEmpty()) {
        details.append(failure);
    }

    setError(error, TransportError::Kind::TlsHandshakeFailed,
             QStringLiteral("TLS handshake with %1 failed: %2").arg(m_serverName, details.join(QStringLiteral("; "))));
    return false;
}

FramedTransport::FramedTransport(std::unique_ptr<Transport> inner, QObject *parent)
    : Transport(inner ? inner->options() : TransportOptions{}, parent)
    , m_inner(inner.release())
{
    if (m_inner) {
        m_inner->setParent(this);
        connect(m_inner, &Transport::readyRead, this, &Transport::readyRead);
        connect(m_inner, &Transport::disconnected, this, [this]() {
            if (!m_framed) {
                return;
            }
            m_framed = false;
            emit disconnected();
        });
    }
}

bool FramedTransport::open(const QString& host, quint16 port, TransportError *error)
{
    close();

    if (!m_inner) {
        setError(error, TransportError::Kind::ConnectFailed, QStringLiteral("Framed transport has no inner stream."));
        return false;
    }

    if (!m_inner->open(host, port, error)) {
        return false;
    }

    if (!negotiateFraming(host, error)) {
        m_inner->close();
        return false;
    }

    m_framed = true;
    return true;
}

bool FramedTransport::send(const QByteArray& data, TransportError *error)
{
    if (!isConnected()) {
        setError(error, TransportError::Kind::NotConnected, QStringLiteral("Transport is not connected."));
        return false;
    }
    return m_inner->send(data, error);
}

qint64 FramedTransport::receive(char *data, qint64 maxSize, TransportError *error)
{
    if (!m_framed || !m_inner) {
        setError(error, TransportError::Kind::NotConnected, QStringLiteral("Transport is not connected."));
        return -1;
    }
    return m_inner->receive(data, maxSize, error);
}

qint64 FramedTransport::bytesAvailable() const
{
    return m_inner ? m_inner->bytesAvailable() : 0;
}

bool FramedTransport::isConnected() const
{
    return m_framed && m_inner && m_inner->isConnected();
}

void FramedTransport::close()
{
    m_framed = false;
    if (m_inner) {
        m_inner->close();
    }
}

Transport *FramedTransport::inner() const
{
    return m_inner;
}
