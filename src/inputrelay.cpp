module;
#include <QByteArray>
#include <QObject>
#include <QSocketNotifier>
#include <QString>
#include <QTimer>
#include <QtGlobal>

#include <chrono>
#include <cstring>

#if defined(Q_OS_UNIX)
#include <cerrno>
#include <unistd.h>
#endif

module vlesstunnel.core.inputrelay;
import vlesstunnel.core.connectionmanager;
import vlesstunnel.core.protocolsession;

InputRelay::InputRelay(int fd, ConnectionManager& manager, QObject *parent)
    : QObject(parent)
    , m_fd(fd)
    , m_manager(manager)
{
    m_drainTimer.setSingleShot(true);
    m_drainTimer.setInterval(kDefaultDrainTimeoutMs);
    connect(&m_drainTimer, &QTimer::timeout, this, &InputRelay::onDrainTimeout);
}

InputRelay::~InputRelay() = default;

void InputRelay::setDrainTimeout(std::chrono::milliseconds timeout)
{
    m_drainTimer.setInterval(static_cast<int>(qMax<qint64>(1, timeout.count())));
}

bool InputRelay::start(QString *errorMessage)
{
#if defined(Q_OS_UNIX)
    if (m_notifier) {
        return true;
    }
    if (m_fd < 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Input descriptor is not valid.");
        }
        return false;
    }

    m_notifier = new QSocketNotifier(static_cast<qintptr>(m_fd), QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &InputRelay::onReadable);
    connect(&m_manager, &ConnectionManager::phaseChanged, this, &InputRelay::onPhaseChanged);
    connect(&m_manager, &ConnectionManager::payloadReceived, this, &InputRelay::onPayloadReceived);
    updateNotifier();
    return true;
#else
    if (errorMessage) {
        *errorMessage = QStringLiteral("Input relay is not supported on this platform.");
    }
    return false;
#endif
}

bool InputRelay::isInputClosed() const
{
    return m_inputClosed;
}

bool InputRelay::isFinished() const
{
    return m_finished;
}

quint64 InputRelay::bytesForwarded() const
{
    return m_bytesForwarded;
}

void InputRelay::onReadable()
{
#if defined(Q_OS_UNIX)
    if (m_inputClosed || !m_manager.connected()) {
        updateNotifier();
        return;
    }

    QByteArray chunk(kChunkSize, Qt::Uninitialized);
    const ssize_t count = ::read(m_fd, chunk.data(), static_cast<size_t>(chunk.size()));
    if (count > 0) {
        chunk.truncate(static_cast<qsizetype>(count));
        SessionError error;
        if (!m_manager.forward(chunk, &error)) {
            appendLog(QStringLiteral("[Connection] Dropped %1 input bytes: %2").arg(count).arg(error.describe()));
            return;
        }
        m_bytesForwarded += static_cast<quint64>(count);
        return;
    }

    if (count == 0) {
        closeInput(QStringLiteral("End of input."));
        return;
    }

    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        return;
    }
    closeInput(QStringLiteral("Input read failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno))));
#endif
}

void InputRelay::onPhaseChanged()
{
    if (m_inputClosed && !m_manager.connected()) {
        finish(QStringLiteral("Session closed after end of input."));
        return;
    }
    updateNotifier();
}

void InputRelay::onPayloadReceived()
{
    if (m_inputClosed && m_drainTimer.isActive()) {
        m_drainTimer.start();
    }
}

void InputRelay::onDrainTimeout()
{
    finish(QStringLiteral("No payload within %1 ms after end of input.").arg(m_drainTimer.interval()));
}

void InputRelay::closeInput(const QString& reason)
{
    if (m_inputClosed) {
        return;
    }
    m_inputClosed = true;
    updateNotifier();
    appendLog(QStringLiteral("[Connection] %1 Forwarded %2 bytes.").arg(reason).arg(m_bytesForwarded));

    if (!m_manager.connected()) {
        finish(QStringLiteral("Session is not connected."));
        return;
    }
    m_drainTimer.start();
}

void InputRelay::finish(const QString& reason)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_drainTimer.stop();
    updateNotifier();
    appendLog(QStringLiteral("[Connection] Input relay finished: %1").arg(reason));
    emit finished();
}

void InputRelay::updateNotifier()
{
    if (!m_notifier) {
        return;
    }
    m_notifier->setEnabled(!m_inputClosed && !m_finished && m_manager.connected());
}

void InputRelay::appendLog(const QString& message)
{
    emit logLine(message);
}
