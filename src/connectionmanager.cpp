module;
#include <QByteArray>
#include <QDateTime>
#include <QElapsedTimer>
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QThread>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <utility>

module vlesstunnel.core.connectionmanager;

import vlesstunnel.core.credential;
import vlesstunnel.core.serverprofile;
import vlesstunnel.core.systemlog;

namespace {
constexpr int kMinStatisticsIntervalMs = 100;

void setError(QString *target, const QString& message)
{
    if (target) {
        *target = message;
    }
}

quint64 ratePerSecond(quint64 delta, qint64 elapsedMs)
{
    if (elapsedMs <= 0) {
        return 0;
    }
    return static_cast<quint64>((static_cast<long double>(delta) * 1000.0L) / static_cast<long double>(elapsedMs));
}
}

ConnectionManager::ConnectionManager(const ProfileStore& profiles, const CredentialVault& vault,
                                     TransportFactory factory, QObject *parent)
    : QObject(parent)
    , m_profiles(profiles)
    , m_vault(vault)
    , m_factory(std::make_unique<TransportFactory>(std::move(factory)))
{
    m_statisticsTimer.setInterval(kDefaultStatisticsIntervalMs);
    connect(&m_statisticsTimer, &QTimer::timeout, this, &ConnectionManager::onStatisticsTick);
}

ConnectionManager::~ConnectionManager()
{
    m_statisticsTimer.stop();
    cancelAttempt();
    releaseSession();
}

const ConnectionState& ConnectionManager::connectionState() const
{
    return m_state;
}

ConnectionPhase ConnectionManager::phase() const
{
    return m_state.phase();
}

bool ConnectionManager::connected() const
{
    return phase() == ConnectionPhase::Connected;
}

bool ConnectionManager::busy() const
{
    const ConnectionPhase current = phase();
    return current == ConnectionPhase::Connecting || current == ConnectionPhase::Disconnecting;
}

QString ConnectionManager::activeProfileId() const
{
    return m_activeProfileId;
}

std::optional<ConnectionStatistics> ConnectionManager::statistics() const
{
    if (const auto *state = m_state.get<ConnectedState>()) {
        return state->statistics;
    }
    return std::nullopt;
}

void ConnectionManager::setTimeouts(std::chrono::milliseconds connectTimeout, std::chrono::milliseconds readTimeout)
{
    if (connectTimeout.count() > 0) {
        m_connectTimeout = connectTimeout;
    }
    if (readTimeout.count() > 0) {
        m_readTimeout = readTimeout;
    }
}

void ConnectionManager::setStatisticsInterval(int intervalMs)
{
    m_statisticsTimer.setInterval(qMax(kMinStatisticsIntervalMs, intervalMs));
}

std::optional<NetworkHandle> ConnectionManager::networkHandle() const
{
    return m_networkHandle;
}

bool ConnectionManager::connectToProfile(const QString& profileId, QString *errorMessage)
{
    const ConnectionPhase current = phase();
    if (current == ConnectionPhase::Connecting || current == ConnectionPhase::Connected
        || current == ConnectionPhase::Disconnecting) {
        setError(errorMessage, QStringLiteral("Connection manager is %1; connect rejected.")
                                   .arg(connectionPhaseName(current)));
        appendLog(QStringLiteral("Rejected connect to %1 while %2.").arg(profileId, connectionPhaseName(current)));
        return false;
    }

    const std::optional<ServerProfile> profile = m_profiles.profile(profileId);
    if (!profile) {
        const QString reason = QStringLiteral("Profile '%1' was not found.").arg(profileId);
        setError(errorMessage, reason);
        m_activeProfileId = profileId;
        fail(reason, false);
        return false;
    }

    QString validationError;
    if (!profile->isValid(&validationError)) {
        setError(errorMessage, validationError);
        m_activeProfileId = profileId;
        fail(validationError, false);
        return false;
    }

    VaultError vaultError;
    std::optional<Credential> credential = m_vault.credential(profileId, &vaultError);
    if (!credential) {
        const QString reason = QStringLiteral("Credential unavailable for profile '%1': %2")
                                   .arg(profileId, vaultError.message);
        setError(errorMessage, SystemLog::sanitize(reason));
        m_activeProfileId = profileId;
        fail(reason, false);
        return false;
    }

    if (!m_factory->supports(profile->transport.kind())) {
        const QString reason = QStringLiteral("Transport '%1' is not available in this build.")
                                   .arg(profile->transport.name());
        setError(errorMessage, reason);
        m_activeProfileId = profileId;
        fail(reason, false);
        return false;
    }

    cancelAttempt();
    const quint64 attemptId = ++m_attemptId;
    m_cancelFlag = std::make_shared<std::atomic_bool>(false);
    m_activeProfileId = profileId;

    TransportOptions options;
    options.connectTimeout = m_connectTimeout;
    options.readTimeout = m_readTimeout;
    options.network = m_networkHandle;
    const std::shared_ptr<std::atomic_bool> cancelFlag = m_cancelFlag;
    options.isCancelled = [cancelFlag]() { return cancelFlag->load(); };

    appendLog(QStringLiteral("Connecting to %1 via %2.").arg(profile->displayLabel(), profile->transport.name()));
    setConnectionState(ConnectingState{profileId});

    const QPointer<ConnectionManager> guard(this);
    QThread *ownerThread = thread();
    const std::shared_ptr<TransportFactory> factory = std::make_shared<TransportFactory>(*m_factory);
    const ServerProfile target = *profile;
    Credential secret = *credential;
    credential->clear();

    [[maybe_unused]] auto connectFuture = QtConcurrent::run(
        [guard, ownerThread, factory, target, secret, options, attemptId, cancelFlag]() mutable {
            std::shared_ptr<ProtocolSession> established;
            QString errorText;
            bool recoverable = true;

            QString createError;
            std::unique_ptr<Transport> transport = factory->create(target, options, &createError);
            if (!transport) {
                errorText = createError;
                recoverable = false;
            } else if (cancelFlag->load()) {
                errorText = QStringLiteral("Connect cancelled.");
            } else {
                auto *session = new ProtocolSession(std::move(transport), target.flow);
                SessionError sessionError;
                if (session->connectToServer(target.endpoint, std::move(secret), target.effectiveDestination(),
                                             &sessionError)) {
                    session->moveToThread(ownerThread);
                    established = std::shared_ptr<ProtocolSession>(session, [](ProtocolSession *object) {
                        object->deleteLater();
                    });
                } else {
                    errorText = sessionError.describe();
                    delete session;
                }
            }
            secret.clear();

            if (!guard) {
                return;
            }

            QMetaObject::invokeMethod(guard.data(), [guard, attemptId, established, errorText, recoverable]() {
                if (!guard) {
                    return;
                }
                guard->finishConnect(attemptId, established, errorText, recoverable);
            }, Qt::QueuedConnection);
        });

    return true;
}

bool ConnectionManager::reconnect(const QString& profileId, QString *errorMessage)
{
    const ConnectionPhase current = phase();
    if (current == ConnectionPhase::Connecting || current == ConnectionPhase::Disconnecting) {
        setError(errorMessage, QStringLiteral("Connection manager is %1; reconnect rejected.")
                                   .arg(connectionPhaseName(current)));
        return false;
    }

    if (current == ConnectionPhase::Connected) {
        appendLog(QStringLiteral("Dropping session for %1 to reconnect.").arg(m_activeProfileId));
        setConnectionState(DisconnectingState{});
        releaseSession();
        setConnectionState(DisconnectedState{});
    }

    return connectToProfile(profileId, errorMessage);
}

void ConnectionManager::disconnect()
{
    emit userDisconnected();

    cancelAttempt();

    if (phase() == ConnectionPhase::Disconnected) {
        return;
    }

    appendLog(QStringLiteral("Disconnect requested."));
    setConnectionState(DisconnectingState{});
    releaseSession();
    m_activeProfileId.clear();
    setConnectionState(DisconnectedState{});
}

bool ConnectionManager::forward(const QByteArray& payload, SessionError *error)
{
    if (!m_session || !connected()) {
        if (error) {
            *error = SessionError{TransportError{TransportError::Kind::NotConnected,
                                                 QStringLiteral("No active session.")}};
        }
        return false;
    }
    SessionError sessionError;
    if (!m_session->forward(payload, &sessionError)) {
        const QString reason = QStringLiteral("Send failed: %1").arg(sessionError.describe());
        if (error) {
            *error = sessionError;
        }
        releaseSession();
        fail(reason, true);
        return false;
    }
    return true;
}

void ConnectionManager::onNetworkEvent(const NetworkEvent& event)
{
    if (const auto *available = event.get<NetworkAvailable>()) {
        if (available->handle.isNull()) {
            m_networkHandle.reset();
        } else {
            m_networkHandle = available->handle;
        }
        return;
    }
    if (event.isLoss()) {
        m_networkHandle.reset();
    }
}

void ConnectionManager::onSessionReadyRead()
{
    if (!m_session) {
        return;
    }

    SessionError error;
    const std::optional<QByteArray> payload = m_session->pull(&error);
    if (!payload) {
        releaseSession();
        fail(QStringLiteral("Read failed: %1").arg(error.describe()), true);
        return;
    }
    if (!payload->isEmpty()) {
        emit payloadReceived(*payload);
    }
}

void ConnectionManager::onSessionClosed()
{
    if (!connected()) {
        return;
    }

    appendLog(QStringLiteral("Server closed the connection."));
    releaseSession();
    fail(QStringLiteral("Server closed the connection."), true);
}

void ConnectionManager::onStatisticsTick()
{
    auto *state = m_state.get<ConnectedState>();
    if (!state || !m_session) {
        return;
    }

    const quint64 received = m_session->bytesReceived();
    const quint64 sent = m_session->bytesSent();
    const qint64 elapsedMs = m_sampleClock.restart();

    ConnectionStatistics& stats = state->statistics;
    stats.bytesReceived = received;
    stats.bytesSent = sent;
    stats.downloadRateBps = ratePerSecond(received - m_lastSampleReceived, elapsedMs);
    stats.uploadRateBps = ratePerSecond(sent - m_lastSampleSent, elapsedMs);
    stats.lastRoundtripMs = m_session->roundtripMs();

    m_lastSampleReceived = received;
    m_lastSampleSent = sent;

    emit statisticsChanged();
}

void ConnectionManager::setConnectionState(const ConnectionState& state)
{
    if (m_state == state) {
        return;
    }

    const ConnectionPhase previous = m_state.phase();
    m_state = state;
    emit connectionStateChanged(m_state);
    if (previous != m_state.phase()) {
        emit phaseChanged();
    }
}

void ConnectionManager::fail(const QString& reason, bool recoverable)
{
    const QString sanitized = SystemLog::sanitize(reason);
    appendLog(QStringLiteral("Connection failed: %1").arg(sanitized));
    m_statisticsTimer.stop();
    setConnectionState(ErrorState{sanitized, recoverable});
}

void ConnectionManager::finishConnect(quint64 attemptId, const std::shared_ptr<ProtocolSession>& session,
                                      const QString& errorMessage, bool recoverable)
{
    if (attemptId != m_attemptId || phase() != ConnectionPhase::Connecting) {
        if (session) {
            session->close();
        }
        appendLog(QStringLiteral("Discarded result of a superseded connect attempt."));
        return;
    }

    m_cancelFlag.reset();

    if (!session) {
        fail(errorMessage, recoverable);
        return;
    }

    adoptSession(session);
}

void ConnectionManager::adoptSession(const std::shared_ptr<ProtocolSession>& session)
{
    m_session = session;
    connect(m_session.get(), &ProtocolSession::readyRead, this, &ConnectionManager::onSessionReadyRead);
    connect(m_session.get(), &ProtocolSession::closed, this, &ConnectionManager::onSessionClosed);

    ConnectedState state{m_activeProfileId, {}};
    state.statistics.connectedSince = QDateTime::currentDateTimeUtc();
    state.statistics.lastRoundtripMs = m_session->roundtripMs();
    state.statistics.bytesSent = m_session->bytesSent();
    state.statistics.bytesReceived = m_session->bytesReceived();

    m_lastSampleReceived = state.statistics.bytesReceived;
    m_lastSampleSent = state.statistics.bytesSent;
    m_sampleClock.start();

    appendLog(QStringLiteral("Connected to %1.").arg(m_activeProfileId));
    setConnectionState(state);
    m_statisticsTimer.start();

    if (m_session && m_session->hasPendingData()) {
        onSessionReadyRead();
    }

    if (m_session && !m_session->isOpen()) {
        onSessionClosed();
    }
}

void ConnectionManager::releaseSession()
{
    m_statisticsTimer.stop();
    if (!m_session) {
        return;
    }

    const std::shared_ptr<ProtocolSession> session = std::move(m_session);
    m_session.reset();
    QObject::disconnect(session.get(), nullptr, this, nullptr);
    session->close();
}

void ConnectionManager::cancelAttempt()
{
    if (m_cancelFlag) {
        m_cancelFlag->store(true);
        m_cancelFlag.reset();
    }
    ++m_attemptId;
}

void ConnectionManager::appendLog(const QString& message)
{
    emit logLine(QStringLiteral("[Connection] %1").arg(message));
}
