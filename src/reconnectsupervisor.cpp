module;
#include <QObject>
#include <QString>
#include <QTimer>

#include <chrono>

module vlesstunnel.core.reconnectsupervisor;

ReconnectSupervisor::ReconnectSupervisor(QObject *parent)
    : QObject(parent)
{
    m_retryTimer.setSingleShot(true);
    connect(&m_retryTimer, &QTimer::timeout, this, &ReconnectSupervisor::onRetryTimeout);
}

std::chrono::seconds ReconnectSupervisor::backoffDelay(int attempt)
{
    if (attempt <= 1) {
        return std::chrono::seconds(1);
    }
    // 2^(attempt-1) is past the cap from here on.
    if (attempt > 7) {
        return std::chrono::seconds(kMaxBackoffSeconds);
    }
    const int delay = 1 << (attempt - 1);
    return std::chrono::seconds(qMin(kMaxBackoffSeconds, delay));
}

void ReconnectSupervisor::enable(const QString& profileId)
{
    m_retryTimer.stop();
    m_profileId = profileId;
    m_attemptCount = 0;
    m_armed = true;
    m_manualDisconnect = false;
    appendLog(QStringLiteral("Auto-reconnect armed for %1.").arg(profileId));
}

void ReconnectSupervisor::disable()
{
    m_retryTimer.stop();
    const bool wasArmed = m_armed;
    m_armed = false;
    m_manualDisconnect = true;
    m_attemptCount = 0;
    if (wasArmed) {
        appendLog(QStringLiteral("Auto-reconnect disabled."));
    }
}

int ReconnectSupervisor::attemptCount() const
{
    return m_attemptCount;
}

bool ReconnectSupervisor::isArmed() const
{
    return m_armed;
}

bool ReconnectSupervisor::isManualDisconnect() const
{
    return m_manualDisconnect;
}

bool ReconnectSupervisor::isRetryScheduled() const
{
    return m_retryTimer.isActive();
}

QString ReconnectSupervisor::profileId() const
{
    return m_profileId;
}

void ReconnectSupervisor::setArmOnConnect(bool enabled)
{
    m_armOnConnect = enabled;
}

bool ReconnectSupervisor::armOnConnect() const
{
    return m_armOnConnect;
}

void ReconnectSupervisor::setDelayUnit(std::chrono::milliseconds unit)
{
    if (unit.count() > 0) {
        m_delayUnit = unit;
    }
}

void ReconnectSupervisor::onConnectionStateChanged(const ConnectionState& state)
{
    if (const auto *connected = state.get<ConnectedState>()) {
        m_retryTimer.stop();
        m_attemptCount = 0;
        if (!m_armed && m_armOnConnect && !connected->profileId.isEmpty()) {
            enable(connected->profileId);
        }
        return;
    }

    const auto *error = state.get<ErrorState>();
    if (!error || !canRetry()) {
        return;
    }

    if (!error->recoverable) {
        appendLog(QStringLiteral("Not retrying: %1").arg(error->reason));
        return;
    }

    scheduleRetry();
}

void ReconnectSupervisor::onNetworkEvent(const NetworkEvent& event)
{
    if (event.isLoss()) {
        if (!m_networkLost) {
            appendLog(QStringLiteral("Network lost: %1").arg(event.describe()));
        }
        m_networkLost = true;
        return;
    }

    if (!event.get<NetworkAvailable>() || !m_networkLost) {
        return;
    }

    m_networkLost = false;
    if (!canRetry()) {
        return;
    }

    m_retryTimer.stop();
    m_attemptCount = 0;
    appendLog(QStringLiteral("Network available again, reconnecting %1.").arg(m_profileId));
    emit reconnectRequested(m_profileId);
}

void ReconnectSupervisor::onRetryTimeout()
{
    if (!canRetry()) {
        return;
    }
    emit reconnectRequested(m_profileId);
}

bool ReconnectSupervisor::canRetry() const
{
    return m_armed && !m_manualDisconnect && !m_profileId.isEmpty();
}

void ReconnectSupervisor::scheduleRetry()
{
    ++m_attemptCount;
    const std::chrono::seconds delay = backoffDelay(m_attemptCount);

    if (m_attemptCount >= kWarnAfterAttempts) {
        appendLog(QStringLiteral("Connection failed multiple times (%1 attempts). Check the server and network.")
                      .arg(m_attemptCount));
    }
    appendLog(QStringLiteral("Retrying in %1 s (attempt %2).").arg(delay.count()).arg(m_attemptCount));

    m_retryTimer.start(static_cast<int>(delay.count() * m_delayUnit.count()));
    emit reconnectScheduled(m_attemptCount, static_cast<int>(delay.count()));
}

void ReconnectSupervisor::appendLog(const QString& message)
{
    emit logLine(QStringLiteral("[Reconnect] %1").arg(message));
}
