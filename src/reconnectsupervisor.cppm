/*!
 * @file        reconnectsupervisor.cppm
 * @brief       Automatic reconnect policy for VlessTunnel.
 *
 * @details
 * Watches connection state and network notifications and asks for a new
 * connect attempt after recoverable failures, using exponential backoff
 * capped at one minute. A manual disconnect disarms it until the next
 * `enable()`.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QTimer>

#include <chrono>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.reconnectsupervisor;
import vlesstunnel.core.connectionstate;
import vlesstunnel.core.networkmonitor;
#endif

#ifdef Q_MOC_RUN
class ConnectionState;
class NetworkEvent;
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @class ReconnectSupervisor
 * @brief Schedules reconnect requests for one armed profile.
 *
 * @details
 * The supervisor never touches a session. It only emits
 * `reconnectRequested()`, which the owner routes to the connection manager.
 *
 * `disable()` disarms it after a user disconnect. With `setArmOnConnect(true)`
 * the next established session re-arms it for that session's profile;
 * otherwise the owner calls `enable()` again.
 */
VLESSTUNNEL_MODULE_EXPORT class ReconnectSupervisor : public QObject
{
    Q_OBJECT

public:
    //! Upper bound of the backoff delay in seconds.
    static constexpr int kMaxBackoffSeconds = 60;
    //! Consecutive failures after which a warning is logged.
    static constexpr int kWarnAfterAttempts = 5;

    /**
     * @brief Construct supervisor.
     * @param parent Optional QObject parent.
     */
    explicit ReconnectSupervisor(QObject *parent = nullptr);

    /**
     * @brief Backoff delay for a retry attempt.
     * @param attempt One-based attempt number; values below 1 count as 1.
     * @return `min(60, 2^(attempt-1))` seconds.
     */
    static std::chrono::seconds backoffDelay(int attempt);

    /**
     * @brief Arm for a profile and reset the context.
     * @param profileId Profile to reconnect.
     */
    void enable(const QString& profileId);

    /**
     * @brief Disarm after a manual disconnect and drop any pending retry.
     */
    void disable();

    /**
     * @brief Consecutive failures since the last reset.
     * @return Attempt counter.
     */
    int attemptCount() const;

    /**
     * @brief Whether the supervisor watches a profile.
     * @return True after `enable()` until `disable()`.
     */
    bool isArmed() const;

    /**
     * @brief Whether the last stop came from the user.
     * @return Manual-disconnect flag.
     */
    bool isManualDisconnect() const;

    /**
     * @brief Whether a backoff retry is pending.
     * @return True while the retry timer runs.
     */
    bool isRetryScheduled() const;

    /**
     * @brief Armed profile identifier.
     * @return Profile id or empty string.
     */
    QString profileId() const;

    /**
     * @brief Re-arm automatically when a session is established while disarmed.
     * @param enabled New value.
     */
    void setArmOnConnect(bool enabled);

    /**
     * @brief Whether an established session re-arms the supervisor.
     * @return Arm-on-connect flag.
     */
    bool armOnConnect() const;

    /**
     * @brief Scale backoff delays.
     * @param unit Duration of one backoff second.
     */
    void setDelayUnit(std::chrono::milliseconds unit);

public slots:
    /**
     * @brief React to a connection state transition.
     * @param state New state.
     */
    void onConnectionStateChanged(const ConnectionState& state);

    /**
     * @brief React to a network notification.
     * @param event Network event.
     */
    void onNetworkEvent(const NetworkEvent& event);

signals:
    //! Emitted when the armed profile should be connected again.
    void reconnectRequested(const QString& profileId);
    //! Emitted when a retry is scheduled.
    void reconnectScheduled(int attempt, int delaySeconds);
    //! Emitted for each diagnostic line.
    void logLine(const QString& line);

private slots:
    void onRetryTimeout();

private:
    bool canRetry() const;
    void scheduleRetry();
    void appendLog(const QString& message);

    QString m_profileId;                          //!< Armed profile.
    int m_attemptCount = 0;                       //!< Consecutive failures.
    bool m_armed = false;                         //!< Armed flag.
    bool m_manualDisconnect = false;              //!< Set by `disable()`.
    bool m_networkLost = false;                   //!< Connectivity lost since the last available event.
    bool m_armOnConnect = false;                  //!< Connected state re-arms after `disable()`.
    std::chrono::milliseconds m_delayUnit{1000};  //!< Length of one backoff second.
    QTimer m_retryTimer;                          //!< Pending retry.
};

#include "reconnectsupervisor.moc"
