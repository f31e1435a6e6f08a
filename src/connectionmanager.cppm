/*!
 * @file        connectionmanager.cppm
 * @brief       Tunnel lifecycle controller for VlessTunnel.
 *
 * @details
 * Owns the current `ConnectionState` and the active `ProtocolSession`:
 * - resolves profiles and credentials through the store collaborators
 * - runs the blocking connect on a worker thread and adopts the session
 * - publishes every state transition
 * - samples traffic statistics on a fixed cadence
 * - moves payload between the session and the packet sink/source
 *
 * Disconnect requests cancel an in-flight connect and are announced
 * through `userDisconnected()` so the reconnect supervisor can stand down.
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
#include <QTimer>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.connectionmanager;
import vlesstunnel.core.connectionstate;
import vlesstunnel.core.networkmonitor;
import vlesstunnel.core.profilestore;
import vlesstunnel.core.protocolsession;
import vlesstunnel.core.transport;
import vlesstunnel.core.transportfactory;
#endif

#ifdef Q_MOC_RUN
namespace Tunnel {
enum class ConnectionPhase;
}
class ConnectionState;
class NetworkEvent;
class ProfileStore;
class CredentialVault;
class ProtocolSession;
class TransportFactory;
struct SessionError;
struct NetworkHandle;
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @class ConnectionManager
 * @brief Single source of truth for the tunnel lifecycle.
 *
 * @details
 * Transitions:
 * Disconnected/Error -> Connecting -> Connected | Error,
 * Connected -> Error (session dropped),
 * Connecting/Connected/Error -> Disconnecting -> Disconnected.
 * All transitions happen on the thread that owns the manager.
 */
VLESSTUNNEL_MODULE_EXPORT class ConnectionManager : public QObject
{
    Q_OBJECT

    Q_PROPERTY(ConnectionPhase phase READ phase NOTIFY phaseChanged)
    Q_PROPERTY(bool connected READ connected NOTIFY phaseChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY phaseChanged)
    Q_PROPERTY(QString activeProfileId READ activeProfileId NOTIFY phaseChanged)

public:
    //! Default statistics sampling cadence.
    static constexpr int kDefaultStatisticsIntervalMs = 2000;

    /**
     * @brief Construct manager.
     * @param profiles Profile lookup, must outlive the manager.
     * @param vault Credential lookup, must outlive the manager.
     * @param factory Transport factory copied into each connect attempt.
     * @param parent Optional QObject parent.
     */
    ConnectionManager(const ProfileStore& profiles, const CredentialVault& vault,
                      TransportFactory factory, QObject *parent = nullptr);

    /**
     * @brief Cancel any attempt and close the session.
     */
    ~ConnectionManager() override;

    /**
     * @brief Current lifecycle state.
     * @return State value.
     */
    const ConnectionState& connectionState() const;

    /**
     * @brief Flat phase of the current state.
     * @return Phase enum value.
     */
    ConnectionPhase phase() const;

    /**
     * @brief Whether a session is established.
     * @return True in Connected.
     */
    bool connected() const;

    /**
     * @brief Whether a transition is in progress.
     * @return True in Connecting or Disconnecting.
     */
    bool busy() const;

    /**
     * @brief Profile of the current attempt or session.
     * @return Profile id or empty string.
     */
    QString activeProfileId() const;

    /**
     * @brief Latest statistics snapshot. Never blocks.
     * @return Statistics while Connected, otherwise empty optional.
     */
    std::optional<ConnectionStatistics> statistics() const;

    /**
     * @brief Set transport deadlines used by subsequent attempts.
     * @param connectTimeout Connect and TLS handshake deadline.
     * @param readTimeout Blocking read deadline.
     */
    void setTimeouts(std::chrono::milliseconds connectTimeout, std::chrono::milliseconds readTimeout);

    /**
     * @brief Set the statistics sampling cadence.
     * @param intervalMs Interval in milliseconds.
     */
    void setStatisticsInterval(int intervalMs);

    /**
     * @brief Network the next attempt binds to.
     * @return Handle, or empty optional for the default route.
     */
    std::optional<NetworkHandle> networkHandle() const;

    /**
     * @brief Start connecting to a profile.
     * @param profileId Profile identifier.
     * @param errorMessage Optional output message on rejection or failure.
     * @return True when an attempt was started.
     *
     * @details Rejected while Connecting, Connected or Disconnecting.
     * Profile, vault and validation failures enter a non-recoverable
     * Error state and return false.
     */
    bool connectToProfile(const QString& profileId, QString *errorMessage = nullptr);

    /**
     * @brief Drop the current session and connect again.
     * @param profileId Profile identifier.
     * @param errorMessage Optional output message on rejection or failure.
     * @return True when an attempt was started.
     *
     * @details Unlike `disconnect()`, this is not a user disconnect and
     * does not emit `userDisconnected()`.
     */
    bool reconnect(const QString& profileId, QString *errorMessage = nullptr);

    /**
     * @brief Tear down the tunnel. Always succeeds.
     */
    Q_INVOKABLE void disconnect();

    /**
     * @brief Send payload through the active session.
     * @param payload Bytes from the packet source.
     * @param error Optional output error on failure.
     * @return True when the bytes were accepted.
     *
     * @details A send failure on the active session ends it with a
     * recoverable Error state.
     */
    bool forward(const QByteArray& payload, SessionError *error = nullptr);

public slots:
    /**
     * @brief Track the network to bind subsequent attempts to.
     * @param event Network notification.
     */
    void onNetworkEvent(const NetworkEvent& event);

signals:
    //! Emitted on every state transition with the new state.
    void connectionStateChanged(const ConnectionState& state);
    //! Emitted when the flat phase changes.
    void phaseChanged();
    //! Emitted after each statistics sample.
    void statisticsChanged();
    //! Emitted when the user requested a disconnect.
    void userDisconnected();
    //! Emitted with payload received from the server.
    void payloadReceived(const QByteArray& payload);
    //! Emitted for each diagnostic line.
    void logLine(const QString& line);

private slots:
    //! Drain readable payload from the session.
    void onSessionReadyRead();
    //! Handle the session transport dropping.
    void onSessionClosed();
    //! Refresh the statistics snapshot.
    void onStatisticsTick();

private:
    /**
     * @brief Publish a new state when it differs from the current one.
     * @param state New state.
     */
    void setConnectionState(const ConnectionState& state);

    /**
     * @brief Enter a failure state with a sanitized reason.
     * @param reason Failure text.
     * @param recoverable Whether the supervisor may retry.
     */
    void fail(const QString& reason, bool recoverable);

    /**
     * @brief Handle the worker result of a connect attempt.
     * @param attemptId Attempt the result belongs to.
     * @param session Established session or nullptr.
     * @param errorMessage Failure text when `session` is null.
     * @param recoverable Whether the failure may be retried.
     */
    void finishConnect(quint64 attemptId, const std::shared_ptr<ProtocolSession>& session,
                       const QString& errorMessage, bool recoverable);

    /**
     * @brief Take ownership of an established session.
     * @param session Session moved to this thread.
     */
    void adoptSession(const std::shared_ptr<ProtocolSession>& session);

    /**
     * @brief Disconnect, close and release the active session.
     */
    void releaseSession();

    /**
     * @brief Flag the in-flight attempt as cancelled and forget it.
     */
    void cancelAttempt();

    /**
     * @brief Log helper with the component prefix.
     * @param message Text to log.
     */
    void appendLog(const QString& message);

    const ProfileStore& m_profiles;                          //!< Profile lookup.
    const CredentialVault& m_vault;                          //!< Credential lookup.
    std::unique_ptr<TransportFactory> m_factory;             //!< Transport factory.

    ConnectionState m_state;                                 //!< Current lifecycle state.
    QString m_activeProfileId;                               //!< Profile of attempt or session.
    std::shared_ptr<ProtocolSession> m_session;              //!< Active session slot.
    quint64 m_attemptId = 0;                                 //!< Id of the latest attempt.
    std::shared_ptr<std::atomic_bool> m_cancelFlag;          //!< Cancellation flag of the latest attempt.

    std::chrono::milliseconds m_connectTimeout{15000};       //!< Transport connect deadline.
    std::chrono::milliseconds m_readTimeout{30000};          //!< Transport read deadline.
    std::optional<NetworkHandle> m_networkHandle;            //!< Binding hint from the network monitor.

    QTimer m_statisticsTimer;                                //!< Statistics cadence.
    QElapsedTimer m_sampleClock;                             //!< Time since last sample.
    quint64 m_lastSampleReceived = 0;                        //!< Received counter at last sample.
    quint64 m_lastSampleSent = 0;                            //!< Sent counter at last sample.
};

#include "connectionmanager.moc"
