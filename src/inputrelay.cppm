/*!
 * @file        inputrelay.cppm
 * @brief       Standard input relay for VlessTunnel.
 *
 * @details
 * Reads a file descriptor as data arrives and forwards each chunk through
 * the connection manager while the tunnel is connected. End of input stops
 * reading but keeps the tunnel open so the response can still arrive.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QSocketNotifier>
#include <QString>
#include <QTimer>

#include <chrono>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.inputrelay;
import vlesstunnel.core.connectionmanager;
#endif

#ifdef Q_MOC_RUN
class ConnectionManager;
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @class InputRelay
 * @brief Moves bytes from a readable descriptor into the active session.
 *
 * @details
 * Each readiness notification performs exactly one `read()` and forwards
 * what it returned, so partial input is never held back. Reading pauses
 * while the manager is not connected.
 *
 * After end of input the relay waits for the session to close or for the
 * drain timeout to pass without server payload, then emits `finished()`.
 */
VLESSTUNNEL_MODULE_EXPORT class InputRelay : public QObject
{
    Q_OBJECT

public:
    static constexpr qint64 kChunkSize = 16 * 1024;
    static constexpr int kDefaultDrainTimeoutMs = 30000;

    InputRelay(int fd, ConnectionManager& manager, QObject *parent = nullptr);
    ~InputRelay() override;

    /**
     * @brief Idle time allowed after end of input before finishing.
     * @details Every payload from the server restarts the countdown.
     */
    void setDrainTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Begin watching the descriptor.
     * @param errorMessage Set when the descriptor cannot be watched.
     * @return True when the relay is running.
     */
    bool start(QString *errorMessage = nullptr);

    bool isInputClosed() const;
    bool isFinished() const;
    quint64 bytesForwarded() const;

signals:
    //! Emitted once when input is exhausted and the tunnel has drained.
    void finished();
    void logLine(const QString& line);

private slots:
    void onReadable();
    void onPhaseChanged();
    void onPayloadReceived();
    void onDrainTimeout();

private:
    void closeInput(const QString& reason);
    void finish(const QString& reason);
    void updateNotifier();
    void appendLog(const QString& message);

    int m_fd = -1;
    ConnectionManager& m_manager;
    QSocketNotifier *m_notifier = nullptr;
    QTimer m_drainTimer;
    bool m_inputClosed = false;
    bool m_finished = false;
    quint64 m_bytesForwarded = 0;
};

#include "inputrelay.moc"
