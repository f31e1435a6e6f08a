/*!
 * @file        systemlog.cppm
 * @brief       Bounded, sanitized in-memory log for VlessTunnel.
 *
 * @details
 * Collects `logLine` output from the core components into a ring of
 * recent lines. Every line is sanitized before it is stored so user UUIDs
 * and labelled secrets never reach the buffer or its observers.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.systemlog;
#endif

#ifdef Q_MOC_RUN
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @class SystemLog
 * @brief Ring buffer of recent log lines.
 *
 * @details
 * Consecutive duplicates are dropped and at most `kMaxLogLines` lines are
 * retained. Logging can be switched off at runtime.
 */
VLESSTUNNEL_MODULE_EXPORT class SystemLog : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool enabled READ isEnabled WRITE setEnabled NOTIFY enabledChanged)
    Q_PROPERTY(QString latestLine READ latestLine NOTIFY logsChanged)
    Q_PROPERTY(QStringList recentLogs READ recentLogs NOTIFY logsChanged)

public:
    //! Maximum number of retained lines.
    static constexpr int kMaxLogLines = 200;

    /**
     * @brief Construct log.
     * @param parent Optional QObject parent.
     */
    explicit SystemLog(QObject *parent = nullptr);

    /**
     * @brief Whether lines are recorded.
     * @return True when enabled.
     */
    bool isEnabled() const;

    /**
     * @brief Enable or disable recording.
     * @param enabled New value.
     */
    void setEnabled(bool enabled);

    /**
     * @brief Retained lines, oldest first.
     * @return Line list.
     */
    QStringList recentLogs() const;

    /**
     * @brief Most recent retained line.
     * @return Line text or empty string.
     */
    QString latestLine() const;

    /**
     * @brief Drop all retained lines.
     */
    void clear();

    /**
     * @brief Redact UUIDs and labelled secrets from a line.
     * @param message Raw text.
     * @return Sanitized text.
     */
    static QString sanitize(const QString& message);

public slots:
    /**
     * @brief Sanitize and record a line.
     * @param message Raw text.
     */
    void append(const QString& message);

signals:
    //! Emitted when the retained line list changes.
    void logsChanged();
    //! Emitted with each newly recorded, sanitized line.
    void lineAppended(const QString& line);
    //! Emitted when the enabled flag changes.
    void enabledChanged();

private:
    QStringList m_recentLogs;   //!< Retained lines.
    bool m_enabled = true;      //!< Recording flag.
};

#include "systemlog.moc"
