module;
#include <QRegularExpression>
#include <QString>
#include <QStringList>

module vlesstunnel.core.systemlog;

namespace {
const QString kRedactedUuid = QStringLiteral("[REDACTED_UUID]");
const QString kRedactedSecret = QStringLiteral("[REDACTED_SECRET]");

const QRegularExpression& uuidPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}"));
    return pattern;
}

const QRegularExpression& labelledSecretPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("\\b(private[_\\s]?key|secret[_\\s]?key|password|token|auth)(\\s*[:=]\\s*)([^\\s,}\\]&]+)"),
        QRegularExpression::CaseInsensitiveOption);
    return pattern;
}

const QRegularExpression& vlessUserInfoPattern()
{
    static const QRegularExpression pattern(QStringLiteral("(vless://)[^@\\s]+@"), QRegularExpression::CaseInsensitiveOption);
    return pattern;
}
}

SystemLog::SystemLog(QObject *parent)
    : QObject(parent)
{
}

bool SystemLog::isEnabled() const
{
    return m_enabled;
}

void SystemLog::setEnabled(bool enabled)
{
    if (m_enabled == enabled) {
        return;
    }

    m_enabled = enabled;
    emit enabledChanged();
}

QStringList SystemLog::recentLogs() const
{
    return m_recentLogs;
}

QString SystemLog::latestLine() const
{
    return m_recentLogs.isEmpty() ? QString() : m_recentLogs.last();
}

void SystemLog::clear()
{
    if (m_recentLogs.isEmpty()) {
        return;
    }
    m_recentLogs.clear();
    emit logsChanged();
}

QString SystemLog::sanitize(const QString& message)
{
    QString sanitized = message;
    sanitized.replace(vlessUserInfoPattern(), QStringLiteral("\\1") + kRedactedSecret + QStringLiteral("@"));
    sanitized.replace(uuidPattern(), kRedactedUuid);

    QString result;
    qsizetype last = 0;
    auto it = labelledSecretPattern().globalMatch(sanitized);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        if (match.captured(3).startsWith(QLatin1Char('['))) {
            continue;
        }
        result += sanitized.mid(last, match.capturedStart(3) - last);
        result += kRedactedSecret;
        last = match.capturedEnd(3);
    }
    result += sanitized.mid(last);
    return result;
}

void SystemLog::append(const QString& message)
{
    if (!m_enabled) {
        return;
    }

    const QString line = sanitize(message.trimmed());
    if (line.isEmpty()) {
        return;
    }

    const bool duplicate = !m_recentLogs.isEmpty() && m_recentLogs.last() == line;
    if (duplicate) {
        return;
    }

    m_recentLogs.append(line);
    while (m_recentLogs.size() > kMaxLogLines) {
        m_recentLogs.removeFirst();
    }
    emit lineAppended(line);
    emit logsChanged();
}
