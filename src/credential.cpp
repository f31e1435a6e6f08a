module;
#include <QByteArray>
#include <QRegularExpression>
#include <QString>
#include <QUuid>

#include <optional>

module vlesstunnel.core.credential;

namespace {
const QRegularExpression& canonicalUuidPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$"));
    return pattern;
}
}

Credential::Credential(const QUuid& uuid)
    : m_uuid(uuid)
    , m_present(true)
{
}

std::optional<Credential> Credential::fromString(const QString& text, QString *errorMessage)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        setError(errorMessage, QStringLiteral("UUID is empty."));
        return std::nullopt;
    }

    if (trimmed.size() != kTextLength || !canonicalUuidPattern().match(trimmed).hasMatch()) {
        setError(errorMessage, QStringLiteral("UUID must use the 8-4-4-4-12 hexadecimal format."));
        return std::nullopt;
    }

    return Credential(QUuid::fromString(trimmed));
}

std::optional<Credential> Credential::fromRfc4122(const QByteArray& bytes, QString *errorMessage)
{
    if (bytes.size() != kByteLength) {
        setError(errorMessage, QStringLiteral("UUID must be %1 bytes, got %2.").arg(kByteLength).arg(bytes.size()));
        return std::nullopt;
    }

    return Credential(QUuid::fromRfc4122(bytes));
}

QByteArray Credential::toRfc4122() const
{
    return m_uuid.toRfc4122();
}

QString Credential::toString() const
{
    return m_uuid.toString(QUuid::WithoutBraces);
}

QString Credential::redacted() const
{
    if (isNull()) {
        return QStringLiteral("<none>");
    }
    return QStringLiteral("****-%1").arg(toString().right(4));
}

bool Credential::isNull() const
{
    return !m_present;
}

void Credential::clear()
{
    m_uuid = QUuid();
    m_present = false;
}

void Credential::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
