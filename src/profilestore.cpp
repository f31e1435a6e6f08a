module;
#include <QHash>
#include <QList>
#include <QString>

#include <optional>

module vlesstunnel.core.profilestore;

std::optional<ServerProfile> InMemoryProfileStore::profile(const QString& profileId) const
{
    for (const ServerProfile& profile : m_profiles) {
        if (profile.id == profileId) {
            return profile;
        }
    }
    return std::nullopt;
}

void InMemoryProfileStore::insert(const ServerProfile& profile)
{
    for (ServerProfile& existing : m_profiles) {
        if (existing.id == profile.id) {
            existing = profile;
            return;
        }
    }
    m_profiles.append(profile);
}

bool InMemoryProfileStore::remove(const QString& profileId)
{
    for (qsizetype i = 0; i < m_profiles.size(); ++i) {
        if (m_profiles.at(i).id == profileId) {
            m_profiles.removeAt(i);
            return true;
        }
    }
    return false;
}

QList<ServerProfile> InMemoryProfileStore::profiles() const
{
    return m_profiles;
}

std::optional<Credential> InMemoryCredentialVault::credential(const QString& profileId, VaultError *error) const
{
    const auto it = m_values.constFind(profileId);
    if (it == m_values.constEnd()) {
        if (error) {
            error->kind = VaultError::Kind::NotFound;
            error->message = QStringLiteral("No credential stored for profile %1.").arg(profileId);
        }
        return std::nullopt;
    }

    QString parseError;
    const auto parsed = Credential::fromString(it.value(), &parseError);
    if (!parsed.has_value()) {
        if (error) {
            error->kind = VaultError::Kind::Corrupt;
            error->message = QStringLiteral("Stored credential for profile %1 is corrupt: %2").arg(profileId, parseError);
        }
        return std::nullopt;
    }

    return parsed;
}

void InMemoryCredentialVault::store(const QString& profileId, const Credential& credential)
{
    m_values.insert(profileId, credential.toString());
}

void InMemoryCredentialVault::storeRaw(const QString& profileId, const QString& value)
{
    m_values.insert(profileId, value);
}

bool InMemoryCredentialVault::remove(const QString& profileId)
{
    return m_values.remove(profileId) > 0;
}
