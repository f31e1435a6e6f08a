/*!
 * @file        profilestore.cppm
 * @brief       Profile and credential lookup interfaces.
 *
 * @details
 * The connection manager resolves profiles through `ProfileStore` and
 * credentials through `CredentialVault`. Persistent and platform-backed
 * implementations live outside the core; in-memory implementations are
 * provided for the command-line client and tests.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QHash>
#include <QList>
#include <QString>

#include <optional>

export module vlesstunnel.core.profilestore;
import vlesstunnel.core.credential;
import vlesstunnel.core.serverprofile;

/**
 * @struct VaultError
 * @brief Credential lookup failure.
 */
export struct VaultError {
    enum class Kind
    {
        NotFound,  //!< No credential stored for the profile.
        Corrupt    //!< Stored value is not a valid UUID.
    };

    Kind kind = Kind::NotFound;  //!< Failure category.
    QString message;             //!< Human-readable detail, never the secret itself.
};

/**
 * @class ProfileStore
 * @brief Read access to server profiles.
 */
export class ProfileStore
{
public:
    virtual ~ProfileStore() = default;

    /**
     * @brief Look up a profile.
     * @param profileId Profile identifier.
     * @return Profile or empty optional.
     */
    virtual std::optional<ServerProfile> profile(const QString& profileId) const = 0;
};

/**
 * @class CredentialVault
 * @brief Read access to per-profile credentials.
 */
export class CredentialVault
{
public:
    virtual ~CredentialVault() = default;

    /**
     * @brief Fetch the credential of a profile.
     * @param profileId Profile identifier.
     * @param error Optional output error on failure.
     * @return Credential or empty optional.
     */
    virtual std::optional<Credential> credential(const QString& profileId, VaultError *error = nullptr) const = 0;
};

/**
 * @class InMemoryProfileStore
 * @brief Profile store kept in process memory.
 */
export class InMemoryProfileStore : public ProfileStore
{
public:
    std::optional<ServerProfile> profile(const QString& profileId) const override;

    /**
     * @brief Add or replace a profile by id.
     * @param profile Profile to store.
     */
    void insert(const ServerProfile& profile);

    /**
     * @brief Remove a profile.
     * @param profileId Profile identifier.
     * @return True when a profile was removed.
     */
    bool remove(const QString& profileId);

    /**
     * @brief All stored profiles.
     * @return Profiles in insertion order.
     */
    QList<ServerProfile> profiles() const;

private:
    QList<ServerProfile> m_profiles; //!< Stored profiles.
};

/**
 * @class InMemoryCredentialVault
 * @brief Credential vault kept in process memory.
 *
 * @details
 * Values are kept in text form and validated on every read, so a
 * corrupted entry surfaces as `VaultError::Kind::Corrupt`.
 */
export class InMemoryCredentialVault : public CredentialVault
{
public:
    std::optional<Credential> credential(const QString& profileId, VaultError *error = nullptr) const override;

    /**
     * @brief Store a credential for a profile.
     * @param profileId Profile identifier.
     * @param credential Credential to store.
     */
    void store(const QString& profileId, const Credential& credential);

    /**
     * @brief Store a raw text value for a profile.
     * @param profileId Profile identifier.
     * @param value Text value, validated on read.
     */
    void storeRaw(const QString& profileId, const QString& value);

    /**
     * @brief Remove the credential of a profile.
     * @param profileId Profile identifier.
     * @return True when a value was removed.
     */
    bool remove(const QString& profileId);

private:
    QHash<QString, QString> m_values; //!< Text values keyed by profile id.
};
