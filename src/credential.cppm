/*!
 * @file        credential.cppm
 * @brief       Tunnel credential value type.
 *
 * @details
 * Wraps the 128-bit user UUID that authenticates a tunnel session. Text
 * input is validated strictly, the binary form follows RFC 4122 byte
 * order, and a redacted rendering is provided for anything user-visible.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QString>
#include <QUuid>

#include <optional>

export module vlesstunnel.core.credential;

/**
 * @class Credential
 * @brief Opaque user UUID.
 *
 * @details
 * Only the protocol codec reads the raw bytes. The value is passed by
 * value into a single connect call and is never persisted or logged in
 * cleartext by the core.
 */
export class Credential
{
public:
    //! Length of the canonical hyphenated text form.
    static constexpr int kTextLength = 36;
    //! Length of the binary form.
    static constexpr int kByteLength = 16;

    /**
     * @brief Construct a null credential.
     */
    Credential() = default;

    /**
     * @brief Parse the canonical 8-4-4-4-12 hexadecimal form.
     * @param text Input text, surrounding whitespace ignored.
     * @param errorMessage Optional output message on failure.
     * @return Credential or empty optional.
     */
    static std::optional<Credential> fromString(const QString& text, QString *errorMessage = nullptr);

    /**
     * @brief Build a credential from 16 raw bytes in RFC 4122 order.
     * @param bytes Binary UUID.
     * @param errorMessage Optional output message on failure.
     * @return Credential or empty optional.
     */
    static std::optional<Credential> fromRfc4122(const QByteArray& bytes, QString *errorMessage = nullptr);

    /**
     * @brief Binary form written into the request header.
     * @return 16 bytes in RFC 4122 order.
     */
    QByteArray toRfc4122() const;

    /**
     * @brief Canonical lowercase text form.
     * @return Hyphenated UUID text.
     *
     * @details Only link export uses this; never pass it to a log.
     */
    QString toString() const;

    /**
     * @brief Redacted form safe for logs and UI.
     * @return Text keeping only the last four hex digits.
     */
    QString redacted() const;

    /**
     * @brief Whether no UUID is held.
     * @return True for a default-constructed or cleared credential.
     *
     * @details The nil UUID is a held value and is not null here.
     */
    bool isNull() const;

    /**
     * @brief Drop the held UUID.
     */
    void clear();

    bool operator==(const Credential& other) const = default;

private:
    explicit Credential(const QUuid& uuid);

    static void setError(QString *errorMessage, const QString& error);

    QUuid m_uuid;           //!< Held UUID value.
    bool m_present = false; //!< A value was parsed and not cleared.
};
