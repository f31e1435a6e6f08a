/*!
 * @file        linkparser.cppm
 * @brief       Parser and exporter for VLESS share links.
 *
 * @details
 * Declares APIs for converting raw `vless://` link strings into a
 * normalized `ServerProfile` plus its `Credential`, and for composing a
 * share link back from a profile. Validation failures carry consistent,
 * user-facing error messages for import workflows.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QStringList>

#include <optional>

export module vlesstunnel.core.linkparser;
import vlesstunnel.core.credential;
import vlesstunnel.core.serverprofile;

/**
 * @struct ParsedLink
 * @brief Result of a successful link import.
 *
 * @details
 * The credential is returned separately so the caller can hand it to the
 * credential vault instead of storing it with the profile.
 */
export struct ParsedLink {
    ServerProfile profile;  //!< Normalized profile with a fresh id.
    Credential credential;  //!< User UUID from the link.
};

/**
 * @class LinkParser
 * @brief Parses and composes VLESS share links.
 *
 * @details
 * Accepted form:
 * `vless://<uuid>@<host>:<port>?type=&security=&sni=&alpn=&flow=&path=&host=&serviceName=&mode=#<label>`
 */
export class LinkParser
{
public:
    /**
     * @brief Parse a raw share link.
     * @param rawLink Input link string.
     * @param errorMessage Optional output message on failure.
     * @return Parsed profile and credential or empty optional.
     */
    static std::optional<ParsedLink> parse(const QString& rawLink, QString *errorMessage = nullptr);

    /**
     * @brief Compose a share link for a profile.
     * @param profile Source profile.
     * @param credential Credential to embed.
     * @param errorMessage Optional output message on failure.
     * @return Link text or empty optional for invalid profiles.
     */
    static std::optional<QString> compose(const ServerProfile& profile, const Credential& credential,
                                          QString *errorMessage = nullptr);

private:
    /**
     * @brief Split a comma separated list, dropping empty items.
     * @param value Raw query value.
     * @return Trimmed entries.
     */
    static QStringList splitList(const QString& value);

    /**
     * @brief Ensure a path begins with `/`.
     * @param path Raw path value.
     * @return Normalized path.
     */
    static QString normalizePath(const QString& path);

    /**
     * @brief Helper to set consistent parse errors.
     * @param errorMessage Optional output pointer.
     * @param error Message value.
     */
    static void setError(QString *errorMessage, const QString& error);
};
