/*!
 * @file        tunnelsettings.cppm
 * @brief       Persistent client settings.
 *
 * @details
 * Groups the tunables of the client (transport timeouts, statistics
 * cadence, reconnect and logging switches, interface binding) and maps
 * them to `QSettings` keys.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QSettings>
#include <QString>

export module vlesstunnel.core.tunnelsettings;

/**
 * @struct TunnelSettings
 * @brief Client settings with defaults.
 */
export struct TunnelSettings {
    int connectTimeoutMs = 15000;       //!< Transport connect and TLS handshake deadline.
    int readTimeoutMs = 30000;          //!< Blocking read deadline.
    int statisticsIntervalMs = 2000;    //!< Statistics sampling cadence.
    bool autoReconnect = true;          //!< Arm the reconnect supervisor on connect.
    bool loggingEnabled = true;         //!< Record system log lines.
    QString bindInterface;              //!< Interface to bind sockets to, empty for default route.

    /**
     * @brief Load settings, keeping defaults for missing or invalid keys.
     * @param settings Source store.
     * @return Loaded settings.
     */
    static TunnelSettings load(QSettings& settings);

    /**
     * @brief Write settings.
     * @param settings Target store.
     */
    void save(QSettings& settings) const;

    bool operator==(const TunnelSettings&) const = default;
};
