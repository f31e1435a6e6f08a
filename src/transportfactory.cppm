/*!
 * @file        transportfactory.cppm
 * @brief       Maps profile transport settings to transport instances.
 *
 * @details
 * The factory dispatches on `TransportConfig::kind()`. Plain and TLS
 * creators are registered by default; framed transports (WebSocket,
 * gRPC, HTTP2) become available once a creator is registered for them.
 * Creators run on the connect worker thread and must be thread-safe.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

#include <functional>
#include <map>
#include <memory>

export module vlesstunnel.core.transportfactory;
import vlesstunnel.core.serverprofile;
import vlesstunnel.core.transport;

/**
 * @class TransportFactory
 * @brief Builds the transport selected by a profile.
 */
export class TransportFactory
{
public:
    //! Builds an unopened transport for a profile.
    using Creator = std::function<std::unique_ptr<Transport>(const ServerProfile& profile, const TransportOptions& options)>;

    /**
     * @brief Construct a factory with plain and TLS creators.
     */
    TransportFactory();

    /**
     * @brief Register or replace the creator for a transport kind.
     * @param kind Transport kind.
     * @param creator Creator, or an empty function to unregister.
     */
    void setCreator(TransportKind kind, Creator creator);

    /**
     * @brief Whether a creator is registered for a kind.
     * @param kind Transport kind.
     * @return True when `create` can build this kind.
     */
    bool supports(TransportKind kind) const;

    /**
     * @brief Build the transport for a profile.
     * @param profile Profile whose transport settings are used.
     * @param options Timeouts, binding and cancellation hook.
     * @param errorMessage Optional output message on failure.
     * @return Unopened transport or nullptr.
     */
    std::unique_ptr<Transport> create(const ServerProfile& profile, const TransportOptions& options,
                                      QString *errorMessage = nullptr) const;

private:
    std::map<TransportKind, Creator> m_creators; //!< Registered creators per kind.
};
