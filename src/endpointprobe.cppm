/*!
 * @file        endpointprobe.cppm
 * @brief       TCP reachability probe for server endpoints.
 *
 * @details
 * Measures how long a TCP connect to a profile endpoint takes, without
 * running a tunnel handshake. Used to test a profile before connecting.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module vlesstunnel.core.endpointprobe;
import vlesstunnel.core.serverprofile;
#endif

#ifdef Q_MOC_RUN
struct ServerEndpoint;
#define VLESSTUNNEL_MODULE_EXPORT
#else
#define VLESSTUNNEL_MODULE_EXPORT export
#endif

/**
 * @class EndpointProbe
 * @brief Asynchronous TCP connect latency probe.
 */
VLESSTUNNEL_MODULE_EXPORT class EndpointProbe : public QObject
{
    Q_OBJECT

public:
    //! Default probe deadline.
    static constexpr int kDefaultTimeoutMs = 3200;

    /**
     * @brief Construct probe.
     * @param parent Optional QObject parent.
     */
    explicit EndpointProbe(QObject *parent = nullptr);

    /**
     * @brief Set probe deadline.
     * @param timeoutMs Deadline in milliseconds.
     */
    void setTimeout(int timeoutMs);

    /**
     * @brief Start probing an endpoint.
     * @param endpoint Endpoint to connect to.
     *
     * @details Emits `finished()` exactly once per call.
     */
    void probe(const ServerEndpoint& endpoint);

signals:
    //! Emitted with connect latency in milliseconds, or -1 on failure or timeout.
    void finished(int latencyMs);

private:
    int m_timeoutMs = kDefaultTimeoutMs; //!< Probe deadline.
};

#include "endpointprobe.moc"
