module;
#include <QString>

#include <functional>
#include <map>
#include <memory>
#include <utility>

module vlesstunnel.core.transportfactory;

TransportFactory::TransportFactory()
{
    m_creators[TransportKind::Plain] = [](const ServerProfile&, const TransportOptions& options) {
        return std::make_unique<TcpTransport>(options);
    };

    m_creators[TransportKind::Tls] = [](const ServerProfile& profile, const TransportOptions& options)
        -> std::unique_ptr<Transport> {
        const auto *tls = profile.transport.get<TlsConfig>();
        if (!tls) {
            return nullptr;
        }
        return std::make_unique<TlsTransport>(tls->serverName, tls->alpn, tls->allowInsecure, options);
    };
}

void TransportFactory::setCreator(TransportKind kind, Creator creator)
{
    if (!creator) {
        m_creators.erase(kind);
        return;
    }
    m_creators[kind] = std::move(creator);
}

bool TransportFactory::supports(TransportKind kind) const
{
    return m_creators.find(kind) != m_creators.end();
}

std::unique_ptr<Transport> TransportFactory::create(const ServerProfile& profile, const TransportOptions& options,
                                                    QString *errorMessage) const
{
    const TransportKind kind = profile.transport.kind();
    const auto it = m_creators.find(kind);
    if (it == m_creators.end()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Transport '%1' is not available in this build.").arg(transportKindName(kind));
        }
        return nullptr;
    }

    std::unique_ptr<Transport> transport = it->second(profile, options);
    if (!transport && errorMessage) {
        *errorMessage = QStringLiteral("Transport '%1' could not be created for profile %2.")
                            .arg(transportKindName(kind), profile.displayLabel());
    }
    return transport;
}
