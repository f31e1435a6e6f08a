#include <QByteArray>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QObject>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <QtCore/qglobal.h>

#include <chrono>
#include <cstdio>
#include <optional>

import vlesstunnel.core.connectionmanager;
import vlesstunnel.core.connectionstate;
import vlesstunnel.core.credential;
import vlesstunnel.core.endpointprobe;
import vlesstunnel.core.inputrelay;
import vlesstunnel.core.linkparser;
import vlesstunnel.core.networkmonitor;
import vlesstunnel.core.profilestore;
import vlesstunnel.core.protocolsession;
import vlesstunnel.core.reconnectsupervisor;
import vlesstunnel.core.serverprofile;
import vlesstunnel.core.systemlog;
import vlesstunnel.core.transportfactory;
import vlesstunnel.core.tunnelsettings;

namespace {
constexpr int kExitUsage = 2;
constexpr int kExitInvalidLink = 3;
constexpr int kExitConnectFailed = 4;
constexpr int kExitProbeFailed = 5;

QTextStream& errStream()
{
    static QTextStream stream(stderr);
    return stream;
}

void printError(const QString& message)
{
    errStream() << message << Qt::endl;
}

std::optional<Destination> parseTarget(const QString& text, QString *errorMessage)
{
    const int colon = text.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0 || colon == text.size() - 1) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Target must be host:port.");
        }
        return std::nullopt;
    }

    QString host = text.left(colon).trimmed();
    if (host.startsWith(QLatin1Char('[')) && host.endsWith(QLatin1Char(']'))) {
        host = host.mid(1, host.size() - 2);
    }

    bool ok = false;
    const int port = text.mid(colon + 1).toInt(&ok);
    if (!ok || port <= 0 || port > 65535 || host.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Target must be host:port.");
        }
        return std::nullopt;
    }

    return Destination{host, static_cast<quint16>(port)};
}

int readMilliseconds(const QCommandLineParser& parser, const QCommandLineOption& option, int fallback)
{
    if (!parser.isSet(option)) {
        return fallback;
    }
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    return (ok && value >= 100) ? value : fallback;
}
}

auto main(int argc, char *argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("VlessTunnel"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("vlesstunnel.local"));
    QCoreApplication::setApplicationName(QStringLiteral("vlesstunnel"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("VLESS tunnel client. Relays stdin/stdout through the tunnel."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("link"), QStringLiteral("vless:// share link."));

    const QCommandLineOption targetOption(QStringLiteral("target"),
                                          QStringLiteral("Destination the server connects to, as host:port."),
                                          QStringLiteral("host:port"));
    const QCommandLineOption connectTimeoutOption(QStringLiteral("connect-timeout"),
                                                  QStringLiteral("Connect and TLS handshake deadline in ms."),
                                                  QStringLiteral("ms"));
    const QCommandLineOption readTimeoutOption(QStringLiteral("read-timeout"),
                                               QStringLiteral("Read deadline in ms."),
                                               QStringLiteral("ms"));
    const QCommandLineOption interfaceOption(QStringLiteral("interface"),
                                             QStringLiteral("Bind sockets to this network interface."),
                                             QStringLiteral("name"));
    const QCommandLineOption noReconnectOption(QStringLiteral("no-reconnect"),
                                               QStringLiteral("Exit instead of reconnecting after a failure."));
    const QCommandLineOption probeOption(QStringLiteral("probe"),
                                         QStringLiteral("Measure TCP connect latency to the server and exit."));
    const QCommandLineOption normalizeOption(QStringLiteral("normalize"),
                                             QStringLiteral("Print the link in canonical form and exit."));
    const QCommandLineOption quietOption(QStringLiteral("quiet"), QStringLiteral("Do not print log lines."));
    parser.addOptions({targetOption, connectTimeoutOption, readTimeoutOption, interfaceOption,
                       noReconnectOption, probeOption, normalizeOption, quietOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        printError(QStringLiteral("Exactly one vless:// link is required."));
        return kExitUsage;
    }

    QSettings settingsStore;
    TunnelSettings settings = TunnelSettings::load(settingsStore);
    settings.connectTimeoutMs = readMilliseconds(parser, connectTimeoutOption, settings.connectTimeoutMs);
    settings.readTimeoutMs = readMilliseconds(parser, readTimeoutOption, settings.readTimeoutMs);
    if (parser.isSet(interfaceOption)) {
        settings.bindInterface = parser.value(interfaceOption).trimmed();
    }
    if (parser.isSet(noReconnectOption)) {
        settings.autoReconnect = false;
    }
    if (parser.isSet(quietOption)) {
        settings.loggingEnabled = false;
    }

    SystemLog systemLog;
    systemLog.setEnabled(settings.loggingEnabled);
    QObject::connect(&systemLog, &SystemLog::lineAppended, &app, [](const QString& line) {
        printError(line);
    });

    QString parseError;
    std::optional<ParsedLink> parsed = LinkParser::parse(positional.constFirst(), &parseError);
    if (!parsed) {
        printError(SystemLog::sanitize(parseError));
        return kExitInvalidLink;
    }

    if (parser.isSet(targetOption)) {
        QString targetError;
        const std::optional<Destination> destination = parseTarget(parser.value(targetOption), &targetError);
        if (!destination) {
            printError(targetError);
            return kExitUsage;
        }
        parsed->profile.destination = destination;
    }

    if (parser.isSet(normalizeOption)) {
        QString composeError;
        const std::optional<QString> link = LinkParser::compose(parsed->profile, parsed->credential, &composeError);
        if (!link) {
            printError(composeError);
            return kExitInvalidLink;
        }
        QTextStream(stdout) << *link << Qt::endl;
        return 0;
    }

    if (parser.isSet(probeOption)) {
        EndpointProbe probe;
        int result = -1;
        QObject::connect(&probe, &EndpointProbe::finished, &app, [&result](int latencyMs) {
            result = latencyMs;
            QCoreApplication::quit();
        });
        probe.probe(parsed->profile.endpoint);
        app.exec();
        if (result < 0) {
            printError(QStringLiteral("%1 is unreachable.").arg(parsed->profile.displayLabel()));
            return kExitProbeFailed;
        }
        QTextStream(stdout) << QStringLiteral("%1 ms").arg(result) << Qt::endl;
        return 0;
    }

    const QString profileId = parsed->profile.id;

    InMemoryProfileStore profiles;
    profiles.insert(parsed->profile);
    InMemoryCredentialVault vault;
    vault.store(profileId, parsed->credential);
    parsed->credential.clear();

    ConnectionManager manager(profiles, vault, TransportFactory{});
    manager.setTimeouts(std::chrono::milliseconds(settings.connectTimeoutMs),
                        std::chrono::milliseconds(settings.readTimeoutMs));
    manager.setStatisticsInterval(settings.statisticsIntervalMs);

    ReconnectSupervisor supervisor;
    SystemNetworkMonitor monitor;
    monitor.setPreferredInterface(settings.bindInterface);

    QObject::connect(&manager, &ConnectionManager::logLine, &systemLog, &SystemLog::append);
    QObject::connect(&supervisor, &ReconnectSupervisor::logLine, &systemLog, &SystemLog::append);

    QObject::connect(&manager, &ConnectionManager::connectionStateChanged,
                     &supervisor, &ReconnectSupervisor::onConnectionStateChanged);
    QObject::connect(&manager, &ConnectionManager::userDisconnected, &supervisor, &ReconnectSupervisor::disable);
    QObject::connect(&monitor, &NetworkMonitor::networkEvent, &manager, &ConnectionManager::onNetworkEvent);
    QObject::connect(&monitor, &NetworkMonitor::networkEvent, &supervisor, &ReconnectSupervisor::onNetworkEvent);
    QObject::connect(&monitor, &NetworkMonitor::networkEvent, &systemLog, [&systemLog](const NetworkEvent& event) {
        systemLog.append(QStringLiteral("[System] %1").arg(event.describe()));
    });
    QObject::connect(&supervisor, &ReconnectSupervisor::reconnectRequested, &manager,
                     [&manager, &systemLog](const QString& id) {
        QString error;
        if (!manager.reconnect(id, &error)) {
            systemLog.append(QStringLiteral("[Reconnect] %1").arg(error));
        }
    });

    QObject::connect(&manager, &ConnectionManager::payloadReceived, &app, [](const QByteArray& payload) {
        std::fwrite(payload.constData(), 1, static_cast<size_t>(payload.size()), stdout);
        std::fflush(stdout);
    });

    InputRelay relay(fileno(stdin), manager);
    relay.setDrainTimeout(std::chrono::milliseconds(settings.readTimeoutMs));
    QObject::connect(&relay, &InputRelay::logLine, &systemLog, &SystemLog::append);
    QObject::connect(&relay, &InputRelay::finished, &app, [&manager]() {
        manager.disconnect();
        QCoreApplication::exit(0);
    }, Qt::QueuedConnection);

    QObject::connect(&manager, &ConnectionManager::connectionStateChanged, &app,
                     [&settings, &relay](const ConnectionState& state) {
        const ErrorState *error = state.get<ErrorState>();
        if (!error || relay.isInputClosed()) {
            return;
        }
        if (!error->recoverable || !settings.autoReconnect) {
            printError(QStringLiteral("Connection failed: %1").arg(error->reason));
            QCoreApplication::exit(kExitConnectFailed);
        }
    });

    if (!settings.bindInterface.isEmpty()) {
        const NetworkHandle handle = SystemNetworkMonitor::handleForInterface(settings.bindInterface);
        if (handle.isNull()) {
            printError(QStringLiteral("Interface '%1' has no usable address.").arg(settings.bindInterface));
            return kExitUsage;
        }
        manager.onNetworkEvent(NetworkEvent(NetworkAvailable{handle}));
    }

    QString monitorError;
    if (!monitor.start(&monitorError)) {
        systemLog.append(QStringLiteral("[System] Network monitoring unavailable: %1").arg(monitorError));
    }

    QString relayError;
    if (!relay.start(&relayError)) {
        printError(relayError);
        return kExitUsage;
    }

    supervisor.setArmOnConnect(settings.autoReconnect);
    if (settings.autoReconnect) {
        supervisor.enable(profileId);
    }

    QString connectError;
    if (!manager.connectToProfile(profileId, &connectError)) {
        return kExitConnectFailed;
    }

    const int exitCode = app.exec();
    manager.disconnect();
    return exitCode;
}
