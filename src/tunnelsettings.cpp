module;
#include <QSettings>
#include <QString>

module vlesstunnel.core.tunnelsettings;

namespace {
constexpr int kMinTimeoutMs = 100;
constexpr int kMinStatisticsIntervalMs = 100;

int readPositive(QSettings& settings, const QString& key, int fallback, int minimum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value < minimum) {
        return fallback;
    }
    return value;
}
}

TunnelSettings TunnelSettings::load(QSettings& settings)
{
    TunnelSettings loaded;
    loaded.connectTimeoutMs = readPositive(settings, QStringLiteral("transport/connectTimeoutMs"),
                                           loaded.connectTimeoutMs, kMinTimeoutMs);
    loaded.readTimeoutMs = readPositive(settings, QStringLiteral("transport/readTimeoutMs"),
                                        loaded.readTimeoutMs, kMinTimeoutMs);
    loaded.bindInterface = settings.value(QStringLiteral("transport/bindInterface")).toString().trimmed();
    loaded.statisticsIntervalMs = readPositive(settings, QStringLiteral("stats/intervalMs"),
                                               loaded.statisticsIntervalMs, kMinStatisticsIntervalMs);
    loaded.autoReconnect = settings.value(QStringLiteral("reconnect/enabled"), loaded.autoReconnect).toBool();
    loaded.loggingEnabled = settings.value(QStringLiteral("logs/enabled"), loaded.loggingEnabled).toBool();
    return loaded;
}

void TunnelSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("transport/connectTimeoutMs"), connectTimeoutMs);
    settings.setValue(QStringLiteral("transport/readTimeoutMs"), readTimeoutMs);
    settings.setValue(QStringLiteral("transport/bindInterface"), bindInterface);
    settings.setValue(QStringLiteral("stats/intervalMs"), statisticsIntervalMs);
    settings.setValue(QStringLiteral("reconnect/enabled"), autoReconnect);
    settings.setValue(QStringLiteral("logs/enabled"), loggingEnabled);
}
