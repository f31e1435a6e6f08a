module;
#include <QDateTime>
#include <QPointer>
#include <QTcpSocket>
#include <QTimer>

module vlesstunnel.core.endpointprobe;

EndpointProbe::EndpointProbe(QObject *parent)
    : QObject(parent)
{
}

void EndpointProbe::setTimeout(int timeoutMs)
{
    m_timeoutMs = qMax(1, timeoutMs);
}

void EndpointProbe::probe(const ServerEndpoint& endpoint)
{
    const QString address = endpoint.hostname.trimmed();
    const quint16 port = endpoint.port;

    if (address.isEmpty() || port == 0) {
        const QPointer<EndpointProbe> guard(this);
        QTimer::singleShot(0, this, [guard]() {
            if (guard) {
                emit guard->finished(-1);
            }
        });
        return;
    }

    auto *socket = new QTcpSocket(this);
    socket->setProperty("_vlesstunnel_probe_done", false);
    socket->setProperty("_vlesstunnel_probe_start_ms", QDateTime::currentMSecsSinceEpoch());

    auto finishProbe = [this, socket](int latencyMs) mutable {
        if (socket->property("_vlesstunnel_probe_done").toBool()) {
            return;
        }
        socket->setProperty("_vlesstunnel_probe_done", true);

        emit finished(latencyMs);

        socket->abort();
        socket->deleteLater();
    };

    connect(socket, &QTcpSocket::connected, socket, [finishProbe, socket]() mutable {
        const qint64 startedAt = socket->property("_vlesstunnel_probe_start_ms").toLongLong();
        const qint64 elapsedMs = qMax<qint64>(1, QDateTime::currentMSecsSinceEpoch() - startedAt);
        finishProbe(static_cast<int>(elapsedMs));
    });

    connect(socket, &QTcpSocket::errorOccurred, socket, [finishProbe](QAbstractSocket::SocketError) mutable {
        finishProbe(-1);
    });

    QTimer::singleShot(m_timeoutMs, socket, [socket, finishProbe]() mutable {
        if (socket->property("_vlesstunnel_probe_done").toBool()) {
            return;
        }
        if (socket->state() == QAbstractSocket::ConnectedState) {
            return;
        }
        finishProbe(-1);
    });

    socket->connectToHost(address, port);
}
