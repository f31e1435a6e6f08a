#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QTcpServer>

#include <gtest/gtest.h>

import vlesstunnel.core.endpointprobe;
import vlesstunnel.core.serverprofile;
import vlesstunnel.tests.support;

namespace {
int runProbe(const ServerEndpoint& endpoint, int timeoutMs = 2000)
{
    EndpointProbe probe;
    probe.setTimeout(timeoutMs);
    int result = -2;
    int calls = 0;
    QObject::connect(&probe, &EndpointProbe::finished, [&result, &calls](int latencyMs) {
        result = latencyMs;
        ++calls;
    });
    probe.probe(endpoint);
    waitUntil([&calls]() { return calls > 0; }, timeoutMs + 2000);
    pumpEvents(20);
    EXPECT_EQ(calls, 1);
    return result;
}

ServerEndpoint endpointAt(const QString& host, quint16 port)
{
    ServerEndpoint endpoint;
    endpoint.hostname = host;
    endpoint.port = port;
    return endpoint;
}
}

TEST(EndpointProbeTest, ReachableServerReportsLatency)
{
    QTcpServer server;
    ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));

    EXPECT_GE(runProbe(endpointAt(QStringLiteral("127.0.0.1"), server.serverPort())), 1);
}

TEST(EndpointProbeTest, ClosedPortReportsFailure)
{
    quint16 port = 0;
    {
        QTcpServer server;
        ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));
        port = server.serverPort();
    }

    EXPECT_EQ(runProbe(endpointAt(QStringLiteral("127.0.0.1"), port)), -1);
}

TEST(EndpointProbeTest, InvalidEndpointFailsAsynchronously)
{
    EXPECT_EQ(runProbe(endpointAt(QString(), 443)), -1);
    EXPECT_EQ(runProbe(endpointAt(QStringLiteral("127.0.0.1"), 0)), -1);
}
