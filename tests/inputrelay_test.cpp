#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <chrono>
#include <memory>

#if defined(Q_OS_UNIX)
#include <unistd.h>
#endif

#include <gtest/gtest.h>

import vlesstunnel.core.connectionmanager;
import vlesstunnel.core.connectionstate;
import vlesstunnel.core.inputrelay;
import vlesstunnel.core.profilestore;
import vlesstunnel.tests.support;

#if defined(Q_OS_UNIX)

namespace {
const QString kProfileId = QStringLiteral("relay");

class InputRelayTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(::pipe(fds), 0);

        script = std::make_shared<TransportScript>();
        script->response = scriptedResponse();
        profiles.insert(plainProfile(kProfileId));
        vault.store(kProfileId, testCredential());

        manager = std::make_unique<ConnectionManager>(profiles, vault, scriptedFactory(script));
        manager->setTimeouts(std::chrono::milliseconds(2000), std::chrono::milliseconds(2000));

        relay = std::make_unique<InputRelay>(fds[0], *manager);
        QObject::connect(relay.get(), &InputRelay::finished, [this]() { ++finishedCount; });
        QObject::connect(relay.get(), &InputRelay::logLine, [this](const QString& line) { log.append(line); });
    }

    void TearDown() override
    {
        relay.reset();
        manager.reset();
        pumpEvents(20);
        closeWriteEnd();
        if (fds[0] >= 0) {
            ::close(fds[0]);
        }
    }

    bool connectAndWait()
    {
        return manager->connectToProfile(kProfileId)
            && waitUntil([this]() { return manager->phase() == ConnectionPhase::Connected; });
    }

    void writeInput(const QByteArray& data)
    {
        ASSERT_EQ(::write(fds[1], data.constData(), static_cast<size_t>(data.size())),
                  static_cast<ssize_t>(data.size()));
    }

    void closeWriteEnd()
    {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }

    int fds[2] = {-1, -1};
    std::shared_ptr<TransportScript> script;
    InMemoryProfileStore profiles;
    InMemoryCredentialVault vault;
    std::unique_ptr<ConnectionManager> manager;
    std::unique_ptr<InputRelay> relay;
    int finishedCount = 0;
    QStringList log;
};
}

TEST_F(InputRelayTest, ForwardsPartialInputWithoutWaitingForEof)
{
    ASSERT_TRUE(connectAndWait());
    ASSERT_TRUE(relay->start());

    const QByteArray request("GET / HTTP/1.1\r\nHost: example.com\r\n\r\n");
    writeInput(request);

    EXPECT_TRUE(waitUntil([this, &request]() { return script->sentBytes().endsWith(request); }, 2000));
    EXPECT_EQ(relay->bytesForwarded(), static_cast<quint64>(request.size()));
    EXPECT_FALSE(relay->isInputClosed());
    EXPECT_EQ(finishedCount, 0);

    writeInput(QByteArray("more"));
    EXPECT_TRUE(waitUntil([this]() { return script->sentBytes().endsWith("more"); }, 2000));
}

TEST_F(InputRelayTest, HoldsInputUntilConnected)
{
    ASSERT_TRUE(relay->start());
    writeInput(QByteArray("early"));
    pumpEvents(50);
    EXPECT_EQ(relay->bytesForwarded(), 0u);

    ASSERT_TRUE(connectAndWait());
    EXPECT_TRUE(waitUntil([this]() { return script->sentBytes().endsWith("early"); }, 2000));
}

TEST_F(InputRelayTest, EndOfInputKeepsTunnelOpenForResponse)
{
    ASSERT_TRUE(connectAndWait());
    ASSERT_TRUE(relay->start());

    QByteArray received;
    QObject::connect(manager.get(), &ConnectionManager::payloadReceived,
                     [&received](const QByteArray& payload) { received.append(payload); });

    writeInput(QByteArray("request"));
    closeWriteEnd();

    ASSERT_TRUE(waitUntil([this]() { return relay->isInputClosed(); }, 2000));
    EXPECT_TRUE(script->sentBytes().endsWith("request"));
    EXPECT_EQ(manager->phase(), ConnectionPhase::Connected);
    EXPECT_EQ(finishedCount, 0);

    ScriptedTransport *transport = script->lastTransport();
    ASSERT_NE(transport, nullptr);
    transport->deliver(QByteArray("response"));
    EXPECT_EQ(received, QByteArray("response"));
    EXPECT_EQ(finishedCount, 0);

    transport->dropConnection();
    EXPECT_TRUE(waitUntil([this]() { return finishedCount > 0; }, 2000));
    pumpEvents(20);
    EXPECT_EQ(finishedCount, 1);
    EXPECT_TRUE(relay->isFinished());
}

TEST_F(InputRelayTest, DrainTimeoutFinishesIdleTunnel)
{
    relay->setDrainTimeout(std::chrono::milliseconds(100));
    ASSERT_TRUE(connectAndWait());
    ASSERT_TRUE(relay->start());

    writeInput(QByteArray("ping"));
    closeWriteEnd();

    EXPECT_TRUE(waitUntil([this]() { return finishedCount > 0; }, 2000));
    EXPECT_EQ(manager->phase(), ConnectionPhase::Connected);
    EXPECT_EQ(relay->bytesForwarded(), 4u);
}

TEST_F(InputRelayTest, ServerPayloadExtendsDrain)
{
    relay->setDrainTimeout(std::chrono::milliseconds(300));
    ASSERT_TRUE(connectAndWait());
    ASSERT_TRUE(relay->start());

    closeWriteEnd();
    ASSERT_TRUE(waitUntil([this]() { return relay->isInputClosed(); }, 2000));

    ScriptedTransport *transport = script->lastTransport();
    ASSERT_NE(transport, nullptr);
    for (int i = 0; i < 4; ++i) {
        pumpEvents(150);
        transport->deliver(QByteArray("chunk"));
    }
    EXPECT_EQ(finishedCount, 0);

    EXPECT_TRUE(waitUntil([this]() { return finishedCount > 0; }, 2000));
}

TEST_F(InputRelayTest, RejectsInvalidDescriptor)
{
    InputRelay invalid(-1, *manager);
    QString error;
    EXPECT_FALSE(invalid.start(&error));
    EXPECT_FALSE(error.isEmpty());
}

#endif
