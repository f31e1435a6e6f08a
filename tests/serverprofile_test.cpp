#include <QString>

#include <memory>

#include <gtest/gtest.h>

import vlesstunnel.core.credential;
import vlesstunnel.core.profilestore;
import vlesstunnel.core.serverprofile;
import vlesstunnel.core.transport;
import vlesstunnel.core.transportfactory;
import vlesstunnel.tests.support;

TEST(ServerProfileTest, PlainProfileIsValid)
{
    QString error;
    EXPECT_TRUE(plainProfile(QStringLiteral("p1")).isValid(&error)) << error.toStdString();
}

TEST(ServerProfileTest, EndpointRequiresHostAndPort)
{
    ServerProfile profile = plainProfile(QStringLiteral("p1"));
    profile.endpoint.hostname.clear();
    EXPECT_FALSE(profile.isValid());

    profile = plainProfile(QStringLiteral("p1"));
    profile.endpoint.port = 0;
    EXPECT_FALSE(profile.isValid());
}

TEST(ServerProfileTest, TlsRequiresServerName)
{
    ServerProfile profile = plainProfile(QStringLiteral("p1"));
    profile.transport = TlsConfig{};
    QString error;
    EXPECT_FALSE(profile.isValid(&error));
    EXPECT_TRUE(error.contains(QStringLiteral("SNI")));

    profile.transport = TlsConfig{QStringLiteral("front.example.org"), {}, false};
    EXPECT_TRUE(profile.isValid(&error)) << error.toStdString();
    EXPECT_TRUE(profile.transport.isSecure());
    EXPECT_EQ(profile.transport.name(), QStringLiteral("tls"));
}

TEST(ServerProfileTest, FramedTransportsValidateTheirSettings)
{
    ServerProfile profile = plainProfile(QStringLiteral("p1"));
    QString error;

    profile.transport = GrpcConfig{};
    EXPECT_FALSE(profile.isValid(&error));
    EXPECT_TRUE(error.contains(QStringLiteral("serviceName")));

    WebSocketConfig ws;
    ws.path = QStringLiteral("ray");
    profile.transport = ws;
    EXPECT_FALSE(profile.isValid(&error));

    GrpcConfig grpc;
    grpc.serviceName = QStringLiteral("tunnel");
    grpc.secure = true;
    profile.transport = grpc;
    EXPECT_FALSE(profile.isValid(&error));
    profile.endpoint.serverName = QStringLiteral("front.example.org");
    EXPECT_TRUE(profile.isValid(&error)) << error.toStdString();
}

TEST(ServerProfileTest, VisionNeedsSecureTransport)
{
    ServerProfile profile = plainProfile(QStringLiteral("p1"));
    profile.flow = FlowControl::XtlsVision;
    EXPECT_FALSE(profile.isValid());

    profile.transport = TlsConfig{QStringLiteral("front.example.org"), {}, false};
    EXPECT_TRUE(profile.isValid());
}

TEST(ServerProfileTest, DestinationDefaultsToEndpoint)
{
    ServerProfile profile = plainProfile(QStringLiteral("p1"), QStringLiteral("10.1.2.3"), 8443);
    EXPECT_EQ(profile.effectiveDestination(), (Destination{QStringLiteral("example.com"), 80}));

    profile.destination.reset();
    EXPECT_EQ(profile.effectiveDestination(), (Destination{QStringLiteral("10.1.2.3"), 8443}));

    profile.destination = Destination{QString(), 80};
    EXPECT_FALSE(profile.isValid());
}

TEST(ServerProfileTest, FlowNamesRoundTrip)
{
    EXPECT_EQ(flowControlFromName(QString()), FlowControl::None);
    EXPECT_EQ(flowControlFromName(QStringLiteral("none")), FlowControl::None);
    EXPECT_EQ(flowControlFromName(flowControlName(FlowControl::XtlsVision)), FlowControl::XtlsVision);
    EXPECT_FALSE(flowControlFromName(QStringLiteral("xtls-rprx-origin")).has_value());
}

TEST(TransportFactoryTest, BuildsPlainAndTlsTransports)
{
    const TransportFactory factory;
    EXPECT_TRUE(factory.supports(TransportKind::Plain));
    EXPECT_TRUE(factory.supports(TransportKind::Tls));
    EXPECT_FALSE(factory.supports(TransportKind::WebSocket));
    EXPECT_FALSE(factory.supports(TransportKind::Grpc));
    EXPECT_FALSE(factory.supports(TransportKind::Http2));

    ServerProfile profile = plainProfile(QStringLiteral("p1"));
    std::unique_ptr<Transport> plain = factory.create(profile, TransportOptions{});
    ASSERT_NE(plain, nullptr);
    EXPECT_NE(dynamic_cast<TcpTransport *>(plain.get()), nullptr);
    EXPECT_EQ(dynamic_cast<TlsTransport *>(plain.get()), nullptr);

    profile.transport = TlsConfig{QStringLiteral("front.example.org"), {}, false};
    std::unique_ptr<Transport> tls = factory.create(profile, TransportOptions{});
    ASSERT_NE(tls, nullptr);
    EXPECT_NE(dynamic_cast<TlsTransport *>(tls.get()), nullptr);
}

TEST(TransportFactoryTest, UnregisteredKindReportsError)
{
    TransportFactory factory;
    ServerProfile profile = plainProfile(QStringLiteral("p1"));
    WebSocketConfig ws;
    profile.transport = ws;

    QString error;
    EXPECT_EQ(factory.create(profile, TransportOptions{}, &error), nullptr);
    EXPECT_TRUE(error.contains(QStringLiteral("ws")));

    auto script = std::make_shared<TransportScript>();
    factory.setCreator(TransportKind::WebSocket, [script](const ServerProfile&, const TransportOptions& options)
                                                     -> std::unique_ptr<Transport> {
        return std::make_unique<ScriptedTransport>(script, options);
    });
    EXPECT_TRUE(factory.supports(TransportKind::WebSocket));
    EXPECT_NE(factory.create(profile, TransportOptions{}), nullptr);

    factory.setCreator(TransportKind::WebSocket, {});
    EXPECT_FALSE(factory.supports(TransportKind::WebSocket));
}

TEST(ProfileStoreTest, InMemoryStoreReplacesById)
{
    InMemoryProfileStore store;
    store.insert(plainProfile(QStringLiteral("p1")));
    ServerProfile updated = plainProfile(QStringLiteral("p1"), QStringLiteral("10.0.0.9"));
    store.insert(updated);

    EXPECT_EQ(store.profiles().size(), 1);
    EXPECT_EQ(store.profile(QStringLiteral("p1")), updated);
    EXPECT_FALSE(store.profile(QStringLiteral("p2")).has_value());
    EXPECT_TRUE(store.remove(QStringLiteral("p1")));
    EXPECT_FALSE(store.remove(QStringLiteral("p1")));
}

TEST(ProfileStoreTest, VaultReportsMissingAndCorruptEntries)
{
    InMemoryCredentialVault vault;
    vault.store(QStringLiteral("p1"), testCredential());
    vault.storeRaw(QStringLiteral("p2"), QStringLiteral("garbage"));

    VaultError error;
    EXPECT_EQ(vault.credential(QStringLiteral("p1"), &error), testCredential());

    EXPECT_FALSE(vault.credential(QStringLiteral("p2"), &error).has_value());
    EXPECT_EQ(error.kind, VaultError::Kind::Corrupt);

    EXPECT_FALSE(vault.credential(QStringLiteral("p3"), &error).has_value());
    EXPECT_EQ(error.kind, VaultError::Kind::NotFound);
}
