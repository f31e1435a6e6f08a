#include <QString>
#include <QStringList>

#include <gtest/gtest.h>

import vlesstunnel.core.credential;
import vlesstunnel.core.linkparser;
import vlesstunnel.core.serverprofile;

namespace {
const QString kUuid = QStringLiteral("b831381d-6324-4d53-ad4f-8cda48b30811");

QString link(const QString& tail)
{
    return QStringLiteral("vless://%1@%2").arg(kUuid, tail);
}
}

TEST(LinkParserTest, ParsesPlainTcpLink)
{
    QString error;
    const auto parsed = LinkParser::parse(link(QStringLiteral("example.com:443?type=tcp&security=none#Home")), &error);
    ASSERT_TRUE(parsed.has_value()) << error.toStdString();

    const ServerProfile& profile = parsed->profile;
    EXPECT_EQ(profile.endpoint.hostname, QStringLiteral("example.com"));
    EXPECT_EQ(profile.endpoint.port, 443);
    EXPECT_EQ(profile.name, QStringLiteral("Home"));
    EXPECT_EQ(profile.transport.kind(), TransportKind::Plain);
    EXPECT_EQ(profile.flow, FlowControl::None);
    EXPECT_FALSE(profile.id.isEmpty());
    EXPECT_EQ(parsed->credential.toString(), kUuid);
}

TEST(LinkParserTest, SchemeIsCaseInsensitiveAndLabelDefaultsToHost)
{
    const auto parsed = LinkParser::parse(QStringLiteral("VLESS://%1@10.0.0.1:8443").arg(kUuid));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->profile.name, QStringLiteral("10.0.0.1"));
    EXPECT_EQ(parsed->profile.transport.kind(), TransportKind::Plain);
}

TEST(LinkParserTest, TlsLinkCarriesSniAndAlpn)
{
    const auto parsed = LinkParser::parse(link(QStringLiteral(
        "edge.example.net:443?type=tcp&security=tls&sni=front.example.org&alpn=h2,http/1.1&flow=xtls-rprx-vision")));
    ASSERT_TRUE(parsed.has_value());

    const ServerProfile& profile = parsed->profile;
    ASSERT_EQ(profile.transport.kind(), TransportKind::Tls);
    const auto *tls = profile.transport.get<TlsConfig>();
    ASSERT_NE(tls, nullptr);
    EXPECT_EQ(tls->serverName, QStringLiteral("front.example.org"));
    EXPECT_EQ(tls->alpn, (QStringList{QStringLiteral("h2"), QStringLiteral("http/1.1")}));
    EXPECT_FALSE(tls->allowInsecure);
    EXPECT_EQ(profile.endpoint.hostname, QStringLiteral("edge.example.net"));
    EXPECT_EQ(profile.flow, FlowControl::XtlsVision);
}

TEST(LinkParserTest, SniDefaultsToHost)
{
    const auto parsed = LinkParser::parse(link(QStringLiteral("edge.example.net:443?security=tls")));
    ASSERT_TRUE(parsed.has_value());
    const auto *tls = parsed->profile.transport.get<TlsConfig>();
    ASSERT_NE(tls, nullptr);
    EXPECT_EQ(tls->serverName, QStringLiteral("edge.example.net"));
}

TEST(LinkParserTest, RejectsInvalidUuid)
{
    QString error;
    EXPECT_FALSE(LinkParser::parse(QStringLiteral("vless://not-a-uuid@example.com:443"), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("UUID")));
}

TEST(LinkParserTest, GrpcRequiresServiceName)
{
    QString error;
    EXPECT_FALSE(LinkParser::parse(link(QStringLiteral("example.com:443?type=grpc&security=tls")), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("serviceName")));

    const auto parsed = LinkParser::parse(
        link(QStringLiteral("example.com:443?type=grpc&security=tls&serviceName=tunnel&mode=multi")));
    ASSERT_TRUE(parsed.has_value());
    const auto *grpc = parsed->profile.transport.get<GrpcConfig>();
    ASSERT_NE(grpc, nullptr);
    EXPECT_EQ(grpc->serviceName, QStringLiteral("tunnel"));
    EXPECT_TRUE(grpc->multiMode);
    EXPECT_TRUE(grpc->secure);
}

TEST(LinkParserTest, WebSocketAliasesAndPathNormalization)
{
    const auto parsed = LinkParser::parse(link(QStringLiteral("example.com:80?type=websocket&path=ray&host=cdn.example.com")));
    ASSERT_TRUE(parsed.has_value());
    const auto *ws = parsed->profile.transport.get<WebSocketConfig>();
    ASSERT_NE(ws, nullptr);
    EXPECT_EQ(ws->path, QStringLiteral("/ray"));
    EXPECT_EQ(ws->hostHeader, QStringLiteral("cdn.example.com"));
    EXPECT_FALSE(ws->secure);

    const auto h2 = LinkParser::parse(link(QStringLiteral("example.com:443?type=http&security=tls")));
    ASSERT_TRUE(h2.has_value());
    EXPECT_EQ(h2->profile.transport.kind(), TransportKind::Http2);
}

TEST(LinkParserTest, RejectsUnknownTypeSecurityAndFlow)
{
    QString error;
    EXPECT_FALSE(LinkParser::parse(link(QStringLiteral("example.com:443?type=quic")), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("quic")));

    EXPECT_FALSE(LinkParser::parse(link(QStringLiteral("example.com:443?security=reality")), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("security")));

    EXPECT_FALSE(LinkParser::parse(link(QStringLiteral("example.com:443?security=tls&flow=xtls-rprx-direct")), &error)
                     .has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("flow")));
}

TEST(LinkParserTest, RejectsMissingHostOrPort)
{
    QString error;
    EXPECT_FALSE(LinkParser::parse(link(QStringLiteral("example.com")), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("port")));

    EXPECT_FALSE(LinkParser::parse(QStringLiteral("vless://%1@:443").arg(kUuid), &error).has_value());
    EXPECT_FALSE(LinkParser::parse(QStringLiteral("vmess://abc"), &error).has_value());
    EXPECT_FALSE(LinkParser::parse(QString(), &error).has_value());
}

TEST(LinkParserTest, VisionOverPlainTransportIsRejected)
{
    QString error;
    EXPECT_FALSE(LinkParser::parse(link(QStringLiteral("example.com:443?flow=xtls-rprx-vision")), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("xtls-rprx-vision")));
}

TEST(LinkParserTest, ComposeProducesParsableLink)
{
    const auto parsed = LinkParser::parse(link(QStringLiteral(
        "edge.example.net:443?type=tcp&security=tls&sni=front.example.org&alpn=h2&flow=xtls-rprx-vision#Office")));
    ASSERT_TRUE(parsed.has_value());

    QString error;
    const auto composed = LinkParser::compose(parsed->profile, parsed->credential, &error);
    ASSERT_TRUE(composed.has_value()) << error.toStdString();
    EXPECT_TRUE(composed->startsWith(QStringLiteral("vless://") + kUuid + QStringLiteral("@edge.example.net:443")));

    const auto reparsed = LinkParser::parse(*composed, &error);
    ASSERT_TRUE(reparsed.has_value()) << error.toStdString();
    EXPECT_EQ(reparsed->profile.endpoint, parsed->profile.endpoint);
    EXPECT_EQ(reparsed->profile.transport, parsed->profile.transport);
    EXPECT_EQ(reparsed->profile.flow, parsed->profile.flow);
    EXPECT_EQ(reparsed->profile.name, QStringLiteral("Office"));
}

TEST(LinkParserTest, ComposeRequiresCredential)
{
    const auto parsed = LinkParser::parse(link(QStringLiteral("example.com:443")));
    ASSERT_TRUE(parsed.has_value());

    QString error;
    EXPECT_FALSE(LinkParser::compose(parsed->profile, Credential(), &error).has_value());
    EXPECT_FALSE(error.isEmpty());
}
