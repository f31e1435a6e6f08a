#include <QByteArray>
#include <QString>

#include <gtest/gtest.h>

import vlesstunnel.core.credential;
import vlesstunnel.core.serverprofile;
import vlesstunnel.core.vlesscodec;

namespace {
Credential credential()
{
    return *Credential::fromString(QStringLiteral("b831381d-6324-4d53-ad4f-8cda48b30811"));
}

RequestHeader decodeComplete(const QByteArray& bytes, qsizetype *consumed = nullptr)
{
    RequestHeader header;
    ProtocolError error;
    const auto status = VlessCodec::decodeRequest(bytes, &header, consumed, &error);
    EXPECT_EQ(status, VlessCodec::ParseStatus::Complete) << error.describe().toStdString();
    return header;
}
}

TEST(VlessCodecTest, DomainRequestLayout)
{
    const VlessCodec codec;
    const auto request = codec.encodeRequest(credential(), QStringLiteral("example.com"), 443);
    ASSERT_TRUE(request.has_value());

    const QByteArray& bytes = *request;
    ASSERT_EQ(bytes.size(), 1 + 16 + 1 + 1 + 2 + 1 + 1 + 11);
    EXPECT_EQ(bytes.at(0), 0x00);
    EXPECT_EQ(bytes.mid(1, 16), credential().toRfc4122());
    EXPECT_EQ(bytes.at(17), 0x00);
    EXPECT_EQ(bytes.at(18), 0x01);
    EXPECT_EQ(static_cast<quint8>(bytes.at(19)), 0x01);
    EXPECT_EQ(static_cast<quint8>(bytes.at(20)), 0xBB);
    EXPECT_EQ(bytes.at(21), 0x02);
    EXPECT_EQ(bytes.at(22), 11);
    EXPECT_EQ(bytes.mid(23), QByteArray("example.com"));
}

TEST(VlessCodecTest, Ipv6AddressBytesInNetworkOrder)
{
    const VlessCodec codec;
    const auto request = codec.encodeRequest(credential(), QStringLiteral("2001:db8::ff01"), 53);
    ASSERT_TRUE(request.has_value());

    ASSERT_EQ(request->size(), 1 + 16 + 1 + 1 + 2 + 1 + 16);
    EXPECT_EQ(request->at(21), 0x03);
    const QByteArray address = request->mid(22);
    EXPECT_EQ(address, QByteArray::fromHex("20010db800000000000000000000ff01"));

    const RequestHeader header = decodeComplete(*request);
    EXPECT_EQ(header.addressType, AddressType::IPv6);
    EXPECT_EQ(header.address, QStringLiteral("2001:db8::ff01"));

    const auto nilCredential = Credential::fromString(QStringLiteral("00000000-0000-0000-0000-000000000000"));
    ASSERT_TRUE(nilCredential.has_value());
    const auto nilRequest = codec.encodeRequest(*nilCredential, QStringLiteral("::1"), 53);
    ASSERT_TRUE(nilRequest.has_value());
    EXPECT_EQ(nilRequest->mid(1, 16), QByteArray(16, '\0'));
    EXPECT_EQ(decodeComplete(*nilRequest).address, QStringLiteral("::1"));
}

TEST(VlessCodecTest, RequestHeaderRoundTripsAcrossAddressTypes)
{
    const VlessCodec codec;
    struct Case {
        QString address;
        quint16 port;
        AddressType type;
        QString decoded;
    };
    const Case cases[] = {
        {QStringLiteral("example.com"), 443, AddressType::Domain, QStringLiteral("example.com")},
        {QStringLiteral("93.184.216.34"), 80, AddressType::IPv4, QStringLiteral("93.184.216.34")},
        {QStringLiteral("[2001:db8::1]"), 8443, AddressType::IPv6, QStringLiteral("2001:db8::1")},
        {QStringLiteral("tunnel.example.org"), 65535, AddressType::Domain, QStringLiteral("tunnel.example.org")},
    };

    for (const Case& c : cases) {
        const auto request = codec.encodeRequest(credential(), c.address, c.port);
        ASSERT_TRUE(request.has_value()) << c.address.toStdString();

        qsizetype consumed = 0;
        const RequestHeader header = decodeComplete(*request, &consumed);
        EXPECT_EQ(consumed, request->size());
        EXPECT_EQ(header.version, VlessCodec::kVersion);
        EXPECT_EQ(header.credential, credential());
        EXPECT_EQ(header.command, VlessCommand::Tcp);
        EXPECT_EQ(header.port, c.port);
        EXPECT_EQ(header.addressType, c.type);
        EXPECT_EQ(header.address, c.decoded);
        EXPECT_TRUE(header.addons.isEmpty());
    }
}

TEST(VlessCodecTest, IdnDomainIsSentInAsciiForm)
{
    const VlessCodec codec;
    const auto request = codec.encodeRequest(credential(), QStringLiteral("bücher.example"), 443);
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->contains("xn--bcher-kva.example"));
}

TEST(VlessCodecTest, VisionFlowAddsAddons)
{
    const VlessCodec codec(FlowControl::XtlsVision);
    const auto request = codec.encodeRequest(credential(), QStringLiteral("example.com"), 443);
    ASSERT_TRUE(request.has_value());

    const RequestHeader header = decodeComplete(*request);
    EXPECT_EQ(header.addons, VlessCodec::flowAddons(FlowControl::XtlsVision));
    EXPECT_EQ(header.addons.at(0), 0x0A);
    EXPECT_EQ(header.addons.at(1), 16);
    EXPECT_EQ(header.addons.mid(2), QByteArray("xtls-rprx-vision"));
    EXPECT_TRUE(VlessCodec::flowAddons(FlowControl::None).isEmpty());
}

TEST(VlessCodecTest, RejectsInvalidRequests)
{
    const VlessCodec codec;
    ProtocolError error;
    EXPECT_FALSE(codec.encodeRequest(Credential(), QStringLiteral("example.com"), 443, &error).has_value());
    EXPECT_EQ(error.kind, ProtocolError::Kind::InvalidRequest);

    EXPECT_FALSE(codec.encodeRequest(credential(), QStringLiteral("  "), 443, &error).has_value());

    const QString longName = QString(QStringLiteral("a")).repeated(60) + QStringLiteral(".")
        + QString(QStringLiteral("b")).repeated(60) + QStringLiteral(".") + QString(QStringLiteral("c")).repeated(60)
        + QStringLiteral(".") + QString(QStringLiteral("d")).repeated(60) + QStringLiteral(".")
        + QString(QStringLiteral("e")).repeated(60) + QStringLiteral(".example");
    EXPECT_FALSE(codec.encodeRequest(credential(), longName, 443, &error).has_value());
    EXPECT_EQ(error.kind, ProtocolError::Kind::InvalidRequest);
}

TEST(VlessCodecTest, DecodeRequestWaitsForCompleteHeader)
{
    const VlessCodec codec;
    const auto request = codec.encodeRequest(credential(), QStringLiteral("example.com"), 443);
    ASSERT_TRUE(request.has_value());

    for (qsizetype length = 0; length < request->size(); ++length) {
        EXPECT_EQ(VlessCodec::decodeRequest(request->left(length), nullptr, nullptr),
                  VlessCodec::ParseStatus::NeedMoreData) << length;
    }
}

TEST(VlessCodecTest, ResponseHeaderLeavesPayloadInBuffer)
{
    VlessCodec codec;
    QByteArray buffer = VlessCodec::encodeResponse(ResponseHeader{0, QByteArray("ab")}) + QByteArray("payload");

    ResponseHeader header;
    ProtocolError error;
    EXPECT_EQ(codec.parseResponse(buffer, &header, &error), VlessCodec::ParseStatus::Complete);
    EXPECT_EQ(header.version, 0);
    EXPECT_EQ(header.addons, QByteArray("ab"));
    EXPECT_EQ(buffer, QByteArray("payload"));

    EXPECT_EQ(codec.parseResponse(buffer, &header, &error), VlessCodec::ParseStatus::Failed);
    EXPECT_EQ(error.kind, ProtocolError::Kind::BadResponseHeader);
}

TEST(VlessCodecTest, PartialResponseNeedsMoreData)
{
    VlessCodec codec;
    QByteArray buffer("\x00", 1);
    EXPECT_EQ(codec.parseResponse(buffer), VlessCodec::ParseStatus::NeedMoreData);

    buffer = QByteArray("\x00\x03\x01", 3);
    EXPECT_EQ(codec.parseResponse(buffer), VlessCodec::ParseStatus::NeedMoreData);
    EXPECT_EQ(buffer.size(), 3);

    buffer.append("\x02\x03", 2);
    EXPECT_EQ(codec.parseResponse(buffer), VlessCodec::ParseStatus::Complete);
    EXPECT_TRUE(buffer.isEmpty());
}

TEST(VlessCodecTest, VersionMismatchFails)
{
    VlessCodec codec;
    QByteArray buffer("\x01\x00", 2);
    ProtocolError error;
    EXPECT_EQ(codec.parseResponse(buffer, nullptr, &error), VlessCodec::ParseStatus::Failed);
    EXPECT_EQ(error.kind, ProtocolError::Kind::UnsupportedVersion);
}

TEST(VlessCodecTest, FlowIsReportedOnlyAfterNegotiation)
{
    VlessCodec codec(FlowControl::XtlsVision);
    EXPECT_FALSE(codec.isFlowNegotiated());
    EXPECT_EQ(codec.negotiateFlow(), FlowControl::XtlsVision);
    EXPECT_TRUE(codec.isFlowNegotiated());

    const QByteArray payload("GET / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(codec.encodePayload(payload), payload);
    EXPECT_EQ(codec.decodePayload(payload), payload);
}
