#include <QByteArray>
#include <QString>

#include <gtest/gtest.h>

import vlesstunnel.core.credential;

namespace {
const QString kUuid = QStringLiteral("b831381d-6324-4d53-ad4f-8cda48b30811");
}

TEST(CredentialTest, ParsesCanonicalText)
{
    QString error;
    const auto credential = Credential::fromString(kUuid, &error);
    ASSERT_TRUE(credential.has_value()) << error.toStdString();
    EXPECT_EQ(credential->toString(), kUuid);
    EXPECT_EQ(credential->toRfc4122().size(), Credential::kByteLength);
    EXPECT_FALSE(credential->isNull());
}

TEST(CredentialTest, AcceptsUpperCaseAndSurroundingWhitespace)
{
    const auto credential = Credential::fromString(QStringLiteral("  ") + kUuid.toUpper() + QStringLiteral("\n"));
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->toString(), kUuid);
}

TEST(CredentialTest, RejectsMalformedText)
{
    QString error;
    EXPECT_FALSE(Credential::fromString(QStringLiteral("not-a-uuid"), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("UUID")));

    EXPECT_FALSE(Credential::fromString(QStringLiteral("{b831381d-6324-4d53-ad4f-8cda48b30811}")).has_value());
    EXPECT_FALSE(Credential::fromString(QStringLiteral("b831381d63244d53ad4f8cda48b30811")).has_value());
    EXPECT_FALSE(Credential::fromString(QStringLiteral("g831381d-6324-4d53-ad4f-8cda48b30811")).has_value());
}

TEST(CredentialTest, RejectsEmpty)
{
    QString error;
    EXPECT_FALSE(Credential::fromString(QString(), &error).has_value());
    EXPECT_EQ(error, QStringLiteral("UUID is empty."));
}

TEST(CredentialTest, AcceptsNilUuid)
{
    const auto nil = Credential::fromString(QStringLiteral("00000000-0000-0000-0000-000000000000"));
    ASSERT_TRUE(nil.has_value());
    EXPECT_FALSE(nil->isNull());
    EXPECT_EQ(nil->toRfc4122(), QByteArray(Credential::kByteLength, '\0'));
    EXPECT_NE(*nil, Credential());

    const auto fromBytes = Credential::fromRfc4122(QByteArray(Credential::kByteLength, '\0'));
    ASSERT_TRUE(fromBytes.has_value());
    EXPECT_EQ(*fromBytes, *nil);
}

TEST(CredentialTest, BinaryFormMatchesTextForm)
{
    const auto credential = Credential::fromString(kUuid);
    ASSERT_TRUE(credential.has_value());

    const QByteArray bytes = credential->toRfc4122();
    EXPECT_EQ(static_cast<quint8>(bytes.at(0)), 0xb8);
    EXPECT_EQ(static_cast<quint8>(bytes.at(15)), 0x11);

    const auto decoded = Credential::fromRfc4122(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, *credential);

    QString error;
    EXPECT_FALSE(Credential::fromRfc4122(bytes.left(15), &error).has_value());
    EXPECT_FALSE(error.isEmpty());
}

TEST(CredentialTest, RedactedFormHidesMostDigits)
{
    auto credential = Credential::fromString(kUuid);
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(credential->redacted(), QStringLiteral("****-0811"));

    credential->clear();
    EXPECT_TRUE(credential->isNull());
    EXPECT_EQ(credential->redacted(), QStringLiteral("<none>"));
}
