#include <QObject>
#include <QString>
#include <QStringList>

#include <gtest/gtest.h>

import vlesstunnel.core.systemlog;

TEST(SystemLogTest, RedactsUuids)
{
    const QString line = SystemLog::sanitize(
        QStringLiteral("[Connection] user b831381d-6324-4d53-ad4f-8cda48b30811 rejected"));
    EXPECT_EQ(line, QStringLiteral("[Connection] user [REDACTED_UUID] rejected"));
}

TEST(SystemLogTest, RedactsLinkUserInfo)
{
    const QString line = SystemLog::sanitize(
        QStringLiteral("import vless://b831381d-6324-4d53-ad4f-8cda48b30811@example.com:443?type=tcp"));
    EXPECT_EQ(line, QStringLiteral("import vless://[REDACTED_SECRET]@example.com:443?type=tcp"));
}

TEST(SystemLogTest, RedactsLabelledSecrets)
{
    EXPECT_EQ(SystemLog::sanitize(QStringLiteral("password=hunter2, retry")),
              QStringLiteral("password=[REDACTED_SECRET], retry"));
    EXPECT_EQ(SystemLog::sanitize(QStringLiteral("Token: abc.def")), QStringLiteral("Token: [REDACTED_SECRET]"));
    EXPECT_EQ(SystemLog::sanitize(QStringLiteral("connected in 12 ms")), QStringLiteral("connected in 12 ms"));
}

TEST(SystemLogTest, SuppressesConsecutiveDuplicates)
{
    SystemLog log;
    int appended = 0;
    QObject::connect(&log, &SystemLog::lineAppended, [&appended](const QString&) { ++appended; });

    log.append(QStringLiteral("[System] one"));
    log.append(QStringLiteral("  [System] one  "));
    log.append(QStringLiteral("[System] two"));
    log.append(QStringLiteral("[System] one"));
    log.append(QStringLiteral("   "));

    EXPECT_EQ(log.recentLogs(),
              (QStringList{QStringLiteral("[System] one"), QStringLiteral("[System] two"), QStringLiteral("[System] one")}));
    EXPECT_EQ(appended, 3);
    EXPECT_EQ(log.latestLine(), QStringLiteral("[System] one"));
}

TEST(SystemLogTest, KeepsBoundedRing)
{
    SystemLog log;
    for (int i = 0; i < SystemLog::kMaxLogLines + 25; ++i) {
        log.append(QStringLiteral("line %1").arg(i));
    }

    const QStringList lines = log.recentLogs();
    ASSERT_EQ(lines.size(), SystemLog::kMaxLogLines);
    EXPECT_EQ(lines.first(), QStringLiteral("line 25"));
    EXPECT_EQ(lines.last(), QStringLiteral("line %1").arg(SystemLog::kMaxLogLines + 24));
}

TEST(SystemLogTest, DisabledLogRecordsNothing)
{
    SystemLog log;
    int enabled = 0;
    QObject::connect(&log, &SystemLog::enabledChanged, [&enabled]() { ++enabled; });
    log.setEnabled(false);
    log.setEnabled(false);
    EXPECT_EQ(enabled, 1);

    log.append(QStringLiteral("ignored"));
    EXPECT_TRUE(log.recentLogs().isEmpty());

    log.setEnabled(true);
    log.append(QStringLiteral("kept"));
    EXPECT_EQ(log.latestLine(), QStringLiteral("kept"));

    log.clear();
    EXPECT_TRUE(log.recentLogs().isEmpty());
}
