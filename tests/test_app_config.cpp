#include <QtTest/QtTest>

#include "common/app_config.hpp"

class AppConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testDefaults();
    void testFlagsOverride();
    void testEnvironment();
    void testInvalidNumbersKeepDefaults();
};

void AppConfigTests::init()
{
    qunsetenv("INTERVALS_TRAY_SETTINGS");
    qunsetenv("INTERVALS_TRAY_API_BASE");
    qunsetenv("INTERVALS_TRAY_INTERVAL");
    qunsetenv("INTERVALS_TRAY_TRACE");
    qunsetenv("INTERVALS_TRAY_LOG_DIR");
}

void AppConfigTests::testDefaults()
{
    const intervals::AppConfig config =
        intervals::parseAppConfig({QStringLiteral("intervals-tray")});

    QCOMPARE(config.apiBaseUrl, QStringLiteral("https://intervals.icu/api/v1"));
    QCOMPARE(config.refreshIntervalSeconds, 600);
    QCOMPARE(config.requestTimeoutSeconds, 10);
    QVERIFY(!config.traceEnabled);
    QVERIFY(config.logDirectory.isEmpty());
    QVERIFY(config.settingsPath.endsWith(QStringLiteral("settings.json")));
}

void AppConfigTests::testFlagsOverride()
{
    const intervals::AppConfig config = intervals::parseAppConfig({
        QStringLiteral("intervals-tray"),
        QStringLiteral("--settings"), QStringLiteral("/tmp/custom.json"),
        QStringLiteral("--api-base"), QStringLiteral("http://127.0.0.1:8080/api/v1/"),
        QStringLiteral("--interval"), QStringLiteral("30"),
        QStringLiteral("--timeout"), QStringLiteral("3"),
        QStringLiteral("--trace"),
        QStringLiteral("--log-dir"), QStringLiteral("/tmp/intervals-logs"),
        QStringLiteral("-platform"), QStringLiteral("offscreen"),
    });

    QCOMPARE(config.settingsPath, QStringLiteral("/tmp/custom.json"));
    QCOMPARE(config.apiBaseUrl, QStringLiteral("http://127.0.0.1:8080/api/v1"));
    QCOMPARE(config.refreshIntervalSeconds, 30);
    QCOMPARE(config.requestTimeoutSeconds, 3);
    QVERIFY(config.traceEnabled);
    QCOMPARE(config.logDirectory, QStringLiteral("/tmp/intervals-logs"));
}

void AppConfigTests::testEnvironment()
{
    qputenv("INTERVALS_TRAY_SETTINGS", "/tmp/env.json");
    qputenv("INTERVALS_TRAY_INTERVAL", "120");
    qputenv("INTERVALS_TRAY_TRACE", "1");
    qputenv("INTERVALS_TRAY_LOG_DIR", "/tmp/env-logs");

    const intervals::AppConfig fromEnv =
        intervals::parseAppConfig({QStringLiteral("intervals-tray")});
    QCOMPARE(fromEnv.settingsPath, QStringLiteral("/tmp/env.json"));
    QCOMPARE(fromEnv.refreshIntervalSeconds, 120);
    QVERIFY(fromEnv.traceEnabled);
    QCOMPARE(fromEnv.logDirectory, QStringLiteral("/tmp/env-logs"));

    const intervals::AppConfig flagWins = intervals::parseAppConfig({
        QStringLiteral("intervals-tray"),
        QStringLiteral("--interval"), QStringLiteral("45"),
    });
    QCOMPARE(flagWins.refreshIntervalSeconds, 45);
}

void AppConfigTests::testInvalidNumbersKeepDefaults()
{
    QStringList warnings;
    const intervals::AppConfig config = intervals::parseAppConfig({
        QStringLiteral("intervals-tray"),
        QStringLiteral("--interval"), QStringLiteral("soon"),
        QStringLiteral("--timeout"), QStringLiteral("0"),
    }, &warnings);

    QCOMPARE(config.refreshIntervalSeconds, 600);
    QCOMPARE(config.requestTimeoutSeconds, 10);
    QCOMPARE(warnings.size(), 2);
}

QTEST_MAIN(AppConfigTests)
#include "test_app_config.moc"
