#include "common/app_config.hpp"

#include "common/app_paths.hpp"

namespace intervals {

namespace {

void applySeconds(const QString &raw,
                  const QString &name,
                  int *target,
                  QStringList *warnings)
{
    bool ok = false;
    const int value = raw.trimmed().toInt(&ok);
    if (!ok || value < 1) {
        if (warnings) {
            warnings->push_back(QStringLiteral("invalid %1 '%2', keeping %3")
                                    .arg(name, raw)
                                    .arg(*target));
        }
        return;
    }
    *target = value;
}

QString trimTrailingSlash(QString url)
{
    while (url.endsWith(QLatin1Char('/'))) {
        url.chop(1);
    }
    return url;
}

} // namespace

AppConfig parseAppConfig(const QStringList &args, QStringList *warnings)
{
    AppConfig config;
    config.settingsPath = defaultSettingsPath();

    const QString envSettings = qEnvironmentVariable("INTERVALS_TRAY_SETTINGS");
    if (!envSettings.isEmpty()) {
        config.settingsPath = envSettings;
    }
    const QString envBase = qEnvironmentVariable("INTERVALS_TRAY_API_BASE");
    if (!envBase.isEmpty()) {
        config.apiBaseUrl = envBase;
    }
    const QString envInterval = qEnvironmentVariable("INTERVALS_TRAY_INTERVAL");
    if (!envInterval.isEmpty()) {
        applySeconds(envInterval, QStringLiteral("INTERVALS_TRAY_INTERVAL"),
                     &config.refreshIntervalSeconds, warnings);
    }
    config.logDirectory = qEnvironmentVariable("INTERVALS_TRAY_LOG_DIR");
    config.traceEnabled = qEnvironmentVariableIntValue("INTERVALS_TRAY_TRACE") == 1;

    // args[0] is the program name.
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        const bool hasValue = i + 1 < args.size();
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        } else if (arg == QStringLiteral("--settings") && hasValue) {
            config.settingsPath = args.at(++i);
        } else if (arg == QStringLiteral("--log-dir") && hasValue) {
            config.logDirectory = args.at(++i);
        } else if (arg == QStringLiteral("--api-base") && hasValue) {
            config.apiBaseUrl = args.at(++i);
        } else if (arg == QStringLiteral("--interval") && hasValue) {
            applySeconds(args.at(++i), QStringLiteral("--interval"),
                         &config.refreshIntervalSeconds, warnings);
        } else if (arg == QStringLiteral("--timeout") && hasValue) {
            applySeconds(args.at(++i), QStringLiteral("--timeout"),
                         &config.requestTimeoutSeconds, warnings);
        }
    }

    config.apiBaseUrl = trimTrailingSlash(config.apiBaseUrl);
    return config;
}

} // namespace intervals
