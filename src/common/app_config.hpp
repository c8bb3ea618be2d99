#pragma once

#include <QString>
#include <QStringList>

namespace intervals {

inline constexpr const char *kDefaultApiBase = "https://intervals.icu/api/v1";
inline constexpr int kDefaultRefreshIntervalSeconds = 600;
inline constexpr int kDefaultRequestTimeoutSeconds = 10;

struct AppConfig {
    QString settingsPath;
    QString apiBaseUrl = QString::fromLatin1(kDefaultApiBase);
    int refreshIntervalSeconds = kDefaultRefreshIntervalSeconds;
    int requestTimeoutSeconds = kDefaultRequestTimeoutSeconds;
    // Empty means logging::defaultLogDirectory().
    QString logDirectory;
    bool traceEnabled = false;
};

// Environment first, then command-line flags (flags win). Unknown flags are
// ignored so Qt's own arguments pass through. Invalid numbers keep the
// defaults and are reported in warnings.
AppConfig parseAppConfig(const QStringList &args, QStringList *warnings = nullptr);

} // namespace intervals
