#include <QApplication>
#include <QDebug>
#include <QIcon>
#include <QSystemTrayIcon>

#include <chrono>
#include <memory>

#include <nlohmann/json.hpp>

#include "client/http_transport.hpp"
#include "client/settings_store.hpp"
#include "client/stats_client.hpp"
#include "common/app_config.hpp"
#include "common/app_paths.hpp"
#include "common/logging.hpp"
#include "tray/QtTrayShell.hpp"
#include "tray/TrayController.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("intervals-tray"));

    QStringList configWarnings;
    const intervals::AppConfig config =
        intervals::parseAppConfig(QCoreApplication::arguments(), &configWarnings);

    intervals::logging::LogOptions logOptions;
    logOptions.directory = config.logDirectory;
    logOptions.traceEnabled = config.traceEnabled;
    intervals::logging::initLogging(logOptions);
    ILOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("tray_start"),
              QStringLiteral("user_start"),
              QStringLiteral("qt_app"),
              intervals::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"settingsPath", config.settingsPath.toStdString()},
                              {"apiBase", config.apiBaseUrl.toStdString()},
                              {"intervalSeconds", config.refreshIntervalSeconds},
                              {"logFile", intervals::logging::logFilePath().toStdString()}}));
    for (const QString &warning : configWarnings) {
        ILOG_WARN(QStringLiteral("main"),
                  QStringLiteral("main"),
                  QStringLiteral("config_value_ignored"),
                  warning,
                  QStringLiteral("defaults"),
                  intervals::logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
    }

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "System tray not available. Exiting.";
        return 1;
    }

    app.setQuitOnLastWindowClosed(false);

    const QIcon icon = intervals::QtTrayShell::loadTrayIcon(intervals::appIconPath());
    app.setWindowIcon(icon);

    intervals::SettingsStore store(config.settingsPath);
    auto client = std::make_shared<intervals::StatsClient>(
        std::make_shared<intervals::QtHttpTransport>(),
        store.load(),
        config.apiBaseUrl,
        config.requestTimeoutSeconds * 1000);

    // Shell outlives the controller; both are torn down when exec() returns.
    intervals::QtTrayShell shell(icon);
    intervals::TrayController controller(client,
                                         store,
                                         shell,
                                         std::chrono::seconds(config.refreshIntervalSeconds));
    controller.start();

    const int rc = app.exec();
    controller.stop();
    return rc;
}
