#include "tray/TrayController.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace intervals {

namespace {

const QString kComponent = QStringLiteral("TrayController");

} // namespace

TrayController::TrayController(std::shared_ptr<StatsClient> client,
                               SettingsStore &store,
                               PresentationShell &shell,
                               std::chrono::milliseconds refreshInterval,
                               QObject *parent)
    : QObject(parent)
    , m_client(std::move(client))
    , m_store(store)
    , m_shell(shell)
    , m_scheduler(
          [client = m_client]() { return client->fetchTodayStats(); },
          [this](const QString &text) {
              // Worker thread; hop to the controller's thread.
              QMetaObject::invokeMethod(this, [this, text]() { publishStatus(text); },
                                        Qt::QueuedConnection);
          },
          refreshInterval)
{
}

TrayController::~TrayController()
{
    stop();
}

void TrayController::start()
{
    ShellHandlers handlers;
    handlers.onStatsRequested = [this]() { requestPopup(); };
    handlers.onSettingsRequested = [this]() { openSettings(); };
    handlers.onRefreshRequested = [this]() { refreshNow(); };
    m_shell.setHandlers(std::move(handlers));

    m_shell.setStatusText(QStringLiteral("Intervals - loading..."));

    ILOG_INFO(kComponent,
              QStringLiteral("start"),
              QStringLiteral("controller_start"),
              QStringLiteral("app_start"),
              QStringLiteral("scheduler"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"intervalMs",
                               static_cast<long long>(m_scheduler.interval().count())}}));
    m_scheduler.start();
}

void TrayController::stop()
{
    m_scheduler.stop();
    waitForManualFetches();
}

void TrayController::requestPopup()
{
    ILOG_INFO(kComponent,
              QStringLiteral("requestPopup"),
              QStringLiteral("show_stats_popup"),
              QStringLiteral("user_action"),
              QStringLiteral("manual_fetch"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    runManualFetch(QStringLiteral("popup"), [this](const QString &text) {
        m_shell.showPopup(text);
        emit popupShown(text);
    });
}

void TrayController::openSettings()
{
    const std::optional<Credentials> updated = m_shell.showSettingsDialog(m_client->credentials());
    if (!updated) {
        ILOG_DEBUG(kComponent,
                   QStringLiteral("openSettings"),
                   QStringLiteral("settings_cancelled"),
                   QStringLiteral("user_action"),
                   QStringLiteral("dialog"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return;
    }

    // The session keeps the new credentials even when the save fails.
    m_client->setCredentials(*updated);
    m_store.save(*updated);
    refreshNow();
}

void TrayController::refreshNow()
{
    runManualFetch(QStringLiteral("refresh"), [this](const QString &text) {
        publishStatus(text);
    });
}

void TrayController::publishStatus(const QString &text)
{
    m_lastStatusText = text;
    m_shell.setStatusText(text);
    emit statusPublished(text);
}

void TrayController::runManualFetch(const QString &reason,
                                    std::function<void(const QString &)> onResult)
{
    auto result = std::make_shared<QString>();
    std::shared_ptr<StatsClient> client = m_client;
    std::unique_ptr<QThread> worker(QThread::create([client, result]() {
        *result = client->fetchTodayStats();
    }));
    worker->setObjectName(QStringLiteral("manual-fetch-") + reason);

    connect(worker.get(), &QThread::finished, this,
            [result, onResult = std::move(onResult)]() { onResult(*result); });

    reapFinishedFetches();
    worker->start();
    m_manualFetches.push_back(std::move(worker));
}

void TrayController::reapFinishedFetches()
{
    // A finished thread has already queued its result to this object, so
    // destroying the QThread here does not lose the delivery.
    m_manualFetches.erase(
        std::remove_if(m_manualFetches.begin(), m_manualFetches.end(),
                       [](const std::unique_ptr<QThread> &worker) {
                           return worker->isFinished();
                       }),
        m_manualFetches.end());
}

void TrayController::waitForManualFetches()
{
    for (const std::unique_ptr<QThread> &worker : m_manualFetches) {
        worker->wait();
    }
    m_manualFetches.clear();
}

} // namespace intervals
