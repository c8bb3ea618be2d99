#pragma once

#include <QObject>
#include <QString>
#include <QThread>

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include "client/refresh_scheduler.hpp"
#include "client/settings_store.hpp"
#include "client/stats_client.hpp"
#include "tray/PresentationShell.hpp"

namespace intervals {

/**
 * TrayController connects a PresentationShell to the stats client.
 *
 * It lives on the UI thread. Network work runs either on the scheduler's
 * worker or on short-lived QThreads for manual fetches; results come back
 * through queued calls, and only the latest status text is kept.
 */
class TrayController : public QObject
{
    Q_OBJECT
public:
    TrayController(std::shared_ptr<StatsClient> client,
                   SettingsStore &store,
                   PresentationShell &shell,
                   std::chrono::milliseconds refreshInterval,
                   QObject *parent = nullptr);
    ~TrayController() override;

    void start();
    void stop();

    void requestPopup();
    void openSettings();
    void refreshNow();

    QString lastStatusText() const { return m_lastStatusText; }
    bool isSchedulerRunning() const { return m_scheduler.isRunning(); }
    int pendingManualFetches() const { return static_cast<int>(m_manualFetches.size()); }

signals:
    void statusPublished(const QString &text);
    void popupShown(const QString &text);

private:
    void publishStatus(const QString &text);
    void runManualFetch(const QString &reason, std::function<void(const QString &)> onResult);
    void reapFinishedFetches();
    void waitForManualFetches();

    std::shared_ptr<StatsClient> m_client;
    SettingsStore &m_store;
    PresentationShell &m_shell;
    RefreshScheduler m_scheduler;
    std::vector<std::unique_ptr<QThread>> m_manualFetches;
    QString m_lastStatusText;
};

} // namespace intervals
