#include "client/refresh_scheduler.hpp"

#include <QTimer>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace intervals {

namespace {

const QString kComponent = QStringLiteral("RefreshScheduler");

} // namespace

RefreshWorker::RefreshWorker(std::function<void()> tick, std::chrono::milliseconds interval)
    : m_tick(std::move(tick))
    , m_interval(interval)
{
}

void RefreshWorker::begin()
{
    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    m_timer->setInterval(m_interval);
    connect(m_timer, &QTimer::timeout, this, &RefreshWorker::onTimeout);
    onTimeout();
}

void RefreshWorker::onTimeout()
{
    m_tick();
    m_timer->start();
}

RefreshScheduler::RefreshScheduler(FetchFn fetch,
                                   SinkFn sink,
                                   std::chrono::milliseconds interval)
    : m_fetch(std::move(fetch))
    , m_sink(std::move(sink))
    , m_interval(interval)
{
    m_thread.setObjectName(QStringLiteral("refresh-scheduler"));
}

RefreshScheduler::~RefreshScheduler()
{
    stop();
}

void RefreshScheduler::start()
{
    if (m_thread.isRunning()) {
        return;
    }

    auto *worker = new RefreshWorker(
        [this]() {
            ILOG_DEBUG(kComponent,
                       QStringLiteral("tick"),
                       QStringLiteral("scheduled_refresh"),
                       QStringLiteral("timer_tick"),
                       QStringLiteral("worker_thread"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"tick", m_ticks.load()}}));
            runOnce();
        },
        m_interval);
    worker->moveToThread(&m_thread);
    // The worker and its timer are torn down on their own thread when it finishes.
    QObject::connect(&m_thread, &QThread::started, worker, &RefreshWorker::begin);
    QObject::connect(&m_thread, &QThread::finished, worker, &QObject::deleteLater);
    m_thread.start();

    ILOG_INFO(kComponent,
              QStringLiteral("start"),
              QStringLiteral("scheduler_start"),
              QStringLiteral("app_start"),
              QStringLiteral("worker_thread"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"intervalMs", static_cast<long long>(m_interval.count())}}));
}

void RefreshScheduler::stop()
{
    if (!m_thread.isRunning()) {
        return;
    }
    m_thread.quit();
    m_thread.wait();

    ILOG_INFO(kComponent,
              QStringLiteral("stop"),
              QStringLiteral("scheduler_stop"),
              QStringLiteral("app_shutdown"),
              QStringLiteral("thread_wait"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"ticks", m_ticks.load()}}));
}

bool RefreshScheduler::isRunning() const
{
    return m_thread.isRunning();
}

void RefreshScheduler::runOnce()
{
    const QString text = m_fetch();
    ++m_ticks;
    m_sink(text);
}

} // namespace intervals
