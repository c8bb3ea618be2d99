#pragma once

#include <QObject>
#include <QString>
#include <QThread>

#include <atomic>
#include <chrono>
#include <functional>

class QTimer;

namespace intervals {

class RefreshWorker;

/**
 * RefreshScheduler runs a fetch on a dedicated QThread at a fixed interval
 * and hands every result to a sink.
 *
 * The first tick happens right after start(). Ticks are sequential: the
 * single-shot timer is re-armed only after a publish, so a slow fetch delays
 * the next tick by its own duration. stop() quits the worker's event loop and
 * waits; an in-flight fetch is allowed to finish. The sink is called on the
 * worker thread.
 */
class RefreshScheduler
{
public:
    using FetchFn = std::function<QString()>;
    using SinkFn = std::function<void(const QString &)>;

    RefreshScheduler(FetchFn fetch,
                     SinkFn sink,
                     std::chrono::milliseconds interval = std::chrono::seconds(600));
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler &) = delete;
    RefreshScheduler &operator=(const RefreshScheduler &) = delete;

    void start();
    void stop();

    // One fetch-and-publish on the calling thread.
    void runOnce();

    bool isRunning() const;
    int tickCount() const { return m_ticks.load(); }
    std::chrono::milliseconds interval() const { return m_interval; }

private:
    FetchFn m_fetch;
    SinkFn m_sink;
    std::chrono::milliseconds m_interval;

    QThread m_thread;
    std::atomic<int> m_ticks{0};
};

// Lives on the scheduler's thread; owns the timer so it is armed and
// destroyed there.
class RefreshWorker : public QObject
{
    Q_OBJECT
public:
    RefreshWorker(std::function<void()> tick, std::chrono::milliseconds interval);

public slots:
    void begin();

private slots:
    void onTimeout();

private:
    std::function<void()> m_tick;
    std::chrono::milliseconds m_interval;
    QTimer *m_timer = nullptr;
};

} // namespace intervals
