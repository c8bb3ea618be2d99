#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QThread>

#include <atomic>
#include <chrono>
#include <mutex>

#include "client/refresh_scheduler.hpp"

using namespace std::chrono_literals;

namespace {

// Thread-safe record of everything the scheduler published.
class SinkRecorder
{
public:
    void publish(const QString &text)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.push_back(text);
    }

    QStringList values() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values;
    }

    int count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values.size();
    }

private:
    mutable std::mutex m_mutex;
    QStringList m_values;
};

} // namespace

class RefreshSchedulerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testRunOnceIsSynchronous();
    void testStartTicksImmediately();
    void testRepeatsAtInterval();
    void testStopIsPromptDuringLongInterval();
    void testFailuresDoNotStopLoop();
    void testStartStopIdempotent();
    void testSlowFetchDelaysNextTick();
    void testTicksRunOnWorkerThread();
    void testStopRightAfterStart();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void RefreshSchedulerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RefreshSchedulerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void RefreshSchedulerTests::testRunOnceIsSynchronous()
{
    SinkRecorder sink;
    int calls = 0;
    intervals::RefreshScheduler scheduler(
        [&calls]() { return QStringLiteral("tick %1").arg(++calls); },
        [&sink](const QString &text) { sink.publish(text); });

    scheduler.runOnce();
    scheduler.runOnce();

    QCOMPARE(sink.values(), QStringList({QStringLiteral("tick 1"), QStringLiteral("tick 2")}));
    QCOMPARE(scheduler.tickCount(), 2);
    QVERIFY(!scheduler.isRunning());
}

void RefreshSchedulerTests::testStartTicksImmediately()
{
    SinkRecorder sink;
    intervals::RefreshScheduler scheduler(
        []() { return QStringLiteral("CTL: 50"); },
        [&sink](const QString &text) { sink.publish(text); },
        std::chrono::hours(1));

    scheduler.start();
    QVERIFY(scheduler.isRunning());
    QTRY_COMPARE(sink.count(), 1);
    scheduler.stop();

    QCOMPARE(sink.values().front(), QStringLiteral("CTL: 50"));
    QVERIFY(!scheduler.isRunning());
}

void RefreshSchedulerTests::testRepeatsAtInterval()
{
    SinkRecorder sink;
    std::atomic<int> calls{0};
    intervals::RefreshScheduler scheduler(
        [&calls]() { return QString::number(++calls); },
        [&sink](const QString &text) { sink.publish(text); },
        20ms);

    scheduler.start();
    QTRY_VERIFY(sink.count() >= 3);
    scheduler.stop();

    const int published = sink.count();
    QCOMPARE(scheduler.tickCount(), published);
    const QStringList values = sink.values();
    for (int i = 0; i < values.size(); ++i) {
        QCOMPARE(values.at(i), QString::number(i + 1));
    }

    // Nothing is published after stop() returns.
    QTest::qWait(60);
    QCOMPARE(sink.count(), published);
}

void RefreshSchedulerTests::testStopIsPromptDuringLongInterval()
{
    SinkRecorder sink;
    intervals::RefreshScheduler scheduler(
        []() { return QStringLiteral("x"); },
        [&sink](const QString &text) { sink.publish(text); },
        std::chrono::seconds(600));

    scheduler.start();
    QTRY_COMPARE(sink.count(), 1);

    QElapsedTimer elapsed;
    elapsed.start();
    scheduler.stop();
    QVERIFY(elapsed.elapsed() < 1000);
    QCOMPARE(sink.count(), 1);
}

void RefreshSchedulerTests::testFailuresDoNotStopLoop()
{
    SinkRecorder sink;
    intervals::RefreshScheduler scheduler(
        []() { return QStringLiteral("Failed to fetch data"); },
        [&sink](const QString &text) { sink.publish(text); },
        10ms);

    scheduler.start();
    QTRY_VERIFY(sink.count() >= 5);
    QVERIFY(scheduler.isRunning());
    scheduler.stop();

    for (const QString &value : sink.values()) {
        QCOMPARE(value, QStringLiteral("Failed to fetch data"));
    }
}

void RefreshSchedulerTests::testStartStopIdempotent()
{
    SinkRecorder sink;
    intervals::RefreshScheduler scheduler(
        []() { return QStringLiteral("x"); },
        [&sink](const QString &text) { sink.publish(text); },
        std::chrono::hours(1));

    scheduler.stop();
    scheduler.start();
    scheduler.start();
    QTRY_COMPARE(sink.count(), 1);
    scheduler.stop();
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());

    // Restart after stop runs a fresh first tick.
    scheduler.start();
    QTRY_COMPARE(sink.count(), 2);
    scheduler.stop();
}

void RefreshSchedulerTests::testSlowFetchDelaysNextTick()
{
    SinkRecorder sink;
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    intervals::RefreshScheduler scheduler(
        [&inFlight, &maxInFlight]() {
            const int now = ++inFlight;
            if (now > maxInFlight) {
                maxInFlight = now;
            }
            QThread::msleep(30);
            --inFlight;
            return QStringLiteral("slow");
        },
        [&sink](const QString &text) { sink.publish(text); },
        5ms);

    scheduler.start();
    QTRY_VERIFY(sink.count() >= 3);
    scheduler.stop();

    QCOMPARE(maxInFlight.load(), 1);
}

void RefreshSchedulerTests::testTicksRunOnWorkerThread()
{
    std::atomic<QThread *> fetchThread{nullptr};
    std::atomic<QThread *> sinkThread{nullptr};
    intervals::RefreshScheduler scheduler(
        [&fetchThread]() {
            fetchThread = QThread::currentThread();
            return QStringLiteral("x");
        },
        [&sinkThread](const QString &) { sinkThread = QThread::currentThread(); },
        std::chrono::hours(1));

    scheduler.start();
    QTRY_VERIFY(sinkThread.load() != nullptr);
    scheduler.stop();

    QVERIFY(fetchThread.load() != QThread::currentThread());
    QCOMPARE(fetchThread.load(), sinkThread.load());
}

void RefreshSchedulerTests::testStopRightAfterStart()
{
    SinkRecorder sink;
    intervals::RefreshScheduler scheduler(
        []() { return QStringLiteral("x"); },
        [&sink](const QString &text) { sink.publish(text); },
        20ms);

    scheduler.start();
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());

    // At most the immediate first tick may have happened.
    const int published = sink.count();
    QVERIFY(published <= 1);
    QTest::qWait(60);
    QCOMPARE(sink.count(), published);
}

QTEST_MAIN(RefreshSchedulerTests)
#include "test_refresh_scheduler.moc"
