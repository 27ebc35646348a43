#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QTemporaryDir>

#include <chrono>
#include <memory>
#include <thread>

#include <sqlite3.h>

#include "daemon/monitoring_scheduler.hpp"
#include "engine_fixture.hpp"

using hwidwatch::DriftStatus;
using hwidwatch::MonitoringScheduler;
using hwidwatch::testing::EngineFixture;
using hwidwatch::testing::FakeCollector;
using hwidwatch::testing::makeSnapshot;

class MonitoringSchedulerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testPassSavesFirstRunAndChanges();
    void testFailedPassIsReported();
    void testUnreadableBaselineIsKept();
    void testStopObservedWithinTick();
    void testWaitsIntervalBeforeFirstPass();

private:
    QTemporaryDir m_tempDir;
    std::unique_ptr<EngineFixture> m_engine;
};

void MonitoringSchedulerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void MonitoringSchedulerTests::init()
{
    const std::filesystem::path dir(m_tempDir.path().toStdString());
    hwidwatch::testing::removeEngineFiles(dir);
    m_engine = std::make_unique<EngineFixture>(dir);
    m_engine->collector.push(makeSnapshot("X1"));
}

void MonitoringSchedulerTests::cleanup()
{
    m_engine.reset();
}

void MonitoringSchedulerTests::testPassSavesFirstRunAndChanges()
{
    MonitoringScheduler scheduler(m_engine->context);
    QVERIFY(!scheduler.status().lastCheck.has_value());

    QVERIFY(scheduler.runPass() == DriftStatus::NoBaseline);
    QVERIFY(m_engine->reports.loadCurrent().has_value());
    QVERIFY(scheduler.status().lastCheck.has_value());
    QCOMPARE(m_engine->reports.history().size(), std::size_t(1));

    QVERIFY(scheduler.runPass() == DriftStatus::Unchanged);
    QCOMPARE(m_engine->reports.history().size(), std::size_t(1));

    m_engine->collector.replace(makeSnapshot("X2"));
    QVERIFY(scheduler.runPass() == DriftStatus::Changed);
    QCOMPARE(m_engine->reports.history().size(), std::size_t(2));
    QVERIFY(scheduler.runPass() == DriftStatus::Unchanged);

    QCOMPARE(m_engine->stats.stats().totalChecks, 4LL);
    QCOMPARE(m_engine->stats.stats().totalChanges, 1LL);
}

void MonitoringSchedulerTests::testFailedPassIsReported()
{
    MonitoringScheduler scheduler(m_engine->context);

    m_engine->collector.setMode(FakeCollector::Mode::ReturnNothing);
    QVERIFY(!scheduler.runPass().has_value());
    QVERIFY(scheduler.status().lastCheck.has_value());

    m_engine->collector.setMode(FakeCollector::Mode::Throw);
    QVERIFY(!scheduler.runPass().has_value());
    QVERIFY(!m_engine->reports.loadCurrent().has_value());

    m_engine->collector.setMode(FakeCollector::Mode::Normal);
    QVERIFY(scheduler.runPass().has_value());
}

void MonitoringSchedulerTests::testUnreadableBaselineIsKept()
{
    MonitoringScheduler scheduler(m_engine->context);
    QVERIFY(scheduler.runPass() == DriftStatus::NoBaseline);
    const auto baseline = m_engine->reports.loadCurrent();
    QVERIFY(baseline.has_value());

    m_engine->collector.replace(makeSnapshot("X2"));

    const std::filesystem::path dbPath =
        std::filesystem::path(m_tempDir.path().toStdString()) / "hwidwatch.db";
    sqlite3 *locker = nullptr;
    QCOMPARE(sqlite3_open(dbPath.string().c_str(), &locker), SQLITE_OK);
    QCOMPARE(sqlite3_exec(locker, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    const auto blocked = scheduler.runPass();

    sqlite3_exec(locker, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(locker);

    QVERIFY(!blocked.has_value());
    QCOMPARE(m_engine->reports.loadCurrent()->fingerprint.digest, baseline->fingerprint.digest);
    QCOMPARE(m_engine->stats.stats().totalChecks, 1LL);

    // The drift hidden behind the failed read is still reported afterwards.
    QVERIFY(scheduler.runPass() == DriftStatus::Changed);
}

void MonitoringSchedulerTests::testStopObservedWithinTick()
{
    MonitoringScheduler scheduler(m_engine->context, std::chrono::milliseconds(50));
    scheduler.start();
    QVERIFY(scheduler.isActive());
    QVERIFY(scheduler.status().active);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    QElapsedTimer timer;
    timer.start();
    scheduler.stop();
    QVERIFY(timer.elapsed() < 1000);
    QVERIFY(!scheduler.status().active);

    // Restartable after a stop.
    scheduler.start();
    QVERIFY(scheduler.isActive());
    scheduler.stop();
    QVERIFY(!scheduler.isActive());
}

void MonitoringSchedulerTests::testWaitsIntervalBeforeFirstPass()
{
    QCOMPARE(m_engine->settings.monitoringIntervalSeconds(), 300);

    MonitoringScheduler scheduler(m_engine->context, std::chrono::milliseconds(10));
    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    scheduler.stop();

    QCOMPARE(m_engine->collector.calls(), 0);
    QVERIFY(!scheduler.status().lastCheck.has_value());
}

QTEST_MAIN(MonitoringSchedulerTests)
#include "test_monitoring_scheduler.moc"
