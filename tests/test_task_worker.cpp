#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "daemon/fingerprint_engine.hpp"
#include "daemon/task_worker.hpp"
#include "engine_fixture.hpp"

using hwidwatch::TaskKind;
using hwidwatch::TaskResult;
using hwidwatch::TaskWorker;
using hwidwatch::testing::EngineFixture;
using hwidwatch::testing::FakeCollector;
using hwidwatch::testing::makeSnapshot;

namespace {

constexpr std::chrono::milliseconds kWait(5000);

} // namespace

class TaskWorkerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testUnknownKindYieldsError();
    void testCollectSavesWhenAutoSaveEnabled();
    void testCompareSequenceAndBaseline();
    void testCompareWithUnreadableBaselineFails();
    void testCollectorFailureIsErrorResult();
    void testThrowingCollectorKeepsWorkerAlive();
    void testBanCurrentThenAntiCheatCheck();
    void testAntiCheatWithSimulatorDisabled();
    void testFetchStats();
    void testConcurrentSubmittersGetOwnResults();
    void testDuplicatePendingIdRejected();
    void testPollTimeoutAndForget();
    void testStopResolvesQueuedTasks();

private:
    QTemporaryDir m_tempDir;
    std::unique_ptr<EngineFixture> m_engine;
    std::unique_ptr<TaskWorker> m_worker;

    TaskResult runTask(const std::string &kind);
};

void TaskWorkerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void TaskWorkerTests::init()
{
    const std::filesystem::path dir(m_tempDir.path().toStdString());
    hwidwatch::testing::removeEngineFiles(dir);
    m_engine = std::make_unique<EngineFixture>(dir);
    m_engine->collector.push(makeSnapshot("X1"));
    m_worker = std::make_unique<TaskWorker>(m_engine->context);
    m_worker->start();
}

void TaskWorkerTests::cleanup()
{
    m_engine->collector.openGate();
    m_worker.reset();
    m_engine.reset();
}

TaskResult TaskWorkerTests::runTask(const std::string &kind)
{
    const std::string id = m_worker->submit(kind);
    const auto result = m_worker->poll(id, kWait);
    if (!result.has_value()) {
        throw std::runtime_error("task " + id + " timed out");
    }
    return *result;
}

void TaskWorkerTests::testUnknownKindYieldsError()
{
    const std::string id = m_worker->submit("defragment");
    const auto result = m_worker->poll(id, kWait);
    QVERIFY(result.has_value());
    QCOMPARE(QString::fromStdString(result->id), QString::fromStdString(id));
    QVERIFY(!result->ok());
    QCOMPARE(QString::fromStdString(result->errorMessage),
             QStringLiteral("unknown task kind: defragment"));
}

void TaskWorkerTests::testCollectSavesWhenAutoSaveEnabled()
{
    const auto result = runTask("collect");
    QVERIFY(result.ok());
    QVERIFY(result.payload.value("saved", false));
    QVERIFY(result.payload.value("fingerprintValid", false));
    QVERIFY(result.payload.contains("snapshot"));

    const auto current = m_engine->reports.loadCurrent();
    QVERIFY(current.has_value());
    QCOMPARE(current->fingerprint.digest, result.payload.value("fingerprint", std::string()));

    QVERIFY(m_engine->settings.set("autoSaveReports", false));
    m_engine->collector.replace(makeSnapshot("X2"));
    const auto unsaved = runTask("collect");
    QVERIFY(unsaved.ok());
    QVERIFY(!unsaved.payload.value("saved", true));
    QCOMPARE(m_engine->reports.loadCurrent()->fingerprint.digest, current->fingerprint.digest);
}

void TaskWorkerTests::testCompareSequenceAndBaseline()
{
    const auto first = runTask("compareOnly");
    QVERIFY(first.ok());
    QCOMPARE(QString::fromStdString(first.payload.value("status", std::string())),
             QStringLiteral("no_baseline"));
    QVERIFY(first.payload.value("baselineSaved", false));

    const auto second = runTask("compareOnly");
    QCOMPARE(QString::fromStdString(second.payload.value("status", std::string())),
             QStringLiteral("unchanged"));

    m_engine->collector.replace(makeSnapshot("X2"));
    const auto third = runTask("compareOnly");
    QCOMPARE(QString::fromStdString(third.payload.value("status", std::string())),
             QStringLiteral("changed"));
    QCOMPARE(QString::fromStdString(third.payload.value("message", std::string())),
             QStringLiteral("HWID has changed from previous report"));
    QCOMPARE(m_engine->stats.stats().totalChanges, 1LL);
}

void TaskWorkerTests::testCompareWithUnreadableBaselineFails()
{
    QVERIFY(runTask("collect").ok());
    const auto baseline = m_engine->reports.loadCurrent();
    QVERIFY(baseline.has_value());

    const std::filesystem::path dbPath =
        std::filesystem::path(m_tempDir.path().toStdString()) / "hwidwatch.db";
    sqlite3 *locker = nullptr;
    QCOMPARE(sqlite3_open(dbPath.string().c_str(), &locker), SQLITE_OK);
    QCOMPARE(sqlite3_exec(locker, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    m_engine->collector.replace(makeSnapshot("X2"));
    const auto result = runTask("compareOnly");

    sqlite3_exec(locker, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(locker);

    QVERIFY(!result.ok());
    QCOMPARE(QString::fromStdString(result.errorMessage),
             QStringLiteral("Previous report could not be read"));
    QCOMPARE(m_engine->reports.loadCurrent()->fingerprint.digest, baseline->fingerprint.digest);
}

void TaskWorkerTests::testCollectorFailureIsErrorResult()
{
    m_engine->collector.setMode(FakeCollector::Mode::ReturnNothing);
    const auto result = runTask("collect");
    QVERIFY(!result.ok());
    QCOMPARE(QString::fromStdString(result.errorMessage),
             QStringLiteral("Failed to collect HWID data"));
}

void TaskWorkerTests::testThrowingCollectorKeepsWorkerAlive()
{
    m_engine->collector.setMode(FakeCollector::Mode::Throw);
    const auto failed = runTask("compareOnly");
    QVERIFY(!failed.ok());
    QCOMPARE(QString::fromStdString(failed.errorMessage),
             QStringLiteral("simulated collector fault"));

    m_engine->collector.setMode(FakeCollector::Mode::Normal);
    const auto recovered = runTask("compareOnly");
    QVERIFY(recovered.ok());
    QVERIFY(m_worker->isRunning());
}

void TaskWorkerTests::testBanCurrentThenAntiCheatCheck()
{
    const auto clean = runTask("runAntiCheatCheck");
    QVERIFY(clean.ok());
    QVERIFY(!clean.payload.value("banned", true));
    QCOMPARE(QString::fromStdString(clean.payload.value("scanType", std::string())),
             QStringLiteral("fresh_scan"));

    const auto banned = runTask("banCurrent");
    QVERIFY(banned.ok());
    const std::string fingerprint = banned.payload.value("fingerprint", std::string());
    QVERIFY(m_engine->bans.isBanned(fingerprint));
    QVERIFY(m_engine->reports.loadCurrent().has_value());

    const auto denied = runTask("runAntiCheatCheck");
    QVERIFY(denied.ok());
    QVERIFY(denied.payload.value("banned", false));
    QCOMPARE(denied.payload.value("fingerprint", std::string()), fingerprint);

    const auto again = runTask("banCurrent");
    QVERIFY(!again.ok());
    QVERIFY(QString::fromStdString(again.errorMessage).contains(QStringLiteral("already banned")));
    QCOMPARE(m_engine->bans.size(), std::size_t(1));
}

void TaskWorkerTests::testAntiCheatWithSimulatorDisabled()
{
    const auto banned = runTask("banCurrent");
    QVERIFY(banned.ok());
    QVERIFY(m_engine->settings.set("banSimulatorEnabled", false));

    const auto result = runTask("runAntiCheatCheck");
    QVERIFY(result.ok());
    QVERIFY(!result.payload.value("banned", true));
    QVERIFY(!result.payload.value("simulatorEnabled", true));
    QCOMPARE(QString::fromStdString(result.payload.value("message", std::string())),
             QStringLiteral("Ban simulator is disabled"));
}

void TaskWorkerTests::testFetchStats()
{
    runTask("compareOnly");
    runTask("compareOnly");

    const auto result = runTask("fetchStats");
    QVERIFY(result.ok());
    QCOMPARE(result.payload.value("totalChecks", 0LL), 2LL);
    QCOMPARE(result.payload.value("totalChanges", -1LL), 0LL);
    QVERIFY(result.payload.contains("changeFrequency"));
    QVERIFY(result.payload.contains("monthlySummary"));
}

void TaskWorkerTests::testConcurrentSubmittersGetOwnResults()
{
    const std::vector<std::string> kinds = {
        "collect", "compareOnly", "runAntiCheatCheck", "fetchStats", "bogusKind"
    };
    constexpr int kRounds = 4;

    std::vector<std::thread> threads;
    std::vector<std::string> failures(kinds.size() * kRounds);
    for (std::size_t k = 0; k < kinds.size(); ++k) {
        for (int round = 0; round < kRounds; ++round) {
            const std::size_t slot = k * kRounds + static_cast<std::size_t>(round);
            threads.emplace_back([this, &kinds, &failures, k, round, slot]() {
                const std::string id = kinds[k] + "-caller-" + std::to_string(round);
                m_worker->submit(kinds[k], id);
                const auto result = m_worker->poll(id, kWait);
                if (!result.has_value()) {
                    failures[slot] = id + ": no result";
                } else if (result->id != id) {
                    failures[slot] = id + ": got " + result->id;
                } else if (kinds[k] == "bogusKind" && result->ok()) {
                    failures[slot] = id + ": unknown kind succeeded";
                } else if (kinds[k] == "fetchStats" && !result->payload.contains("totalChecks")) {
                    failures[slot] = id + ": wrong payload";
                } else if (kinds[k] == "runAntiCheatCheck"
                           && !result->payload.contains("banned")) {
                    failures[slot] = id + ": wrong payload";
                }
            });
        }
    }
    for (auto &thread : threads) {
        thread.join();
    }

    for (const auto &failure : failures) {
        QVERIFY2(failure.empty(), failure.c_str());
    }
}

void TaskWorkerTests::testDuplicatePendingIdRejected()
{
    m_engine->collector.closeGate();
    m_worker->submit("collect", "dup");
    QVERIFY_EXCEPTION_THROWN(m_worker->submit("collect", "dup"), std::invalid_argument);
    m_engine->collector.openGate();

    const auto result = m_worker->poll("dup", kWait);
    QVERIFY(result.has_value());
    QVERIFY(result->ok());

    // Once delivered the id may be reused.
    m_worker->submit("fetchStats", "dup");
    QVERIFY(m_worker->poll("dup", kWait).has_value());
}

void TaskWorkerTests::testPollTimeoutAndForget()
{
    QVERIFY(!m_worker->poll("never-submitted", std::chrono::milliseconds(10)).has_value());

    m_engine->collector.closeGate();
    const std::string id = m_worker->submit(TaskKind::Collect);
    QVERIFY(!m_worker->poll(id, std::chrono::milliseconds(50)).has_value());
    QTRY_VERIFY(m_worker->isWorking());
    QVERIFY(!m_worker->progress().empty());
    QCOMPARE(m_worker->slotCount(), std::size_t(1));

    m_worker->forget(id);
    QCOMPARE(m_worker->slotCount(), std::size_t(0));
    m_engine->collector.openGate();
    QTRY_VERIFY(!m_worker->isWorking());
    QVERIFY(!m_worker->poll(id, std::chrono::milliseconds(50)).has_value());

    const std::string delivered = m_worker->submit(TaskKind::FetchStats);
    QVERIFY(m_worker->poll(delivered, kWait).has_value());
    QCOMPARE(m_worker->slotCount(), std::size_t(0));
}

void TaskWorkerTests::testStopResolvesQueuedTasks()
{
    m_engine->collector.closeGate();
    const std::string running = m_worker->submit("collect");
    QTRY_COMPARE(m_engine->collector.waiting(), 1);
    const std::string queuedA = m_worker->submit("compareOnly");
    const std::string queuedB = m_worker->submit("fetchStats");

    std::thread stopper([this]() { m_worker->stop(); });
    QTRY_VERIFY(!m_worker->isRunning());
    m_engine->collector.openGate();
    stopper.join();

    const auto first = m_worker->poll(running, kWait);
    QVERIFY(first.has_value());
    QVERIFY(first->ok());

    for (const auto &id : {queuedA, queuedB}) {
        const auto result = m_worker->poll(id, kWait);
        QVERIFY(result.has_value());
        QVERIFY(!result->ok());
        QCOMPARE(QString::fromStdString(result->errorMessage),
                 QStringLiteral("worker stopped before task ran"));
    }

    const std::string late = m_worker->submit("collect");
    const auto lateResult = m_worker->poll(late, kWait);
    QVERIFY(lateResult.has_value());
    QVERIFY(!lateResult->ok());
}

QTEST_MAIN(TaskWorkerTests)
#include "test_task_worker.moc"
