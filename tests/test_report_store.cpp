#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <memory>

#include <sqlite3.h>

#include "daemon/fingerprint_engine.hpp"
#include "daemon/hwid_store.hpp"
#include "daemon/report_store.hpp"
#include "daemon/settings_store.hpp"
#include "daemon/stats_tracker.hpp"
#include "fake_collector.hpp"

using hwidwatch::DriftStatus;
using hwidwatch::ReportStore;
using hwidwatch::testing::makeSnapshot;

class ReportStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testCompareSequence();
    void testHistoryBoundedByMaxReports();
    void testBackupDisabledSkipsHistory();
    void testStatsTrackingToggle();
    void testSaveFailureLeavesCurrentIntact();
    void testUnreadableBaselineIsNotFirstRun();

private:
    QTemporaryDir m_tempDir;
    std::unique_ptr<hwidwatch::HwidStore> m_store;
    std::unique_ptr<hwidwatch::SettingsStore> m_settings;
    std::unique_ptr<hwidwatch::StatsTracker> m_stats;
    std::unique_ptr<ReportStore> m_reports;

    std::filesystem::path dbPath() const;
};

void ReportStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

std::filesystem::path ReportStoreTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / "reports.db";
}

void ReportStoreTests::init()
{
    const auto base = std::filesystem::path(m_tempDir.path().toStdString());
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(base / "settings.json", error);

    m_store = std::make_unique<hwidwatch::HwidStore>(dbPath());
    m_settings = std::make_unique<hwidwatch::SettingsStore>(base / "settings.json");
    m_stats = std::make_unique<hwidwatch::StatsTracker>(m_store.get());
    m_reports = std::make_unique<ReportStore>(*m_store, *m_settings, m_stats.get());
}

void ReportStoreTests::cleanup()
{
    m_reports.reset();
    m_stats.reset();
    m_settings.reset();
    m_store.reset();
}

void ReportStoreTests::testCompareSequence()
{
    QVERIFY(!m_reports->loadCurrent().has_value());

    const auto first = m_reports->compare(makeSnapshot("X1"));
    QCOMPARE(first.status, DriftStatus::NoBaseline);
    QCOMPARE(QString::fromStdString(first.message), QStringLiteral("No previous report found"));

    QVERIFY(m_reports->save(makeSnapshot("X1")));

    const auto same = m_reports->compare(makeSnapshot("X1"));
    QCOMPARE(same.status, DriftStatus::Unchanged);
    QCOMPARE(QString::fromStdString(same.message), QStringLiteral("HWID matches previous report"));
    QCOMPARE(same.fingerprint.digest, m_reports->loadCurrent()->fingerprint.digest);

    const auto changed = m_reports->compare(makeSnapshot("X2"));
    QCOMPARE(changed.status, DriftStatus::Changed);
    QCOMPARE(QString::fromStdString(changed.message),
             QStringLiteral("HWID has changed from previous report"));
    QVERIFY(changed.fingerprint.digest != same.fingerprint.digest);

    // compare() never replaces the current report.
    QCOMPARE(m_reports->loadCurrent()->fingerprint.digest, same.fingerprint.digest);

    const auto stats = m_stats->stats();
    QCOMPARE(stats.totalChecks, 3LL);
    QCOMPARE(stats.totalChanges, 1LL);
}

void ReportStoreTests::testHistoryBoundedByMaxReports()
{
    QVERIFY(m_settings->set("maxReports", 3));
    for (int i = 0; i < 5; ++i) {
        QVERIFY(m_reports->save(makeSnapshot("D" + std::to_string(i))));
    }

    const auto history = m_reports->history();
    QCOMPARE(history.size(), std::size_t(3));
    const auto expectedNewest =
        hwidwatch::FingerprintEngine::computeFingerprint(makeSnapshot("D4"));
    const auto expectedOldest =
        hwidwatch::FingerprintEngine::computeFingerprint(makeSnapshot("D2"));
    QCOMPARE(history.front().fingerprint.digest, expectedNewest.digest);
    QCOMPARE(history.back().fingerprint.digest, expectedOldest.digest);
    QCOMPARE(m_reports->loadCurrent()->fingerprint.digest, expectedNewest.digest);
}

void ReportStoreTests::testBackupDisabledSkipsHistory()
{
    QVERIFY(m_settings->set("backupReports", false));
    QVERIFY(m_reports->save(makeSnapshot("X1")));
    QVERIFY(m_reports->save(makeSnapshot("X2")));

    QVERIFY(m_reports->history().empty());
    QCOMPARE(m_reports->loadCurrent()->fingerprint.digest,
             hwidwatch::FingerprintEngine::computeFingerprint(makeSnapshot("X2")).digest);
}

void ReportStoreTests::testStatsTrackingToggle()
{
    QVERIFY(m_settings->set("statsTracking", false));
    m_reports->compare(makeSnapshot("X1"));
    QCOMPARE(m_stats->stats().totalChecks, 0LL);

    QVERIFY(m_settings->set("statsTracking", true));
    m_reports->compare(makeSnapshot("X1"));
    QCOMPARE(m_stats->stats().totalChecks, 1LL);
}

void ReportStoreTests::testSaveFailureLeavesCurrentIntact()
{
    QVERIFY(m_reports->save(makeSnapshot("X1")));
    const auto before = m_reports->loadCurrent();
    QVERIFY(before.has_value());

    sqlite3 *locker = nullptr;
    QCOMPARE(sqlite3_open(dbPath().string().c_str(), &locker), SQLITE_OK);
    QCOMPARE(sqlite3_exec(locker, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    const bool saved = m_reports->save(makeSnapshot("X2"));

    sqlite3_exec(locker, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(locker);

    QVERIFY(!saved);
    const auto after = m_reports->loadCurrent();
    QVERIFY(after.has_value());
    QCOMPARE(after->fingerprint.digest, before->fingerprint.digest);
    QCOMPARE(m_reports->history().size(), std::size_t(1));
}

void ReportStoreTests::testUnreadableBaselineIsNotFirstRun()
{
    QVERIFY(m_reports->save(makeSnapshot("X1")));
    m_reports->compare(makeSnapshot("X1"));
    QCOMPARE(m_stats->stats().totalChecks, 1LL);

    sqlite3 *locker = nullptr;
    QCOMPARE(sqlite3_open(dbPath().string().c_str(), &locker), SQLITE_OK);
    QCOMPARE(sqlite3_exec(locker, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    const auto blocked = m_reports->compare(makeSnapshot("X2"));

    sqlite3_exec(locker, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(locker);

    QCOMPARE(blocked.status, DriftStatus::NoBaseline);
    QVERIFY(blocked.baselineUnreadable);
    QCOMPARE(QString::fromStdString(blocked.message),
             QStringLiteral("Previous report could not be read"));

    // The failed read is not counted as a check.
    QCOMPARE(m_stats->stats().totalChecks, 1LL);

    const auto unlocked = m_reports->compare(makeSnapshot("X2"));
    QVERIFY(!unlocked.baselineUnreadable);
    QCOMPARE(unlocked.status, DriftStatus::Changed);
    QCOMPARE(m_stats->stats().totalChecks, 2LL);
}

QTEST_MAIN(ReportStoreTests)
#include "test_report_store.moc"
