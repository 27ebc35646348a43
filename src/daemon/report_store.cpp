#include "daemon/report_store.hpp"

#include <chrono>
#include <exception>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/fingerprint_engine.hpp"
#include "daemon/hwid_store.hpp"
#include "daemon/settings_store.hpp"
#include "daemon/stats_tracker.hpp"

namespace hwidwatch {

ReportStore::ReportStore(HwidStore &store, const SettingsStore &settings,
                         StatsTracker *stats)
    : m_store(store)
    , m_settings(settings)
    , m_stats(stats)
{
}

Fingerprint ReportStore::generateFingerprint(const Snapshot &snapshot) const
{
    return FingerprintEngine::computeFingerprint(snapshot);
}

bool ReportStore::save(const Snapshot &snapshot)
{
    Report report;
    report.snapshot = snapshot;
    report.fingerprint = generateFingerprint(snapshot);
    report.createdAt = std::chrono::system_clock::now();

    const bool appendHistory = m_settings.backupReports();
    const int maxReports = m_settings.maxReports();

    try {
        m_store.writeReport(report, appendHistory, maxReports);
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("ReportStore"),
                    QStringLiteral("save"),
                    QStringLiteral("report_save_failed"),
                    QStringLiteral("sqlite_error"),
                    QStringLiteral("transaction_rolled_back"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        return false;
    }

    HWLOG_INFO(QStringLiteral("ReportStore"),
               QStringLiteral("save"),
               QStringLiteral("report_saved"),
               QStringLiteral("save_request"),
               appendHistory ? QStringLiteral("current_and_history")
                             : QStringLiteral("current_only"),
               QString(),
               QString(),
               (nlohmann::json{{"fingerprint", report.fingerprint.digest},
                               {"createdAt", toIso8601Utc(report.createdAt)},
                               {"maxReports", maxReports}}));
    return true;
}

std::optional<Report> ReportStore::loadCurrent() const
{
    try {
        return m_store.currentReport();
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("ReportStore"),
                    QStringLiteral("loadCurrent"),
                    QStringLiteral("report_load_failed"),
                    QStringLiteral("sqlite_error"),
                    QStringLiteral("treat_as_absent"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        return std::nullopt;
    }
}

DriftResult ReportStore::compare(const Snapshot &newSnapshot)
{
    DriftResult result;
    result.fingerprint = generateFingerprint(newSnapshot);

    const bool trackStats = m_stats && m_settings.statsTracking();
    std::optional<Report> current;
    try {
        current = m_store.currentReport();
    } catch (const std::exception &ex) {
        result.status = DriftStatus::NoBaseline;
        result.baselineUnreadable = true;
        result.message = "Previous report could not be read";
        HWLOG_ERROR(QStringLiteral("ReportStore"),
                    QStringLiteral("compare"),
                    QStringLiteral("baseline_read_failed"),
                    QStringLiteral("sqlite_error"),
                    QStringLiteral("check_not_counted"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()},
                                    {"fingerprint", result.fingerprint.digest}}));
        return result;
    }

    if (!current.has_value()) {
        result.status = DriftStatus::NoBaseline;
        result.message = "No previous report found";
        HWLOG_INFO(QStringLiteral("ReportStore"),
                   QStringLiteral("compare"),
                   QStringLiteral("no_baseline"),
                   QStringLiteral("no_current_report"),
                   QStringLiteral("first_run"),
                   QString(),
                   QString(),
                   nlohmann::json::object());
        if (trackStats) {
            m_stats->recordCheck(result.fingerprint.digest, false);
        }
        return result;
    }

    const bool changed = current->fingerprint.digest != result.fingerprint.digest;
    if (trackStats) {
        m_stats->recordCheck(result.fingerprint.digest, changed);
    }

    if (!changed) {
        result.status = DriftStatus::Unchanged;
        result.message = "HWID matches previous report";
        HWLOG_INFO(QStringLiteral("ReportStore"),
                   QStringLiteral("compare"),
                   QStringLiteral("hwid_unchanged"),
                   QStringLiteral("fingerprint_equal"),
                   QStringLiteral("digest_compare"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"fingerprint", result.fingerprint.digest}}));
        return result;
    }

    result.status = DriftStatus::Changed;
    result.message = "HWID has changed from previous report";
    HWLOG_WARN(QStringLiteral("ReportStore"),
               QStringLiteral("compare"),
               QStringLiteral("hwid_changed"),
               QStringLiteral("fingerprint_differs"),
               QStringLiteral("digest_compare"),
               QString(),
               QString(),
               (nlohmann::json{{"previous", current->fingerprint.digest},
                               {"current", result.fingerprint.digest}}));
    return result;
}

std::vector<Report> ReportStore::history() const
{
    try {
        return m_store.listHistory();
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("ReportStore"),
                    QStringLiteral("history"),
                    QStringLiteral("history_load_failed"),
                    QStringLiteral("sqlite_error"),
                    QStringLiteral("treat_as_empty"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        return {};
    }
}

} // namespace hwidwatch
