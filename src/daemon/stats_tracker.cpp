#include "daemon/stats_tracker.hpp"

#include <algorithm>
#include <ctime>
#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/hwid_store.hpp"

namespace hwidwatch {

namespace {

constexpr const char *kStatsMetaKey = "hwid_stats";

std::tm toUtcTm(std::chrono::system_clock::time_point t)
{
    const std::time_t time = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&time, &tm);
    return tm;
}

std::string formatUtc(std::chrono::system_clock::time_point t, const char *format)
{
    const std::tm tm = toUtcTm(t);
    char buffer[32] = {};
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

int monthsBetween(std::chrono::system_clock::time_point from,
                  std::chrono::system_clock::time_point to)
{
    const std::tm a = toUtcTm(from);
    const std::tm b = toUtcTm(to);
    return (b.tm_year - a.tm_year) * 12 + (b.tm_mon - a.tm_mon);
}

} // namespace

StatsTracker::StatsTracker(HwidStore *store)
    : m_store(store)
{
    load();
}

std::string StatsTracker::dayKey(std::chrono::system_clock::time_point t)
{
    return formatUtc(t, "%Y-%m-%d");
}

std::string StatsTracker::monthKey(std::chrono::system_clock::time_point t)
{
    return formatUtc(t, "%Y-%m");
}

void StatsTracker::load()
{
    if (!m_store) {
        return;
    }

    try {
        const auto raw = m_store->getMeta(kStatsMetaKey);
        if (!raw.has_value()) {
            return;
        }
        const Stats loaded = nlohmann::json::parse(*raw).get<Stats>();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats = loaded;
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("StatsTracker"),
                    QStringLiteral("load"),
                    QStringLiteral("stats_load_failed"),
                    QStringLiteral("corrupt_or_unreadable"),
                    QStringLiteral("start_empty"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
}

void StatsTracker::persistLocked() const
{
    if (!m_store) {
        return;
    }

    try {
        m_store->setMeta(kStatsMetaKey, nlohmann::json(m_stats).dump());
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("StatsTracker"),
                    QStringLiteral("persist"),
                    QStringLiteral("stats_save_failed"),
                    QStringLiteral("sqlite_error"),
                    QStringLiteral("keep_in_memory"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
}

void StatsTracker::recordCheck(const std::string &fingerprint, bool changed)
{
    recordCheck(fingerprint, changed, std::chrono::system_clock::now());
}

void StatsTracker::recordCheck(const std::string &fingerprint, bool changed,
                               std::chrono::system_clock::time_point now)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_stats.totalChecks++;
    m_stats.lastCheck = now;
    if (!m_stats.firstCheck.has_value()) {
        m_stats.firstCheck = now;
    }

    m_stats.dailyChecks[dayKey(now)]++;

    MonthBucket &month = m_stats.monthlyStats[monthKey(now)];
    month.checks++;
    month.uniqueFingerprints.insert(fingerprint);

    auto seen = std::find(m_stats.fingerprints.begin(), m_stats.fingerprints.end(),
                          fingerprint);
    if (seen != m_stats.fingerprints.end()) {
        m_stats.fingerprints.erase(seen);
    }
    m_stats.fingerprints.push_back(fingerprint);

    if (changed) {
        m_stats.totalChanges++;
        m_stats.lastChange = now;
        month.changes++;

        ChangeEvent event;
        event.timestamp = now;
        event.fingerprint = fingerprint;
        event.checkNumber = m_stats.totalChecks;
        m_stats.changeHistory.push_back(event);

        HWLOG_WARN(QStringLiteral("StatsTracker"),
                   QStringLiteral("recordCheck"),
                   QStringLiteral("hwid_change_recorded"),
                   QStringLiteral("fingerprint_differs"),
                   QStringLiteral("compare"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"totalChanges", m_stats.totalChanges},
                                   {"checkNumber", event.checkNumber}}));
    }

    applyRetentionLocked(now);
    persistLocked();
}

void StatsTracker::applyRetentionLocked(std::chrono::system_clock::time_point now)
{
    if (m_stats.changeHistory.size() > kMaxChangeEvents) {
        const auto excess = m_stats.changeHistory.size() - kMaxChangeEvents;
        m_stats.changeHistory.erase(m_stats.changeHistory.begin(),
                                    m_stats.changeHistory.begin() + excess);
    }

    if (m_stats.fingerprints.size() > kMaxTrackedFingerprints) {
        const auto excess = m_stats.fingerprints.size() - kMaxTrackedFingerprints;
        m_stats.fingerprints.erase(m_stats.fingerprints.begin(),
                                   m_stats.fingerprints.begin() + excess);
    }

    // Keys are YYYY-MM-DD, so lexical order is chronological.
    const std::string cutoff = dayKey(now - std::chrono::hours(24 * kDailyRetentionDays));
    auto it = m_stats.dailyChecks.begin();
    while (it != m_stats.dailyChecks.end() && it->first < cutoff) {
        it = m_stats.dailyChecks.erase(it);
    }
}

Stats StatsTracker::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

double StatsTracker::changeFrequencyLocked() const
{
    if (!m_stats.firstCheck.has_value() || !m_stats.lastCheck.has_value()
        || m_stats.totalChanges == 0) {
        return 0.0;
    }

    const int months = std::max(1, monthsBetween(*m_stats.firstCheck, *m_stats.lastCheck));
    return roundTo2(static_cast<double>(m_stats.totalChanges) / months);
}

double StatsTracker::changeFrequency() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return changeFrequencyLocked();
}

std::map<std::string, MonthSummary> StatsTracker::monthlySummaryLocked() const
{
    std::map<std::string, MonthSummary> summary;
    for (const auto &[month, bucket] : m_stats.monthlyStats) {
        MonthSummary entry;
        entry.checks = bucket.checks;
        entry.changes = bucket.changes;
        entry.uniqueFingerprints = static_cast<long long>(bucket.uniqueFingerprints.size());
        entry.changeRate = bucket.checks > 0
            ? roundTo2(static_cast<double>(bucket.changes) / bucket.checks * 100.0)
            : 0.0;
        summary[month] = entry;
    }
    return summary;
}

std::map<std::string, MonthSummary> StatsTracker::monthlySummary() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return monthlySummaryLocked();
}

nlohmann::json StatsTracker::toJson() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json payload = m_stats;
    payload["changeFrequency"] = changeFrequencyLocked();
    payload["monthlySummary"] = monthlySummaryLocked();
    return payload;
}

} // namespace hwidwatch
