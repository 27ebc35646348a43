#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hwidwatch {

class HwidStore;

// StatsTracker accumulates check/change counters from drift comparisons.
// Counters never decrease. When constructed with a store, the stats document
// is loaded from and written back to the store's meta table on every record.
class StatsTracker {
public:
    static constexpr std::size_t kMaxChangeEvents = 1000;
    static constexpr std::size_t kMaxTrackedFingerprints = 500;
    static constexpr int kDailyRetentionDays = 400;

    explicit StatsTracker(HwidStore *store = nullptr);

    void recordCheck(const std::string &fingerprint, bool changed);
    void recordCheck(const std::string &fingerprint, bool changed,
                     std::chrono::system_clock::time_point now);

    Stats stats() const;

    // Average changes per calendar month between the first and last check.
    double changeFrequency() const;
    std::map<std::string, MonthSummary> monthlySummary() const;

    // Full stats document plus changeFrequency and monthlySummary.
    nlohmann::json toJson() const;

    static std::string dayKey(std::chrono::system_clock::time_point t);
    static std::string monthKey(std::chrono::system_clock::time_point t);

private:
    void load();
    void persistLocked() const;
    void applyRetentionLocked(std::chrono::system_clock::time_point now);
    double changeFrequencyLocked() const;
    std::map<std::string, MonthSummary> monthlySummaryLocked() const;

    HwidStore *m_store;
    mutable std::mutex m_mutex;
    Stats m_stats;
};

} // namespace hwidwatch
