#pragma once

#include <optional>
#include <vector>

#include "common/models.hpp"

namespace hwidwatch {

class HwidStore;
class SettingsStore;
class StatsTracker;

/**
 * ReportStore owns the "current report" and the bounded report history and
 * answers drift queries against the current report.
 *
 * It performs no locking of its own beyond what HwidStore does per call:
 * read-compare-write sequences must be serialized by the caller (the task
 * worker and the monitoring scheduler share one state mutex for this).
 */
class ReportStore {
public:
    ReportStore(HwidStore &store, const SettingsStore &settings,
                StatsTracker *stats = nullptr);

    // Overwrites the current report; appends to and trims the history when
    // backupReports is enabled. Returns false on any persistence failure, in
    // which case nothing was written.
    bool save(const Snapshot &snapshot);

    std::optional<Report> loadCurrent() const;

    // Compares against the current report and records the outcome in the
    // stats tracker when statsTracking is enabled. A current report that
    // cannot be read yields NoBaseline with baselineUnreadable set and is not
    // counted as a check.
    DriftResult compare(const Snapshot &newSnapshot);

    Fingerprint generateFingerprint(const Snapshot &snapshot) const;

    // Newest first; empty on read failure.
    std::vector<Report> history() const;

private:
    HwidStore &m_store;
    const SettingsStore &m_settings;
    StatsTracker *m_stats;
};

} // namespace hwidwatch
