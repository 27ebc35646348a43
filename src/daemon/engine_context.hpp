#pragma once

#include <mutex>

namespace hwidwatch {

class BanRegistry;
class HardwareCollector;
class ReportStore;
class SettingsStore;
class StatsTracker;

// Shared state the task worker and the monitoring scheduler operate on.
// stateMutex serializes every read-compare-write against the report store
// and every multi-component sequence (scan, save, ban).
struct EngineContext {
    SettingsStore &settings;
    ReportStore &reports;
    StatsTracker &stats;
    BanRegistry &bans;
    HardwareCollector &collector;
    std::mutex &stateMutex;
};

} // namespace hwidwatch
