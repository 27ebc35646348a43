#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/ban_registry.hpp"
#include "daemon/engine_context.hpp"
#include "daemon/hardware_collector.hpp"
#include "daemon/hwid_store.hpp"
#include "daemon/monitoring_scheduler.hpp"
#include "daemon/report_store.hpp"
#include "daemon/settings_store.hpp"
#include "daemon/stats_tracker.hpp"
#include "daemon/task_worker.hpp"

namespace hwidwatch {

/**
 * HwidDaemon coordinates:
 * - the settings, report, stats and ban state under the data directory
 * - the task worker that runs fingerprint-affecting operations
 * - the background monitoring scheduler
 *
 * It owns the state mutex both background contexts serialize on. It is
 * designed to be owned from main() or a test; destruction stops both threads.
 */
class HwidDaemon
{
public:
    // A null collector selects LinuxHardwareCollector.
    explicit HwidDaemon(std::unique_ptr<HardwareCollector> collector = nullptr,
                        std::chrono::milliseconds monitoringTick = std::chrono::seconds(1));
    ~HwidDaemon();

    HwidDaemon(const HwidDaemon &) = delete;
    HwidDaemon &operator=(const HwidDaemon &) = delete;

    // Session start: starts the worker, queues a startup comparison when
    // compareOnStartup is set and starts monitoring when backgroundMonitoring
    // is set.
    void start();
    // Starts the worker only; one-shot callers use this so the startup
    // settings are not applied per command.
    void startWorker();
    void stop();

    std::string submit(const std::string &kind, const std::string &taskId = std::string());
    std::optional<TaskResult> poll(const std::string &taskId,
                                   std::chrono::milliseconds timeout);
    void forget(const std::string &taskId);
    std::string progress() const;

    bool isBanned(const std::string &fingerprint) const;
    BanOutcome ban(const std::string &fingerprint);
    BanOutcome unban(const std::string &fingerprint);
    std::size_t clearAllBans();
    std::vector<std::string> bannedFingerprints() const;

    MonitoringStatus monitoringStatus() const;
    void startMonitoring();
    void stopMonitoring();

    std::optional<Report> currentReport() const;
    bool saveSnapshot(const Snapshot &snapshot);
    std::vector<Report> history() const;

    SettingsStore &settings();
    StatsTracker &stats();

private:
    SettingsStore m_settings;
    HwidStore m_store;
    StatsTracker m_stats;
    BanRegistry m_bans;
    ReportStore m_reports;
    std::unique_ptr<HardwareCollector> m_collector;
    mutable std::mutex m_stateMutex;
    EngineContext m_context;
    TaskWorker m_worker;
    MonitoringScheduler m_scheduler;
};

} // namespace hwidwatch
