#include "daemon/hwid_daemon.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace hwidwatch {

namespace {

std::unique_ptr<HardwareCollector> orDefaultCollector(std::unique_ptr<HardwareCollector> collector)
{
    if (collector) {
        return collector;
    }
    return std::make_unique<LinuxHardwareCollector>();
}

} // namespace

HwidDaemon::HwidDaemon(std::unique_ptr<HardwareCollector> collector,
                       std::chrono::milliseconds monitoringTick)
    : m_stats(&m_store)
    , m_bans(&m_settings)
    , m_reports(m_store, m_settings, &m_stats)
    , m_collector(orDefaultCollector(std::move(collector)))
    , m_context{m_settings, m_reports, m_stats, m_bans, *m_collector, m_stateMutex}
    , m_worker(m_context)
    , m_scheduler(m_context, monitoringTick)
{
    std::string integrityMessage;
    if (!m_store.integrityCheck(&integrityMessage)) {
        HWLOG_WARN(QStringLiteral("HwidDaemon"),
                   QStringLiteral("HwidDaemon"),
                   QStringLiteral("integrity_check_failed"),
                   QStringLiteral("sqlite_integrity"),
                   QStringLiteral("continue_degraded"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"message", integrityMessage}}));
    }
}

HwidDaemon::~HwidDaemon()
{
    stop();
}

void HwidDaemon::start()
{
    HWLOG_INFO(QStringLiteral("HwidDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_start"),
               QStringLiteral("caller_start"),
               QStringLiteral("settings"),
               logging::defaultWho(),
               QString(),
               m_settings.all());

    startWorker();

    if (m_settings.compareOnStartup()) {
        // Nobody waits on the startup comparison; its outcome is logged.
        m_worker.forget(m_worker.submit(TaskKind::CompareOnly));
    }

    if (m_settings.backgroundMonitoring()) {
        m_scheduler.start();
    }
}

void HwidDaemon::startWorker()
{
    m_worker.start();
}

void HwidDaemon::stop()
{
    m_scheduler.stop();
    m_worker.stop();
}

std::string HwidDaemon::submit(const std::string &kind, const std::string &taskId)
{
    return m_worker.submit(kind, taskId);
}

std::optional<TaskResult> HwidDaemon::poll(const std::string &taskId,
                                           std::chrono::milliseconds timeout)
{
    return m_worker.poll(taskId, timeout);
}

void HwidDaemon::forget(const std::string &taskId)
{
    m_worker.forget(taskId);
}

std::string HwidDaemon::progress() const
{
    return m_worker.progress();
}

bool HwidDaemon::isBanned(const std::string &fingerprint) const
{
    return m_bans.isBanned(fingerprint);
}

BanOutcome HwidDaemon::ban(const std::string &fingerprint)
{
    return m_bans.ban(fingerprint);
}

BanOutcome HwidDaemon::unban(const std::string &fingerprint)
{
    return m_bans.unban(fingerprint);
}

std::size_t HwidDaemon::clearAllBans()
{
    return m_bans.clearAll();
}

std::vector<std::string> HwidDaemon::bannedFingerprints() const
{
    return m_bans.list();
}

MonitoringStatus HwidDaemon::monitoringStatus() const
{
    return m_scheduler.status();
}

void HwidDaemon::startMonitoring()
{
    m_scheduler.start();
}

void HwidDaemon::stopMonitoring()
{
    m_scheduler.stop();
}

std::optional<Report> HwidDaemon::currentReport() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_reports.loadCurrent();
}

bool HwidDaemon::saveSnapshot(const Snapshot &snapshot)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_reports.save(snapshot);
}

std::vector<Report> HwidDaemon::history() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_reports.history();
}

SettingsStore &HwidDaemon::settings()
{
    return m_settings;
}

StatsTracker &HwidDaemon::stats()
{
    return m_stats;
}

} // namespace hwidwatch
