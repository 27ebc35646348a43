#include "daemon/monitoring_scheduler.hpp"

#include <algorithm>
#include <exception>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/hardware_collector.hpp"
#include "daemon/report_store.hpp"
#include "daemon/settings_store.hpp"

namespace hwidwatch {

MonitoringScheduler::MonitoringScheduler(EngineContext &context,
                                         std::chrono::milliseconds tick)
    : m_context(context)
    , m_tick(std::max(tick, std::chrono::milliseconds(1)))
{
}

MonitoringScheduler::~MonitoringScheduler()
{
    stop();
}

void MonitoringScheduler::start()
{
    if (m_active.exchange(true)) {
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_thread = std::thread([this]() { run(); });

    HWLOG_INFO(QStringLiteral("MonitoringScheduler"),
               QStringLiteral("start"),
               QStringLiteral("monitoring_started"),
               QStringLiteral("monitoring_enabled"),
               QStringLiteral("std_thread"),
               QString(),
               QString(),
               (nlohmann::json{{"intervalSeconds",
                                m_context.settings.monitoringIntervalSeconds()}}));
}

void MonitoringScheduler::stop()
{
    const bool wasActive = m_active.exchange(false);
    m_wakeCv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (!wasActive) {
        return;
    }

    HWLOG_INFO(QStringLiteral("MonitoringScheduler"),
               QStringLiteral("stop"),
               QStringLiteral("monitoring_stopped"),
               QStringLiteral("monitoring_disabled"),
               QStringLiteral("join"),
               QString(),
               QString(),
               nlohmann::json::object());
}

bool MonitoringScheduler::isActive() const
{
    return m_active.load();
}

MonitoringStatus MonitoringScheduler::status() const
{
    MonitoringStatus status;
    status.active = m_active.load();
    std::lock_guard<std::mutex> lock(m_statusMutex);
    status.lastCheck = m_lastCheck;
    return status;
}

bool MonitoringScheduler::waitInterval()
{
    const int seconds = std::max(m_context.settings.monitoringIntervalSeconds(),
                                 SettingsStore::kMinMonitoringIntervalSeconds);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);

    std::unique_lock<std::mutex> lock(m_wakeMutex);
    while (m_active.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        m_wakeCv.wait_for(lock, std::min(m_tick, remaining));
    }
    return false;
}

void MonitoringScheduler::run()
{
    while (m_active.load()) {
        if (!waitInterval()) {
            break;
        }
        runPass();
    }
}

std::optional<DriftStatus> MonitoringScheduler::runPass()
{
    const auto startedAt = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_lastCheck = startedAt;
    }

    logging::CorrelationScope scope(
        QStringLiteral("monitor_%1").arg(static_cast<qlonglong>(toEpochMs(startedAt))),
        nlohmann::json{{"trigger", "monitoring_interval"},
                       {"intervalSeconds", m_context.settings.monitoringIntervalSeconds()}});

    try {
        const std::optional<Snapshot> snapshot = m_context.collector.collect();
        if (!snapshot.has_value()) {
            HWLOG_WARN(QStringLiteral("MonitoringScheduler"),
                       QStringLiteral("runPass"),
                       QStringLiteral("scheduled_check_skipped"),
                       QStringLiteral("collection_failed"),
                       QStringLiteral("retry_next_interval"),
                       QString(),
                       logging::currentCorrelationId(),
                       nlohmann::json::object());
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(m_context.stateMutex);
        const DriftResult drift = m_context.reports.compare(*snapshot);
        if (drift.baselineUnreadable) {
            HWLOG_WARN(QStringLiteral("MonitoringScheduler"),
                       QStringLiteral("runPass"),
                       QStringLiteral("scheduled_check_skipped"),
                       QStringLiteral("baseline_unreadable"),
                       QStringLiteral("keep_baseline_retry_next_interval"),
                       QString(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"fingerprint", drift.fingerprint.digest}}));
            return std::nullopt;
        }
        bool saved = false;
        if (drift.status != DriftStatus::Unchanged) {
            saved = m_context.reports.save(*snapshot);
        }

        HWLOG_INFO(QStringLiteral("MonitoringScheduler"),
                   QStringLiteral("runPass"),
                   QStringLiteral("scheduled_check_done"),
                   QStringLiteral("interval_elapsed"),
                   QStringLiteral("collect_compare_save"),
                   QString(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"status", toDriftStatusString(drift.status)},
                                   {"fingerprint", drift.fingerprint.digest},
                                   {"saved", saved}}));
        return drift.status;
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("MonitoringScheduler"),
                    QStringLiteral("runPass"),
                    QStringLiteral("scheduled_check_failed"),
                    QStringLiteral("exception"),
                    QStringLiteral("retry_next_interval"),
                    QString(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"error", ex.what()}}));
        return std::nullopt;
    }
}

} // namespace hwidwatch
