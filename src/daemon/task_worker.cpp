#include "daemon/task_worker.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/ban_registry.hpp"
#include "daemon/hardware_collector.hpp"
#include "daemon/report_store.hpp"
#include "daemon/settings_store.hpp"
#include "daemon/stats_tracker.hpp"

namespace hwidwatch {

namespace {

TaskResult makeSuccess(const Task &task, nlohmann::json payload)
{
    TaskResult result;
    result.id = task.id;
    result.status = TaskStatus::Success;
    result.payload = std::move(payload);
    return result;
}

TaskResult makeError(const std::string &taskId, const std::string &message)
{
    TaskResult result;
    result.id = taskId;
    result.status = TaskStatus::Error;
    result.errorMessage = message;
    return result;
}

QString qstr(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

TaskWorker::TaskWorker(EngineContext &context)
    : m_context(context)
{
}

TaskWorker::~TaskWorker()
{
    stop();
}

void TaskWorker::start()
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    if (m_running) {
        return;
    }
    m_running = true;
    m_stopRequested = false;
    m_thread = std::thread([this]() { run(); });

    HWLOG_INFO(QStringLiteral("TaskWorker"),
               QStringLiteral("start"),
               QStringLiteral("worker_started"),
               QStringLiteral("daemon_start"),
               QStringLiteral("std_thread"),
               QString(),
               QString(),
               nlohmann::json::object());
}

void TaskWorker::stop()
{
    std::deque<Task> abandoned;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_running) {
            return;
        }
        m_stopRequested = true;
    }
    m_queueCv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_running = false;
        abandoned.swap(m_queue);
    }

    for (const Task &task : abandoned) {
        complete(task.id, makeError(task.id, "worker stopped before task ran"));
    }

    HWLOG_INFO(QStringLiteral("TaskWorker"),
               QStringLiteral("stop"),
               QStringLiteral("worker_stopped"),
               QStringLiteral("shutdown"),
               QStringLiteral("join"),
               QString(),
               QString(),
               (nlohmann::json{{"abandonedTasks", abandoned.size()}}));
}

bool TaskWorker::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_running && !m_stopRequested;
}

std::string TaskWorker::submit(TaskKind kind, const std::string &taskId)
{
    return submit(toTaskKindString(kind), taskId);
}

std::string TaskWorker::submit(const std::string &kind, const std::string &taskId)
{
    Task task;
    task.kind = parseTaskKindString(kind);
    task.kindName = kind;
    task.submittedAt = std::chrono::system_clock::now();

    bool accepting = true;
    {
        std::lock_guard<std::mutex> queueLock(m_queueMutex);
        if (taskId.empty()) {
            task.id = kind + "_" + std::to_string(toEpochMs(task.submittedAt)) + "_"
                + std::to_string(++m_sequence);
        } else {
            task.id = taskId;
        }

        {
            std::lock_guard<std::mutex> slotsLock(m_slotsMutex);
            if (m_slots.count(task.id) > 0) {
                throw std::invalid_argument("task id already pending: " + task.id);
            }
            Slot &slot = m_slots[task.id];
            slot.future = slot.promise.get_future().share();
        }

        accepting = !m_stopRequested;
        if (accepting) {
            m_queue.push_back(task);
        }
    }

    if (!accepting) {
        complete(task.id, makeError(task.id, "worker is not running"));
        return task.id;
    }

    m_queueCv.notify_one();

    HWLOG_DEBUG(QStringLiteral("TaskWorker"),
                QStringLiteral("submit"),
                QStringLiteral("task_submitted"),
                QStringLiteral("caller_request"),
                QStringLiteral("queue_push"),
                QString(),
                qstr(task.id),
                (nlohmann::json{{"kind", kind}}));
    return task.id;
}

std::optional<TaskResult> TaskWorker::poll(const std::string &taskId,
                                           std::chrono::milliseconds timeout)
{
    std::shared_future<TaskResult> future;
    {
        std::lock_guard<std::mutex> lock(m_slotsMutex);
        const auto it = m_slots.find(taskId);
        if (it == m_slots.end()) {
            return std::nullopt;
        }
        future = it->second.future;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }

    std::optional<TaskResult> result;
    try {
        result = future.get();
    } catch (const std::future_error &) {
        // Slot was forgotten while we waited.
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_slotsMutex);
    m_slots.erase(taskId);
    return result;
}

void TaskWorker::forget(const std::string &taskId)
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    m_slots.erase(taskId);
}

std::size_t TaskWorker::slotCount() const
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    return m_slots.size();
}

bool TaskWorker::isWorking() const
{
    return m_working.load();
}

std::string TaskWorker::progress() const
{
    std::lock_guard<std::mutex> lock(m_progressMutex);
    return m_progress;
}

void TaskWorker::setProgress(const std::string &text)
{
    std::lock_guard<std::mutex> lock(m_progressMutex);
    m_progress = text;
}

void TaskWorker::complete(const std::string &taskId, TaskResult result)
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    const auto it = m_slots.find(taskId);
    if (it == m_slots.end()) {
        return;
    }
    if (it->second.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return;
    }
    it->second.promise.set_value(std::move(result));
}

void TaskWorker::run()
{
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this]() { return m_stopRequested || !m_queue.empty(); });
            if (m_stopRequested) {
                return;
            }
            task = m_queue.front();
            m_queue.pop_front();
            m_working = true;
        }

        logging::CorrelationScope scope(qstr(task.id),
                                        nlohmann::json{{"taskId", task.id},
                                                       {"taskKind", task.kindName}});
        TaskResult result = dispatch(task);

        if (!result.ok()) {
            HWLOG_WARN(QStringLiteral("TaskWorker"),
                       QStringLiteral("run"),
                       QStringLiteral("task_failed"),
                       QStringLiteral("handler_error"),
                       QStringLiteral("error_result"),
                       QString(),
                       qstr(task.id),
                       (nlohmann::json{{"kind", task.kindName},
                                       {"error", result.errorMessage}}));
        }

        complete(task.id, std::move(result));
        setProgress(std::string());
        m_working = false;
    }
}

TaskResult TaskWorker::dispatch(const Task &task)
{
    try {
        switch (task.kind) {
        case TaskKind::Collect:
            return handleCollect(task);
        case TaskKind::CompareOnly:
            return handleCompare(task);
        case TaskKind::BanCurrent:
            return handleBanCurrent(task);
        case TaskKind::RunAntiCheatCheck:
            return handleAntiCheatCheck(task);
        case TaskKind::FetchStats:
            return handleFetchStats(task);
        case TaskKind::Unknown:
            break;
        }
        return makeError(task.id, "unknown task kind: " + task.kindName);
    } catch (const std::exception &ex) {
        return makeError(task.id, ex.what());
    } catch (...) {
        return makeError(task.id, "task handler failed with a non-standard exception");
    }
}

TaskResult TaskWorker::handleCollect(const Task &task)
{
    setProgress("Collecting HWID data...");
    const std::optional<Snapshot> snapshot = m_context.collector.collect();
    if (!snapshot.has_value()) {
        return makeError(task.id, "Failed to collect HWID data");
    }

    const Fingerprint fingerprint = m_context.reports.generateFingerprint(*snapshot);

    bool saved = false;
    if (m_context.settings.autoSaveReports()) {
        setProgress("Saving report...");
        std::lock_guard<std::mutex> lock(m_context.stateMutex);
        saved = m_context.reports.save(*snapshot);
    }

    return makeSuccess(task, nlohmann::json{
        {"snapshot", *snapshot},
        {"fingerprint", fingerprint.digest},
        {"fingerprintValid", fingerprint.valid},
        {"saved", saved}
    });
}

TaskResult TaskWorker::handleCompare(const Task &task)
{
    setProgress("Collecting current HWID...");
    const std::optional<Snapshot> snapshot = m_context.collector.collect();
    if (!snapshot.has_value()) {
        return makeError(task.id, "Failed to collect HWID data for comparison");
    }

    setProgress("Comparing with previous report...");
    std::lock_guard<std::mutex> lock(m_context.stateMutex);
    const DriftResult drift = m_context.reports.compare(*snapshot);
    if (drift.baselineUnreadable) {
        return makeError(task.id, drift.message);
    }

    nlohmann::json payload = {
        {"status", toDriftStatusString(drift.status)},
        {"message", drift.message},
        {"fingerprint", drift.fingerprint.digest},
        {"fingerprintValid", drift.fingerprint.valid}
    };

    if (drift.status == DriftStatus::NoBaseline && m_context.settings.autoSaveReports()) {
        payload["baselineSaved"] = m_context.reports.save(*snapshot);
    }

    return makeSuccess(task, std::move(payload));
}

TaskResult TaskWorker::handleBanCurrent(const Task &task)
{
    setProgress("Performing live scan to get current HWID...");
    const std::optional<Snapshot> snapshot = m_context.collector.collect();
    if (!snapshot.has_value()) {
        return makeError(task.id, "Failed to collect current HWID data");
    }

    std::lock_guard<std::mutex> lock(m_context.stateMutex);

    setProgress("Saving HWID report...");
    if (!m_context.reports.save(*snapshot)) {
        return makeError(task.id, "Failed to save HWID report");
    }

    setProgress("Adding HWID to ban list...");
    const Fingerprint fingerprint = m_context.reports.generateFingerprint(*snapshot);
    if (!fingerprint.valid) {
        return makeError(task.id,
                         "Current hardware exposes no identifying fields; refusing to ban");
    }

    const BanOutcome outcome = m_context.bans.ban(fingerprint.digest);
    if (!outcome.first) {
        return makeError(task.id, outcome.second);
    }

    return makeSuccess(task, nlohmann::json{
        {"message", "Current HWID has been banned (Hash: "
                        + BanRegistry::shortHash(fingerprint.digest) + ")"},
        {"fingerprint", fingerprint.digest}
    });
}

TaskResult TaskWorker::handleAntiCheatCheck(const Task &task)
{
    setProgress("Initializing anti-cheat system...");
    const bool simulatorEnabled = m_context.settings.banSimulatorEnabled();

    setProgress("Scanning hardware fingerprint...");
    const std::optional<Snapshot> snapshot = m_context.collector.collect();
    if (!snapshot.has_value()) {
        return makeError(task.id, "Failed to collect HWID data for anti-cheat scan");
    }

    setProgress("Generating hardware fingerprint...");
    const Fingerprint fingerprint = m_context.reports.generateFingerprint(*snapshot);

    setProgress("Checking against ban database...");
    bool banned = false;
    std::string message;
    if (!simulatorEnabled) {
        message = "Ban simulator is disabled";
    } else {
        banned = m_context.bans.isBanned(fingerprint.digest);
        message = "HWID " + BanRegistry::shortHash(fingerprint.digest)
            + (banned ? " is BANNED" : " is clean");
    }

    setProgress("Finalizing anti-cheat verification...");
    HWLOG_INFO(QStringLiteral("TaskWorker"),
               QStringLiteral("handleAntiCheatCheck"),
               banned ? QStringLiteral("anticheat_denied") : QStringLiteral("anticheat_passed"),
               QStringLiteral("anticheat_request"),
               QStringLiteral("fresh_scan"),
               QString(),
               qstr(task.id),
               (nlohmann::json{{"fingerprint", fingerprint.digest},
                               {"simulatorEnabled", simulatorEnabled}}));

    return makeSuccess(task, nlohmann::json{
        {"banned", banned},
        {"fingerprint", fingerprint.digest},
        {"fingerprintValid", fingerprint.valid},
        {"scanType", "fresh_scan"},
        {"simulatorEnabled", simulatorEnabled},
        {"message", message}
    });
}

TaskResult TaskWorker::handleFetchStats(const Task &task)
{
    setProgress("Loading HWID statistics...");
    return makeSuccess(task, m_context.stats.toJson());
}

} // namespace hwidwatch
