#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "common/models.hpp"
#include "daemon/engine_context.hpp"

namespace hwidwatch {

/**
 * TaskWorker runs every fingerprint-affecting operation on one background
 * thread, in submission order, one at a time.
 *
 * Each submitted id owns a single-assignment completion slot; poll() blocks
 * on that slot only, so waiters never see each other's results. Every
 * submitted task resolves exactly once: handler faults and unknown kinds
 * become error results, and tasks still queued at stop() are resolved with
 * an error.
 */
class TaskWorker {
public:
    explicit TaskWorker(EngineContext &context);
    ~TaskWorker();

    TaskWorker(const TaskWorker &) = delete;
    TaskWorker &operator=(const TaskWorker &) = delete;

    void start();
    void stop();
    bool isRunning() const;

    // Non-blocking. An empty taskId generates "<kind>_<epochMs>_<seq>".
    // Throws std::invalid_argument when taskId is still pending.
    std::string submit(const std::string &kind, const std::string &taskId = std::string());
    std::string submit(TaskKind kind, const std::string &taskId = std::string());

    // Waits up to timeout for the result of taskId. Returns std::nullopt on
    // timeout (the slot stays claimable) or for ids that are not pending.
    std::optional<TaskResult> poll(const std::string &taskId,
                                   std::chrono::milliseconds timeout);

    // Drops a pending slot; the task still runs but its result is discarded.
    // Slots are released only by poll() delivering a result or by forget().
    void forget(const std::string &taskId);
    std::size_t slotCount() const;

    bool isWorking() const;
    std::string progress() const;

private:
    struct Slot {
        std::promise<TaskResult> promise;
        std::shared_future<TaskResult> future;
    };

    void run();
    TaskResult dispatch(const Task &task);
    void complete(const std::string &taskId, TaskResult result);
    void setProgress(const std::string &text);

    TaskResult handleCollect(const Task &task);
    TaskResult handleCompare(const Task &task);
    TaskResult handleBanCurrent(const Task &task);
    TaskResult handleAntiCheatCheck(const Task &task);
    TaskResult handleFetchStats(const Task &task);

    EngineContext &m_context;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<Task> m_queue;
    bool m_running = false;
    bool m_stopRequested = false;
    unsigned long long m_sequence = 0;
    std::thread m_thread;

    mutable std::mutex m_slotsMutex;
    std::map<std::string, Slot> m_slots;

    mutable std::mutex m_progressMutex;
    std::string m_progress;
    std::atomic<bool> m_working{false};
};

} // namespace hwidwatch
