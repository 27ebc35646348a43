#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

#include "common/models.hpp"
#include "daemon/engine_context.hpp"

namespace hwidwatch {

/**
 * MonitoringScheduler periodically runs collect -> compare -> save on its own
 * thread. It sleeps in ticks so stop() returns within one tick, and re-reads
 * monitoringIntervalSeconds (floor 60) from the settings every cycle.
 */
class MonitoringScheduler {
public:
    explicit MonitoringScheduler(EngineContext &context,
                                 std::chrono::milliseconds tick = std::chrono::seconds(1));
    ~MonitoringScheduler();

    MonitoringScheduler(const MonitoringScheduler &) = delete;
    MonitoringScheduler &operator=(const MonitoringScheduler &) = delete;

    void start();
    void stop();
    bool isActive() const;

    // One synchronous pass. Returns the drift status, or std::nullopt when
    // collection failed, the current report was unreadable or the pass threw.
    std::optional<DriftStatus> runPass();

    MonitoringStatus status() const;

private:
    void run();
    // Returns false when stop was requested before the interval elapsed.
    bool waitInterval();

    EngineContext &m_context;
    const std::chrono::milliseconds m_tick;

    std::atomic<bool> m_active{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeCv;
    std::thread m_thread;

    mutable std::mutex m_statusMutex;
    std::optional<std::chrono::system_clock::time_point> m_lastCheck;
};

} // namespace hwidwatch
