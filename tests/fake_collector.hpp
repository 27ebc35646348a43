#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "common/models.hpp"
#include "daemon/fingerprint_engine.hpp"
#include "daemon/hardware_collector.hpp"

namespace hwidwatch::testing {

inline Snapshot makeSnapshot(const std::string &diskSerial,
                             const std::string &biosSerial = "B1")
{
    Snapshot snapshot;
    snapshot.collectedAt = std::chrono::system_clock::now();

    ComponentRecord disk;
    disk.instances.push_back({{field::kName, "sda"},
                              {field::kModel, "TestDisk"},
                              {field::kSerialNumber, diskSerial}});
    snapshot.components[component::kDisk] = disk;

    ComponentRecord bios;
    bios.instances.push_back({{field::kSerialNumber, biosSerial},
                              {field::kVendor, "TestVendor"}});
    snapshot.components[component::kBios] = bios;
    return snapshot;
}

// Replays scripted snapshots in order and keeps returning the last one.
// Failure modes make collect() return nothing or throw. A closed gate holds
// collect() until openGate().
class FakeCollector : public HardwareCollector
{
public:
    enum class Mode {
        Normal,
        ReturnNothing,
        Throw
    };

    void push(const Snapshot &snapshot)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.push_back(snapshot);
    }

    // Drops the remaining script; collect() returns snapshot from now on.
    void replace(const Snapshot &snapshot)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.clear();
        m_script.push_back(snapshot);
    }

    void setMode(Mode mode)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_mode = mode;
    }

    void closeGate()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_gateClosed = true;
    }

    void openGate()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_gateClosed = false;
        }
        m_gateCv.notify_all();
    }

    int waiting() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_waiting;
    }

    int calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    std::optional<Snapshot> collect() override
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++m_calls;
        ++m_waiting;
        m_gateCv.wait(lock, [this]() { return !m_gateClosed; });
        --m_waiting;
        if (m_mode == Mode::Throw) {
            throw std::runtime_error("simulated collector fault");
        }
        if (m_mode == Mode::ReturnNothing || m_script.empty()) {
            return std::nullopt;
        }
        Snapshot next = m_script.front();
        if (m_script.size() > 1) {
            m_script.pop_front();
        }
        next.collectedAt = std::chrono::system_clock::now();
        return next;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_gateCv;
    bool m_gateClosed = false;
    int m_waiting = 0;
    std::deque<Snapshot> m_script;
    Mode m_mode = Mode::Normal;
    int m_calls = 0;
};

} // namespace hwidwatch::testing
