#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hwidwatch {

/**
 * SettingsStore is the key/value configuration backing the daemon:
 * - loaded from settings.json, missing keys merged from defaults()
 * - out-of-range numbers clamped on load
 * - every set() writes the whole document back to disk
 *
 * All accessors are safe to call from any thread.
 */
class SettingsStore {
public:
    static constexpr int kMinMonitoringIntervalSeconds = 60;

    explicit SettingsStore(std::filesystem::path path);
    SettingsStore();

    static nlohmann::json defaults();

    bool autoSaveReports() const;
    bool compareOnStartup() const;
    bool backupReports() const;
    int maxReports() const;
    bool banSimulatorEnabled() const;
    bool backgroundMonitoring() const;
    int monitoringIntervalSeconds() const;
    bool statsTracking() const;
    std::vector<std::string> bannedFingerprints() const;

    nlohmann::json get(const std::string &key) const;
    nlohmann::json all() const;

    // Throws std::invalid_argument for unknown keys and ill-typed or
    // out-of-range values. Returns false when the file could not be written;
    // the in-memory value is updated either way.
    bool set(const std::string &key, const nlohmann::json &value);

    bool setBannedFingerprints(const std::vector<std::string> &fingerprints);

private:
    void load();
    bool persistLocked() const;

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    nlohmann::json m_settings;
};

} // namespace hwidwatch
