#include "daemon/settings_store.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>

#include "common/logging.hpp"
#include "common/paths.hpp"

namespace hwidwatch {

namespace {

bool isBoolKey(const std::string &key)
{
    return key == "autoSaveReports" || key == "compareOnStartup"
        || key == "backupReports" || key == "banSimulatorEnabled"
        || key == "backgroundMonitoring" || key == "statsTracking";
}

// Checks the stored integer itself so values beyond int never wrap.
bool integerInRange(const nlohmann::json &value, long long low, long long high)
{
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()
        && value.get<unsigned long long>()
            > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return false;
    }
    const long long number = value.get<long long>();
    return number >= low && number <= high;
}

// value must already be an integer.
void clampInteger(nlohmann::json &value, long long low, long long high)
{
    if (integerInRange(value, low, high)) {
        return;
    }
    const bool tooLarge = value.is_number_unsigned()
        ? value.get<unsigned long long>() > static_cast<unsigned long long>(high)
        : value.get<long long>() > high;
    value = tooLarge ? high : low;
}

bool sameKind(const nlohmann::json &a, const nlohmann::json &b)
{
    if (a.is_number_integer() && b.is_number_integer()) {
        return true;
    }
    return a.type() == b.type();
}

void normalize(nlohmann::json &settings)
{
    const nlohmann::json defaultSettings = SettingsStore::defaults();
    for (const auto &item : defaultSettings.items()) {
        const auto it = settings.find(item.key());
        if (it == settings.end() || !sameKind(*it, item.value())) {
            settings[item.key()] = item.value();
        }
    }

    constexpr int kIntMax = std::numeric_limits<int>::max();
    clampInteger(settings["maxReports"], 1, kIntMax);
    clampInteger(settings["monitoringIntervalSeconds"],
                 SettingsStore::kMinMonitoringIntervalSeconds, kIntMax);

    nlohmann::json banned = nlohmann::json::array();
    for (const auto &item : settings["bannedFingerprints"]) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            continue;
        }
        if (std::find(banned.begin(), banned.end(), item) == banned.end()) {
            banned.push_back(item);
        }
    }
    settings["bannedFingerprints"] = banned;
}

} // namespace

SettingsStore::SettingsStore(std::filesystem::path path)
    : m_path(std::move(path))
{
    load();
}

SettingsStore::SettingsStore()
    : SettingsStore(settingsFilePath())
{
}

nlohmann::json SettingsStore::defaults()
{
    return nlohmann::json{
        {"autoSaveReports", true},
        {"compareOnStartup", false},
        {"backupReports", true},
        {"maxReports", 10},
        {"banSimulatorEnabled", true},
        {"backgroundMonitoring", false},
        {"monitoringIntervalSeconds", 300},
        {"statsTracking", true},
        {"bannedFingerprints", nlohmann::json::array()}
    };
}

void SettingsStore::load()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code error;
    if (!std::filesystem::exists(m_path, error)) {
        m_settings = defaults();
        HWLOG_INFO(QStringLiteral("SettingsStore"),
                   QStringLiteral("load"),
                   QStringLiteral("settings_defaults_written"),
                   QStringLiteral("no_settings_file"),
                   QStringLiteral("defaults"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"path", m_path.string()}}));
        persistLocked();
        return;
    }

    try {
        std::ifstream in(m_path);
        m_settings = nlohmann::json::parse(in);
        if (!m_settings.is_object()) {
            m_settings = nlohmann::json::object();
        }
    } catch (const nlohmann::json::exception &ex) {
        HWLOG_ERROR(QStringLiteral("SettingsStore"),
                    QStringLiteral("load"),
                    QStringLiteral("settings_parse_failed"),
                    QStringLiteral("malformed_json"),
                    QStringLiteral("fallback_defaults"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"path", m_path.string()}, {"error", ex.what()}}));
        m_settings = nlohmann::json::object();
    }

    normalize(m_settings);
}

bool SettingsStore::persistLocked() const
{
    std::error_code error;
    std::filesystem::create_directories(m_path.parent_path(), error);

    const std::filesystem::path tmpPath = m_path.string() + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            HWLOG_ERROR(QStringLiteral("SettingsStore"),
                        QStringLiteral("persist"),
                        QStringLiteral("settings_write_failed"),
                        QStringLiteral("open_failed"),
                        QStringLiteral("ofstream"),
                        QString(),
                        QString(),
                        (nlohmann::json{{"path", tmpPath.string()}}));
            return false;
        }
        out << m_settings.dump(2) << '\n';
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmpPath, m_path, error);
    if (error) {
        HWLOG_ERROR(QStringLiteral("SettingsStore"),
                    QStringLiteral("persist"),
                    QStringLiteral("settings_write_failed"),
                    QStringLiteral("rename_failed"),
                    QStringLiteral("filesystem_rename"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"path", m_path.string()}, {"error", error.message()}}));
        return false;
    }
    return true;
}

bool SettingsStore::autoSaveReports() const
{
    return get("autoSaveReports").get<bool>();
}

bool SettingsStore::compareOnStartup() const
{
    return get("compareOnStartup").get<bool>();
}

bool SettingsStore::backupReports() const
{
    return get("backupReports").get<bool>();
}

int SettingsStore::maxReports() const
{
    return get("maxReports").get<int>();
}

bool SettingsStore::banSimulatorEnabled() const
{
    return get("banSimulatorEnabled").get<bool>();
}

bool SettingsStore::backgroundMonitoring() const
{
    return get("backgroundMonitoring").get<bool>();
}

int SettingsStore::monitoringIntervalSeconds() const
{
    return get("monitoringIntervalSeconds").get<int>();
}

bool SettingsStore::statsTracking() const
{
    return get("statsTracking").get<bool>();
}

std::vector<std::string> SettingsStore::bannedFingerprints() const
{
    return get("bannedFingerprints").get<std::vector<std::string>>();
}

nlohmann::json SettingsStore::get(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_settings.find(key);
    if (it == m_settings.end()) {
        throw std::invalid_argument("unknown setting: " + key);
    }
    return *it;
}

nlohmann::json SettingsStore::all() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

bool SettingsStore::set(const std::string &key, const nlohmann::json &value)
{
    if (isBoolKey(key)) {
        if (!value.is_boolean()) {
            throw std::invalid_argument(key + " expects true or false");
        }
    } else if (key == "maxReports") {
        if (!integerInRange(value, 1, std::numeric_limits<int>::max())) {
            throw std::invalid_argument("maxReports must be a positive integer");
        }
    } else if (key == "monitoringIntervalSeconds") {
        if (!integerInRange(value, kMinMonitoringIntervalSeconds,
                            std::numeric_limits<int>::max())) {
            throw std::invalid_argument(
                "monitoringIntervalSeconds must be an integer >= "
                + std::to_string(kMinMonitoringIntervalSeconds));
        }
    } else if (key == "bannedFingerprints") {
        if (!value.is_array()) {
            throw std::invalid_argument("bannedFingerprints expects a list");
        }
        for (const auto &item : value) {
            if (!item.is_string()) {
                throw std::invalid_argument("bannedFingerprints entries must be strings");
            }
        }
        return setBannedFingerprints(value.get<std::vector<std::string>>());
    } else {
        throw std::invalid_argument("unknown setting: " + key);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings[key] = value;
    return persistLocked();
}

bool SettingsStore::setBannedFingerprints(const std::vector<std::string> &fingerprints)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings["bannedFingerprints"] = fingerprints;
    normalize(m_settings);
    return persistLocked();
}

} // namespace hwidwatch
