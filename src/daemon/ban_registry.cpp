#include "daemon/ban_registry.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/settings_store.hpp"

namespace hwidwatch {

BanRegistry::BanRegistry(SettingsStore *settings)
    : m_settings(settings)
{
    if (m_settings) {
        m_banned = m_settings->bannedFingerprints();
    }
}

std::string BanRegistry::shortHash(const std::string &fingerprint)
{
    if (fingerprint.size() <= 16) {
        return fingerprint;
    }
    return fingerprint.substr(0, 8) + "..." + fingerprint.substr(fingerprint.size() - 8);
}

void BanRegistry::persistLocked()
{
    if (!m_settings) {
        return;
    }
    if (!m_settings->setBannedFingerprints(m_banned)) {
        HWLOG_WARN(QStringLiteral("BanRegistry"),
                   QStringLiteral("persist"),
                   QStringLiteral("ban_list_not_persisted"),
                   QStringLiteral("settings_write_failed"),
                   QStringLiteral("keep_in_memory"),
                   QString(),
                   QString(),
                   (nlohmann::json{{"count", m_banned.size()}}));
    }
}

BanOutcome BanRegistry::ban(const std::string &fingerprint)
{
    if (fingerprint.empty()) {
        return {false, "Cannot ban an empty fingerprint"};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_banned.begin(), m_banned.end(), fingerprint) != m_banned.end()) {
        return {false, "HWID " + shortHash(fingerprint) + " is already banned"};
    }

    m_banned.push_back(fingerprint);
    persistLocked();

    HWLOG_INFO(QStringLiteral("BanRegistry"),
               QStringLiteral("ban"),
               QStringLiteral("hwid_banned"),
               QStringLiteral("ban_request"),
               QStringLiteral("registry_insert"),
               QString(),
               QString(),
               (nlohmann::json{{"fingerprint", shortHash(fingerprint)}}));
    return {true, "HWID " + shortHash(fingerprint) + " has been banned"};
}

BanOutcome BanRegistry::unban(const std::string &fingerprint)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = std::find(m_banned.begin(), m_banned.end(), fingerprint);
    if (it == m_banned.end()) {
        return {false, "HWID " + shortHash(fingerprint) + " is not banned"};
    }

    m_banned.erase(it);
    persistLocked();

    HWLOG_INFO(QStringLiteral("BanRegistry"),
               QStringLiteral("unban"),
               QStringLiteral("hwid_unbanned"),
               QStringLiteral("unban_request"),
               QStringLiteral("registry_remove"),
               QString(),
               QString(),
               (nlohmann::json{{"fingerprint", shortHash(fingerprint)}}));
    return {true, "HWID " + shortHash(fingerprint) + " has been unbanned"};
}

bool BanRegistry::isBanned(const std::string &fingerprint) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::find(m_banned.begin(), m_banned.end(), fingerprint) != m_banned.end();
}

std::size_t BanRegistry::clearAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::size_t count = m_banned.size();
    m_banned.clear();
    persistLocked();

    HWLOG_INFO(QStringLiteral("BanRegistry"),
               QStringLiteral("clearAll"),
               QStringLiteral("hwid_bans_cleared"),
               QStringLiteral("clear_request"),
               QStringLiteral("registry_clear"),
               QString(),
               QString(),
               (nlohmann::json{{"count", count}}));
    return count;
}

std::vector<std::string> BanRegistry::list() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_banned;
}

std::size_t BanRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_banned.size();
}

} // namespace hwidwatch
