#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hwidwatch {

class SettingsStore;

// Outcome of a registry mutation: ok is false for the expected no-op cases
// ("already banned", "not banned"), never for a fault.
using BanOutcome = std::pair<bool, std::string>;

/**
 * BanRegistry is the simulated deny-list keyed by fingerprint digest.
 * Membership is unique and kept in insertion order. When a SettingsStore is
 * attached, the list is loaded from and written back to its
 * bannedFingerprints key.
 */
class BanRegistry {
public:
    explicit BanRegistry(SettingsStore *settings = nullptr);

    BanOutcome ban(const std::string &fingerprint);
    BanOutcome unban(const std::string &fingerprint);
    bool isBanned(const std::string &fingerprint) const;
    std::size_t clearAll();

    std::vector<std::string> list() const;
    std::size_t size() const;

    static std::string shortHash(const std::string &fingerprint);

private:
    void persistLocked();

    SettingsStore *m_settings;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_banned;
};

} // namespace hwidwatch
