#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace hwidwatch {

// HwidStore is the SQLite access layer for all persistent engine data:
// the current report, the report history trail, and meta (stats document).
// Every method throws std::runtime_error when SQLite reports a failure.
class HwidStore {
public:
    HwidStore();
    explicit HwidStore(const std::filesystem::path &dbPath);
    ~HwidStore();

    HwidStore(const HwidStore &) = delete;
    HwidStore &operator=(const HwidStore &) = delete;

    // Replaces the current report and, when appendHistory is set, appends it
    // to the history and trims the history to maxHistory rows. Runs as one
    // transaction: on failure nothing is changed.
    void writeReport(const Report &report, bool appendHistory, int maxHistory);

    std::optional<Report> currentReport() const;

    // Newest first.
    std::vector<Report> listHistory() const;
    std::size_t historyCount() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace hwidwatch
