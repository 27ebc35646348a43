#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace hwidwatch {

// One device instance of a component, e.g. a single disk.
using FieldSet = std::map<std::string, std::string>;

// A component is either a list of structured field sets or, when the
// hardware query degraded, the raw tool output.
struct ComponentRecord {
    std::vector<FieldSet> instances;
    std::optional<std::string> rawText;

    bool isStructured() const
    {
        return !rawText.has_value();
    }
};

struct Snapshot {
    std::chrono::system_clock::time_point collectedAt;
    std::map<std::string, ComponentRecord> components;
    // Informational host facts (hostname, kernel, ...). Never hashed.
    nlohmann::json extra = nlohmann::json::object();
};

struct Fingerprint {
    std::string digest;
    // False when none of the identifying fields were present.
    bool valid = false;

    bool operator==(const Fingerprint &other) const
    {
        return digest == other.digest;
    }
    bool operator!=(const Fingerprint &other) const
    {
        return !(*this == other);
    }
};

struct Report {
    Snapshot snapshot;
    Fingerprint fingerprint;
    std::chrono::system_clock::time_point createdAt;
};

struct DriftResult {
    DriftStatus status = DriftStatus::NoBaseline;
    std::string message;
    Fingerprint fingerprint;
    // Set with NoBaseline when the current report exists but could not be
    // read; callers must not save over it.
    bool baselineUnreadable = false;
};

struct ChangeEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string fingerprint;
    long long checkNumber = 0;
};

struct MonthBucket {
    long long checks = 0;
    long long changes = 0;
    std::set<std::string> uniqueFingerprints;
};

struct MonthSummary {
    long long checks = 0;
    long long changes = 0;
    long long uniqueFingerprints = 0;
    double changeRate = 0.0;
};

struct Stats {
    long long totalChecks = 0;
    long long totalChanges = 0;
    std::optional<std::chrono::system_clock::time_point> firstCheck;
    std::optional<std::chrono::system_clock::time_point> lastCheck;
    std::optional<std::chrono::system_clock::time_point> lastChange;
    std::map<std::string, long long> dailyChecks;
    std::map<std::string, MonthBucket> monthlyStats;
    std::vector<ChangeEvent> changeHistory;
    // Oldest first; re-observing a fingerprint moves it to the back.
    std::vector<std::string> fingerprints;
};

struct Task {
    TaskKind kind = TaskKind::Unknown;
    std::string kindName;
    std::string id;
    std::chrono::system_clock::time_point submittedAt;
};

struct TaskResult {
    std::string id;
    TaskStatus status = TaskStatus::Error;
    nlohmann::json payload = nlohmann::json::object();
    std::string errorMessage;

    bool ok() const
    {
        return status == TaskStatus::Success;
    }
};

struct MonitoringStatus {
    bool active = false;
    std::optional<std::chrono::system_clock::time_point> lastCheck;
};

} // namespace hwidwatch
