#pragma once

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hwidwatch {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline long long toEpochMs(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMs(long long value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{value}};
}

inline double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

inline std::string toDriftStatusString(DriftStatus status)
{
    switch (status) {
    case DriftStatus::NoBaseline:
        return "no_baseline";
    case DriftStatus::Unchanged:
        return "unchanged";
    case DriftStatus::Changed:
        return "changed";
    }
    return "no_baseline";
}

inline std::string toTaskKindString(TaskKind kind)
{
    switch (kind) {
    case TaskKind::Collect:
        return "collect";
    case TaskKind::CompareOnly:
        return "compareOnly";
    case TaskKind::BanCurrent:
        return "banCurrent";
    case TaskKind::RunAntiCheatCheck:
        return "runAntiCheatCheck";
    case TaskKind::FetchStats:
        return "fetchStats";
    case TaskKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline TaskKind parseTaskKindString(const std::string &value)
{
    if (value == "collect") {
        return TaskKind::Collect;
    }
    if (value == "compareOnly") {
        return TaskKind::CompareOnly;
    }
    if (value == "banCurrent") {
        return TaskKind::BanCurrent;
    }
    if (value == "runAntiCheatCheck") {
        return TaskKind::RunAntiCheatCheck;
    }
    if (value == "fetchStats") {
        return TaskKind::FetchStats;
    }
    return TaskKind::Unknown;
}

inline void to_json(nlohmann::json &j, const ComponentRecord &record)
{
    if (record.rawText.has_value()) {
        j = nlohmann::json{{"raw", *record.rawText}};
        return;
    }
    j = nlohmann::json{{"instances", record.instances}};
}

inline void from_json(const nlohmann::json &j, ComponentRecord &record)
{
    record.instances.clear();
    record.rawText.reset();
    if (!j.is_object()) {
        return;
    }
    if (j.contains("raw") && j.at("raw").is_string()) {
        record.rawText = j.at("raw").get<std::string>();
        return;
    }
    if (!j.contains("instances") || !j.at("instances").is_array()) {
        return;
    }
    for (const auto &item : j.at("instances")) {
        if (!item.is_object()) {
            continue;
        }
        FieldSet fields;
        for (const auto &entry : item.items()) {
            if (entry.value().is_string()) {
                fields[entry.key()] = entry.value().get<std::string>();
            }
        }
        record.instances.push_back(std::move(fields));
    }
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"collectedAt", toIso8601Utc(snapshot.collectedAt)},
        {"components", snapshot.components},
        {"extra", snapshot.extra}
    };
}

inline void from_json(const nlohmann::json &j, Snapshot &snapshot)
{
    snapshot.collectedAt = fromIso8601Utc(j.value("collectedAt", ""));
    snapshot.components.clear();
    if (j.contains("components") && j.at("components").is_object()) {
        for (const auto &entry : j.at("components").items()) {
            snapshot.components[entry.key()] = entry.value().get<ComponentRecord>();
        }
    }
    if (j.contains("extra") && j.at("extra").is_object()) {
        snapshot.extra = j.at("extra");
    } else {
        snapshot.extra = nlohmann::json::object();
    }
}

inline void to_json(nlohmann::json &j, const Fingerprint &fingerprint)
{
    j = nlohmann::json{{"digest", fingerprint.digest}, {"valid", fingerprint.valid}};
}

inline void from_json(const nlohmann::json &j, Fingerprint &fingerprint)
{
    fingerprint.digest = j.value("digest", "");
    fingerprint.valid = j.value("valid", false);
}

inline void to_json(nlohmann::json &j, const Report &report)
{
    j = nlohmann::json{
        {"snapshot", report.snapshot},
        {"fingerprint", report.fingerprint},
        {"createdAt", toIso8601Utc(report.createdAt)}
    };
}

inline void to_json(nlohmann::json &j, const ChangeEvent &event)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"fingerprint", event.fingerprint},
        {"checkNumber", event.checkNumber}
    };
}

inline void from_json(const nlohmann::json &j, ChangeEvent &event)
{
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    event.fingerprint = j.value("fingerprint", "");
    event.checkNumber = j.value("checkNumber", 0LL);
}

inline void to_json(nlohmann::json &j, const MonthBucket &bucket)
{
    j = nlohmann::json{
        {"checks", bucket.checks},
        {"changes", bucket.changes},
        {"uniqueFingerprints", bucket.uniqueFingerprints}
    };
}

inline void from_json(const nlohmann::json &j, MonthBucket &bucket)
{
    bucket.checks = j.value("checks", 0LL);
    bucket.changes = j.value("changes", 0LL);
    bucket.uniqueFingerprints.clear();
    if (j.contains("uniqueFingerprints") && j.at("uniqueFingerprints").is_array()) {
        for (const auto &item : j.at("uniqueFingerprints")) {
            if (item.is_string()) {
                bucket.uniqueFingerprints.insert(item.get<std::string>());
            }
        }
    }
}

inline nlohmann::json optionalTimeToJson(
    const std::optional<std::chrono::system_clock::time_point> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

inline std::optional<std::chrono::system_clock::time_point> optionalTimeFromJson(
    const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return fromIso8601Utc(j.at(key).get<std::string>());
}

inline void to_json(nlohmann::json &j, const Stats &stats)
{
    j = nlohmann::json{
        {"totalChecks", stats.totalChecks},
        {"totalChanges", stats.totalChanges},
        {"firstCheck", optionalTimeToJson(stats.firstCheck)},
        {"lastCheck", optionalTimeToJson(stats.lastCheck)},
        {"lastChange", optionalTimeToJson(stats.lastChange)},
        {"dailyChecks", stats.dailyChecks},
        {"monthlyStats", stats.monthlyStats},
        {"changeHistory", stats.changeHistory},
        {"fingerprints", stats.fingerprints}
    };
}

inline void from_json(const nlohmann::json &j, Stats &stats)
{
    stats = Stats{};
    stats.totalChecks = j.value("totalChecks", 0LL);
    stats.totalChanges = j.value("totalChanges", 0LL);
    stats.firstCheck = optionalTimeFromJson(j, "firstCheck");
    stats.lastCheck = optionalTimeFromJson(j, "lastCheck");
    stats.lastChange = optionalTimeFromJson(j, "lastChange");
    if (j.contains("dailyChecks") && j.at("dailyChecks").is_object()) {
        for (const auto &entry : j.at("dailyChecks").items()) {
            if (entry.value().is_number_integer()) {
                stats.dailyChecks[entry.key()] = entry.value().get<long long>();
            }
        }
    }
    if (j.contains("monthlyStats") && j.at("monthlyStats").is_object()) {
        for (const auto &entry : j.at("monthlyStats").items()) {
            stats.monthlyStats[entry.key()] = entry.value().get<MonthBucket>();
        }
    }
    if (j.contains("changeHistory") && j.at("changeHistory").is_array()) {
        stats.changeHistory = j.at("changeHistory").get<std::vector<ChangeEvent>>();
    }
    if (j.contains("fingerprints") && j.at("fingerprints").is_array()) {
        for (const auto &item : j.at("fingerprints")) {
            if (item.is_string()) {
                stats.fingerprints.push_back(item.get<std::string>());
            }
        }
    }
}

inline void to_json(nlohmann::json &j, const MonthSummary &summary)
{
    j = nlohmann::json{
        {"checks", summary.checks},
        {"changes", summary.changes},
        {"uniqueFingerprints", summary.uniqueFingerprints},
        {"changeRate", summary.changeRate}
    };
}

inline void to_json(nlohmann::json &j, const TaskResult &result)
{
    j = nlohmann::json{
        {"id", result.id},
        {"status", result.ok() ? "success" : "error"}
    };
    if (result.ok()) {
        j["payload"] = result.payload;
    } else {
        j["error"] = result.errorMessage;
    }
}

} // namespace hwidwatch
