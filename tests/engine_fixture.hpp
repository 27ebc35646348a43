#pragma once

#include <filesystem>
#include <mutex>

#include "daemon/ban_registry.hpp"
#include "daemon/engine_context.hpp"
#include "daemon/hwid_store.hpp"
#include "daemon/report_store.hpp"
#include "daemon/settings_store.hpp"
#include "daemon/stats_tracker.hpp"
#include "fake_collector.hpp"

namespace hwidwatch::testing {

// The components HwidDaemon wires together, rooted in dir and driven by a
// FakeCollector.
struct EngineFixture {
    explicit EngineFixture(const std::filesystem::path &dir)
        : settings(dir / "settings.json")
        , store(dir / "hwidwatch.db")
        , stats(&store)
        , bans(&settings)
        , reports(store, settings, &stats)
        , context{settings, reports, stats, bans, collector, stateMutex}
    {
    }

    SettingsStore settings;
    HwidStore store;
    StatsTracker stats;
    BanRegistry bans;
    ReportStore reports;
    FakeCollector collector;
    std::mutex stateMutex;
    EngineContext context;
};

inline void removeEngineFiles(const std::filesystem::path &dir)
{
    std::error_code error;
    std::filesystem::remove(dir / "settings.json", error);
    std::filesystem::remove(dir / "hwidwatch.db", error);
}

} // namespace hwidwatch::testing
