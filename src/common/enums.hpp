#pragma once

namespace hwidwatch {

enum class DriftStatus {
    NoBaseline,
    Unchanged,
    Changed
};

enum class TaskKind {
    Collect,
    CompareOnly,
    BanCurrent,
    RunAntiCheatCheck,
    FetchStats,
    Unknown
};

enum class TaskStatus {
    Success,
    Error
};

} // namespace hwidwatch
