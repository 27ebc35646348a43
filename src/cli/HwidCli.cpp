#include "cli/HwidCli.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <QCoreApplication>
#include <QDateTime>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/ban_registry.hpp"
#include "daemon/hwid_daemon.hpp"

namespace hwidwatch {

namespace {

constexpr int kDefaultLogLines = 20;

volatile std::sig_atomic_t g_stopRequested = 0;

void handleStopSignal(int)
{
    g_stopRequested = 1;
}

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  hwidwatch collect [--save]\n"
        "  hwidwatch compare\n"
        "  hwidwatch show\n"
        "  hwidwatch history\n"
        "  hwidwatch ban-current\n"
        "  hwidwatch check\n"
        "  hwidwatch stats [--format text|json]\n"
        "  hwidwatch ban HASH\n"
        "  hwidwatch unban HASH\n"
        "  hwidwatch clear-bans\n"
        "  hwidwatch bans\n"
        "  hwidwatch settings [KEY [VALUE]]\n"
        "  hwidwatch logs [N]\n"
        "  hwidwatch daemon\n"
        "Global options: --trace\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(toEpochMs(timestamp), Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm:ss").toStdString();
}

std::string formatOptionalTime(const nlohmann::json &value)
{
    if (!value.is_string()) {
        return "never";
    }
    return formatLocalTime(fromIso8601Utc(value.get<std::string>()));
}

void renderSnapshot(const Snapshot &snapshot)
{
    for (const auto &entry : snapshot.components) {
        std::cout << "[" << entry.first << "]\n";
        const ComponentRecord &record = entry.second;
        if (!record.isStructured()) {
            std::cout << "  " << record.rawText.value_or(std::string()) << "\n";
            continue;
        }
        for (std::size_t i = 0; i < record.instances.size(); ++i) {
            if (record.instances.size() > 1) {
                std::cout << "  #" << i + 1 << "\n";
            }
            for (const auto &field : record.instances[i]) {
                std::cout << "  " << field.first << ": " << field.second << "\n";
            }
        }
    }
}

void renderReport(const Report &report)
{
    std::cout << "Fingerprint: " << report.fingerprint.digest
              << (report.fingerprint.valid ? "" : " (no identifying fields)") << "\n";
    std::cout << "Saved at:    " << formatLocalTime(report.createdAt) << "\n\n";
    renderSnapshot(report.snapshot);
}

void renderStatsText(const nlohmann::json &stats)
{
    std::cout << "HWID statistics\n\n";
    std::cout << "Total checks:     " << stats.value("totalChecks", 0LL) << "\n";
    std::cout << "Total changes:    " << stats.value("totalChanges", 0LL) << "\n";
    std::cout << "Change frequency: " << stats.value("changeFrequency", 0.0)
              << " per month\n";
    std::cout << "First check:      " << formatOptionalTime(stats.value("firstCheck", nlohmann::json())) << "\n";
    std::cout << "Last check:       " << formatOptionalTime(stats.value("lastCheck", nlohmann::json())) << "\n";
    std::cout << "Last change:      " << formatOptionalTime(stats.value("lastChange", nlohmann::json())) << "\n";
    std::cout << "Distinct HWIDs:   "
              << stats.value("fingerprints", nlohmann::json::array()).size() << "\n";

    const auto monthly = stats.value("monthlySummary", nlohmann::json::object());
    if (monthly.empty()) {
        return;
    }
    std::cout << "\nMonthly summary\n";
    for (const auto &entry : monthly.items()) {
        const auto &month = entry.value();
        std::cout << "  " << entry.key()
                  << "  checks " << month.value("checks", 0LL)
                  << "  changes " << month.value("changes", 0LL)
                  << "  unique " << month.value("uniqueFingerprints", 0LL)
                  << "  rate " << month.value("changeRate", 0.0) << "%\n";
    }
}

// "ts LEVEL component what" for structured lines; anything else verbatim.
std::string formatLogLine(const std::string &line)
{
    const nlohmann::json parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return line;
    }
    std::string text = parsed.value("ts", std::string()) + " "
        + parsed.value("level", std::string()) + " "
        + parsed.value("component", std::string()) + ": "
        + parsed.value("what", std::string());
    const std::string corr = parsed.value("corr", std::string());
    if (!corr.empty()) {
        text += " [" + corr + "]";
    }
    return text;
}

nlohmann::json parseSettingValue(const QString &text)
{
    const std::string raw = text.toStdString();
    nlohmann::json parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return raw;
    }
    return parsed;
}

} // namespace

HwidCli::HwidCli(std::unique_ptr<HardwareCollector> collector)
    : m_collector(std::move(collector))
{
}

HwidCli::~HwidCli() = default;

void HwidCli::setTaskTimeout(std::chrono::milliseconds timeout)
{
    m_taskTimeout = timeout;
}

HwidDaemon &HwidCli::daemon()
{
    if (!m_daemon) {
        m_daemon = std::make_unique<HwidDaemon>(std::move(m_collector));
    }
    return *m_daemon;
}

int HwidCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    HWLOG_INFO(QStringLiteral("HwidCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("collect")) {
            return runCollect(args);
        }
        if (command == QStringLiteral("compare")) {
            return runCompare();
        }
        if (command == QStringLiteral("show")) {
            return runShow();
        }
        if (command == QStringLiteral("history")) {
            return runHistory();
        }
        if (command == QStringLiteral("ban-current")) {
            return runBanCurrent();
        }
        if (command == QStringLiteral("check")) {
            return runCheck();
        }
        if (command == QStringLiteral("stats")) {
            return runStats(args);
        }
        if (command == QStringLiteral("ban")) {
            return runBan(args);
        }
        if (command == QStringLiteral("unban")) {
            return runUnban(args);
        }
        if (command == QStringLiteral("clear-bans")) {
            return runClearBans();
        }
        if (command == QStringLiteral("bans")) {
            return runListBans();
        }
        if (command == QStringLiteral("settings")) {
            return runSettings(args);
        }
        if (command == QStringLiteral("logs")) {
            return runLogs(args);
        }
        if (command == QStringLiteral("daemon")) {
            return runDaemon();
        }
    } catch (const std::exception &ex) {
        HWLOG_ERROR(QStringLiteral("HwidCli"),
                    QStringLiteral("run"),
                    QStringLiteral("cli_command_failed"),
                    QStringLiteral("exception"),
                    QStringLiteral("exit_nonzero"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"command", command.toStdString()},
                                    {"error", ex.what()}}));
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

namespace {

// Submits kind to the worker and waits for its result. Prints the error and
// returns std::nullopt when the task failed or timed out.
std::optional<nlohmann::json> runTask(HwidDaemon &daemon, TaskKind kind,
                                      std::chrono::milliseconds timeout)
{
    daemon.startWorker();
    const std::string taskId = daemon.submit(toTaskKindString(kind));
    const std::optional<TaskResult> result = daemon.poll(taskId, timeout);
    if (!result.has_value()) {
        daemon.forget(taskId);
        std::cerr << "Timed out waiting for task " << taskId << std::endl;
        return std::nullopt;
    }
    if (!result->ok()) {
        std::cerr << "Error: " << result->errorMessage << std::endl;
        return std::nullopt;
    }
    return result->payload;
}

} // namespace

int HwidCli::runCollect(const QStringList &args)
{
    const auto payload = runTask(daemon(), TaskKind::Collect, m_taskTimeout);
    if (!payload.has_value()) {
        return 1;
    }

    const Snapshot snapshot = payload->at("snapshot").get<Snapshot>();
    bool saved = payload->value("saved", false);
    if (args.contains(QStringLiteral("--save")) && !saved) {
        saved = daemon().saveSnapshot(snapshot);
        if (!saved) {
            std::cerr << "Failed to save HWID report." << std::endl;
            return 1;
        }
    }

    std::cout << "Fingerprint: " << payload->value("fingerprint", std::string()) << "\n";
    if (!payload->value("fingerprintValid", true)) {
        std::cout << "Warning: no identifying hardware fields were readable.\n";
    }
    std::cout << (saved ? "Report saved.\n" : "Report not saved.\n") << "\n";
    renderSnapshot(snapshot);
    return 0;
}

int HwidCli::runCompare()
{
    const auto payload = runTask(daemon(), TaskKind::CompareOnly, m_taskTimeout);
    if (!payload.has_value()) {
        return 1;
    }
    std::cout << payload->value("message", std::string()) << "\n";
    std::cout << "Fingerprint: " << payload->value("fingerprint", std::string()) << "\n";
    if (payload->value("baselineSaved", false)) {
        std::cout << "Saved as the new baseline report.\n";
    }
    return payload->value("status", std::string()) == "changed" ? 2 : 0;
}

int HwidCli::runShow()
{
    const std::optional<Report> report = daemon().currentReport();
    if (!report.has_value()) {
        std::cout << "No saved HWID report.\n";
        return 1;
    }
    renderReport(*report);
    return 0;
}

int HwidCli::runHistory()
{
    const std::vector<Report> reports = daemon().history();
    if (reports.empty()) {
        std::cout << "No report history.\n";
        return 0;
    }
    for (const Report &report : reports) {
        std::cout << "- [" << formatLocalTime(report.createdAt) << "] "
                  << report.fingerprint.digest << "\n";
    }
    return 0;
}

int HwidCli::runBanCurrent()
{
    const auto payload = runTask(daemon(), TaskKind::BanCurrent, m_taskTimeout);
    if (!payload.has_value()) {
        return 1;
    }
    std::cout << payload->value("message", std::string()) << "\n";
    return 0;
}

int HwidCli::runCheck()
{
    const auto payload = runTask(daemon(), TaskKind::RunAntiCheatCheck, m_taskTimeout);
    if (!payload.has_value()) {
        return 1;
    }
    const bool banned = payload->value("banned", false);
    std::cout << (banned ? "ACCESS DENIED: " : "ACCESS GRANTED: ")
              << payload->value("message", std::string()) << "\n";
    return banned ? 3 : 0;
}

int HwidCli::runStats(const QStringList &args)
{
    QString format = getArgValue(args, QStringLiteral("--format")).toLower();
    if (format.isEmpty()) {
        format = QStringLiteral("text");
    }
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const auto payload = runTask(daemon(), TaskKind::FetchStats, m_taskTimeout);
    if (!payload.has_value()) {
        return 1;
    }
    if (format == QStringLiteral("json")) {
        std::cout << payload->dump(2) << std::endl;
    } else {
        renderStatsText(*payload);
    }
    return 0;
}

int HwidCli::runBan(const QStringList &args)
{
    if (args.size() < 3) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const BanOutcome outcome = daemon().ban(args.at(2).trimmed().toStdString());
    std::cout << outcome.second << "\n";
    return outcome.first ? 0 : 1;
}

int HwidCli::runUnban(const QStringList &args)
{
    if (args.size() < 3) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const BanOutcome outcome = daemon().unban(args.at(2).trimmed().toStdString());
    std::cout << outcome.second << "\n";
    return outcome.first ? 0 : 1;
}

int HwidCli::runClearBans()
{
    const std::size_t cleared = daemon().clearAllBans();
    std::cout << "Cleared " << cleared << " banned HWID(s)\n";
    return 0;
}

int HwidCli::runListBans()
{
    const std::vector<std::string> banned = daemon().bannedFingerprints();
    if (banned.empty()) {
        std::cout << "No banned HWIDs.\n";
        return 0;
    }
    for (const std::string &fingerprint : banned) {
        std::cout << fingerprint << "\n";
    }
    return 0;
}

int HwidCli::runSettings(const QStringList &args)
{
    SettingsStore &settings = daemon().settings();
    if (args.size() < 3) {
        std::cout << settings.all().dump(2) << std::endl;
        return 0;
    }

    const std::string key = args.at(2).toStdString();
    if (args.size() < 4) {
        std::cout << settings.get(key).dump() << std::endl;
        return 0;
    }

    const nlohmann::json value = parseSettingValue(args.at(3));
    if (!settings.set(key, value)) {
        std::cerr << "Setting updated in memory but settings.json could not be written."
                  << std::endl;
        return 1;
    }
    std::cout << key << " = " << settings.get(key).dump() << std::endl;

    if (key == "backgroundMonitoring") {
        std::cout << "Takes effect the next time the daemon starts.\n";
    }
    return 0;
}

int HwidCli::runLogs(const QStringList &args)
{
    int count = kDefaultLogLines;
    if (args.size() >= 3) {
        bool ok = false;
        count = args.at(2).toInt(&ok);
        if (!ok || count < 1) {
            std::cerr << usageText().toStdString();
            return 1;
        }
    }

    const QString processName = logging::defaultProcessName();
    const auto lines = logging::tailLogFile(processName, count);
    if (!lines.has_value()) {
        std::cout << "No log file found at "
                  << logging::logFilePath(processName).toStdString() << "\n";
        return 0;
    }

    for (const std::string &line : *lines) {
        std::cout << formatLogLine(line) << "\n";
    }
    return 0;
}

int HwidCli::runDaemon()
{
    g_stopRequested = 0;
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    HwidDaemon &engine = daemon();
    engine.start();
    engine.startMonitoring();
    std::cout << "hwidwatch daemon running, checking every "
              << engine.settings().monitoringIntervalSeconds()
              << " s. Press Ctrl+C to stop.\n" << std::flush;

    if (QCoreApplication::instance()) {
        QTimer stopPoll;
        QObject::connect(&stopPoll, &QTimer::timeout, []() {
            if (g_stopRequested) {
                QCoreApplication::quit();
            }
        });
        stopPoll.start(200);
        QCoreApplication::exec();
    } else {
        while (!g_stopRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    engine.stop();
    HWLOG_INFO(QStringLiteral("HwidCli"),
               QStringLiteral("runDaemon"),
               QStringLiteral("daemon_stop"),
               QStringLiteral("signal"),
               QStringLiteral("graceful_shutdown"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    return 0;
}

} // namespace hwidwatch
