#pragma once

#include <chrono>
#include <memory>

#include <QString>
#include <QStringList>

namespace hwidwatch {

class HardwareCollector;
class HwidDaemon;

class HwidCli
{
public:
    // A null collector selects the Linux collector when the daemon is built.
    explicit HwidCli(std::unique_ptr<HardwareCollector> collector = nullptr);
    ~HwidCli();

    // CLI dispatcher; returns the process exit code.
    int run(int argc, char *argv[]);

    // How long worker-backed commands wait for their result.
    void setTaskTimeout(std::chrono::milliseconds timeout);

private:
    HwidDaemon &daemon();

    int runCollect(const QStringList &args);
    int runCompare();
    int runShow();
    int runHistory();
    int runBanCurrent();
    int runCheck();
    int runStats(const QStringList &args);
    int runBan(const QStringList &args);
    int runUnban(const QStringList &args);
    int runClearBans();
    int runListBans();
    int runSettings(const QStringList &args);
    int runLogs(const QStringList &args);
    int runDaemon();

    std::unique_ptr<HardwareCollector> m_collector;
    std::unique_ptr<HwidDaemon> m_daemon;
    std::chrono::milliseconds m_taskTimeout{std::chrono::seconds(120)};
};

} // namespace hwidwatch
