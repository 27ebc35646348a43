#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

namespace hwidwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support. The task worker sets the task id here
// while a handler runs so every line it logs can be tied back to the task.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

// Sets the correlation id, and optionally scope fields (e.g. the task kind),
// for the current thread until destruction. Scope fields are emitted as
// "scope" on every line logged inside the scope.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId,
                              nlohmann::json scopeFields = nlohmann::json::object());
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
    nlohmann::json m_prevFields;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();
QString logFilePath(const QString &processName);

// Last maxLines non-empty lines of processName's main log, oldest first.
// std::nullopt when the log does not exist yet; throws std::runtime_error
// when it exists but cannot be read.
std::optional<std::vector<std::string>> tailLogFile(const QString &processName, int maxLines);

} // namespace hwidwatch::logging

#define HWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::hwidwatch::logging::logEvent(::hwidwatch::logging::LogLevel::Debug, \
                                   ::hwidwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::hwidwatch::logging::logEvent(::hwidwatch::logging::LogLevel::Info, \
                                   ::hwidwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::hwidwatch::logging::logEvent(::hwidwatch::logging::LogLevel::Warn, \
                                   ::hwidwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::hwidwatch::logging::logEvent(::hwidwatch::logging::LogLevel::Error, \
                                   ::hwidwatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
