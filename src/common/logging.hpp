#pragma once

#include <QString>
#include <QtGlobal>

#include <nlohmann/json.hpp>

namespace intervals::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    QString processName = QStringLiteral("intervals-tray");
    // Empty selects defaultLogDirectory().
    QString directory;
    // Debug events go to <process>.log and <process>-trace.log only when set.
    bool traceEnabled = false;
    qint64 maxFileBytes = 5 * 1024 * 1024;
    // Rotated copies kept as <file>.1 .. <file>.N, oldest dropped.
    int rotatedFiles = 3;
    // Events at or above this level are also printed to stderr.
    LogLevel stderrLevel = LogLevel::Warn;
};

// $XDG_STATE_HOME/intervals-tray, falling back to ~/.local/state/intervals-tray.
QString defaultLogDirectory();

// Call early in main(). Events logged before this use the defaults.
void initLogging(const LogOptions &options);

// Path of the main log file for the configured process.
QString logFilePath();

// Tags every event logged on this thread while in scope, unless the event
// carries its own correlation id. Scopes nest.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
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

} // namespace intervals::logging

#define ILOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::intervals::logging::logEvent(::intervals::logging::LogLevel::Debug, \
                                   ::intervals::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::intervals::logging::logEvent(::intervals::logging::LogLevel::Info, \
                                   ::intervals::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::intervals::logging::logEvent(::intervals::logging::LogLevel::Warn, \
                                   ::intervals::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::intervals::logging::logEvent(::intervals::logging::LogLevel::Error, \
                                   ::intervals::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
