#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace intervals::logging {

namespace {

std::mutex g_logMutex;
LogOptions g_options;
bool g_initialized = false;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString resolvedDirectory(const LogOptions &options)
{
    return options.directory.isEmpty() ? defaultLogDirectory() : options.directory;
}

QString filePathFor(const LogOptions &options, const QString &process, const QString &suffix)
{
    return resolvedDirectory(options) + QDir::separator() + process + suffix;
}

// <file> -> <file>.1 -> ... -> <file>.N; whatever was at .N is dropped.
void rotateIfNeeded(const QString &path, const LogOptions &options)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < options.maxFileBytes) {
        return;
    }

    if (options.rotatedFiles < 1) {
        QFile::remove(path);
        return;
    }

    const auto generation = [&path](int n) {
        return path + QLatin1Char('.') + QString::number(n);
    };
    QFile::remove(generation(options.rotatedFiles));
    for (int n = options.rotatedFiles - 1; n >= 1; --n) {
        if (QFile::exists(generation(n))) {
            QFile::rename(generation(n), generation(n + 1));
        }
    }
    QFile::rename(path, generation(1));
}

void appendLine(const QString &path, const QByteArray &line, const LogOptions &options)
{
    rotateIfNeeded(path, options);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "log file %s not writable: %s\n",
                     path.toUtf8().constData(), line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

// One line per event for a terminal: time, level, component/where, what,
// why, correlation id when set, then the context object.
QByteArray operatorLine(LogLevel level,
                        const QString &timestamp,
                        const QString &component,
                        const QString &where,
                        const QString &what,
                        const QString &why,
                        const QString &corr,
                        const std::string &context)
{
    QString text = QStringLiteral("%1 %2 %3.%4: %5")
                       .arg(timestamp, QString::fromLatin1(levelName(level)),
                            component, where, what);
    if (!why.isEmpty()) {
        text += QStringLiteral(" (%1)").arg(why);
    }
    if (!corr.isEmpty()) {
        text += QStringLiteral(" [%1]").arg(corr);
    }
    QByteArray line = text.toUtf8();
    if (context != "{}" && context != "null") {
        line += ' ';
        line += QByteArray::fromStdString(context);
    }
    return line;
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

QString defaultLogDirectory()
{
    const QString stateHome = qEnvironmentVariable("XDG_STATE_HOME");
    if (!stateHome.isEmpty()) {
        return stateHome + QStringLiteral("/intervals-tray");
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QDir::tempPath() + QStringLiteral("/intervals-tray");
    }
    return home + QStringLiteral("/.local/state/intervals-tray");
}

void initLogging(const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_options = options;
    if (g_options.processName.isEmpty()) {
        g_options.processName = QStringLiteral("intervals-tray");
    }
    g_initialized = true;
}

QString logFilePath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return filePathFor(g_options, g_options.processName, QStringLiteral(".log"));
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (g_initialized) {
            return g_options.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("intervals-tray");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? t_corrId : correlationId;
    const QString timestamp = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const nlohmann::json payload = {
        {"ts", timestamp.toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Payload fragments from the server may carry invalid UTF-8; never throw here.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString process = processName.isEmpty() ? g_options.processName : processName;

    if (level != LogLevel::Debug || g_options.traceEnabled) {
        QDir().mkpath(resolvedDirectory(g_options));
        appendLine(filePathFor(g_options, process, QStringLiteral(".log")), line, g_options);
    }
    if (g_options.traceEnabled) {
        appendLine(filePathFor(g_options, process, QStringLiteral("-trace.log")), line, g_options);
    }

    if (level >= g_options.stderrLevel) {
        const QByteArray text = operatorLine(
            level, timestamp, component, where, what, why, corr,
            context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        std::fprintf(stderr, "%s\n", text.constData());
    }
}

} // namespace intervals::logging
