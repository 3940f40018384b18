#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace nettrack::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
std::atomic<bool> g_traceEnabled{false};
QString g_processName;

// Open log files keyed by absolute path; guarded by g_logMutex.
std::map<QString, std::unique_ptr<QFile>> g_openFiles;

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

QFile *openLogFile(const QString &path)
{
    auto it = g_openFiles.find(path);
    if (it != g_openFiles.end()) {
        if (it->second->isOpen() && it->second->size() < kMaxLogSizeBytes) {
            return it->second.get();
        }
        g_openFiles.erase(it);
    }

    // Keep one generation: the live file and a single ".1".
    const QFileInfo info(path);
    if (info.exists() && info.size() >= kMaxLogSizeBytes) {
        QFile::remove(path + QStringLiteral(".1"));
        QFile::rename(path, path + QStringLiteral(".1"));
    }

    QDir().mkpath(info.absolutePath());
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return nullptr;
    }
    QFile *raw = file.get();
    g_openFiles.emplace(path, std::move(file));
    return raw;
}

void appendLine(const QString &path, const QByteArray &line)
{
    QFile *file = openLogFile(path);
    if (!file) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file->write(line);
    file->write("\n", 1);
    file->flush();
}

QString threadLabel()
{
    const QString name = QThread::currentThread() ? QThread::currentThread()->objectName()
                                                  : QString();
    if (!name.isEmpty()) {
        return name;
    }
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_openFiles.clear();
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

QString logsDirPath()
{
    const QString overridden = qEnvironmentVariable("NETTRACK_LOG_DIR");
    if (!overridden.isEmpty()) {
        return QDir::cleanPath(overridden);
    }
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? QStringLiteral(".local/share/nettrack/logs")
                          : home + QStringLiteral("/.local/share/nettrack/logs");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
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
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    const QString appName = QCoreApplication::instance()
        ? QCoreApplication::applicationName()
        : QString();
    return appName.isEmpty() ? QStringLiteral("nettrack") : appName;
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2,pid:%3")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<qulonglong>(getuid()))
        .arg(static_cast<qlonglong>(getpid()));
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
    const bool trace = g_traceEnabled;
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json entry = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadLabel().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? currentCorrelationId() : correlationId).toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(
        entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString base = logsDirPath() + QLatin1Char('/') + process;

    std::lock_guard<std::mutex> lock(g_logMutex);
    appendLine(base + QStringLiteral(".log"), line);
    if (trace) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace nettrack::logging
