#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace nettrack::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory the log files are written to. Honours NETTRACK_LOG_DIR.
QString logsDirPath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line in <logsDir>/<process>.log, mirrored to <process>-trace.log
// in trace mode. Debug events are dropped unless trace mode is on. An empty
// correlationId falls back to the thread's current one.
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

} // namespace nettrack::logging

#define NTLOG_AT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::nettrack::logging::logEvent(::nettrack::logging::LogLevel::level, \
                                  ::nettrack::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NTLOG_DEBUG(...) NTLOG_AT(Debug, __VA_ARGS__)
#define NTLOG_INFO(...) NTLOG_AT(Info, __VA_ARGS__)
#define NTLOG_WARN(...) NTLOG_AT(Warn, __VA_ARGS__)
#define NTLOG_ERROR(...) NTLOG_AT(Error, __VA_ARGS__)
