#include "common/config.hpp"

#include <QFile>
#include <QStandardPaths>

#include <unistd.h>

#include "common/errors.hpp"

namespace nettrack {

namespace {

QString runtimeDirPath()
{
    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir;
}

QString dataDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/nettrack");
    }
    return home + QStringLiteral("/.local/share/nettrack");
}

void readMillis(const nlohmann::json &document, const char *key,
                std::chrono::milliseconds &target)
{
    if (!document.contains(key)) {
        return;
    }
    const auto &value = document.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError(std::string("config key '") + key
                          + "' must be a non-negative integer (milliseconds)");
    }
    target = std::chrono::milliseconds(value.get<long long>());
}

void readBool(const nlohmann::json &document, const char *key, bool &target)
{
    if (!document.contains(key)) {
        return;
    }
    const auto &value = document.at(key);
    if (!value.is_boolean()) {
        throw ConfigError(std::string("config key '") + key + "' must be a boolean");
    }
    target = value.get<bool>();
}

void readString(const nlohmann::json &document, const char *key, std::string &target)
{
    if (!document.contains(key)) {
        return;
    }
    const auto &value = document.at(key);
    if (!value.is_string()) {
        throw ConfigError(std::string("config key '") + key + "' must be a string");
    }
    target = value.get<std::string>();
}

void envMillis(const char *name, std::chrono::milliseconds &target)
{
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (ok && value >= 0) {
        target = std::chrono::milliseconds(value);
    }
}

void envString(const char *name, std::string &target)
{
    const QString value = qEnvironmentVariable(name);
    if (!value.isEmpty()) {
        target = value.toStdString();
    }
}

} // namespace

TrackingConfig defaultTrackingConfig()
{
    TrackingConfig config;
    config.nonVolatilePath =
        (dataDirPath() + QStringLiteral("/nonvolatile.db")).toStdString();
    config.volatilePath =
        (runtimeDirPath() + QStringLiteral("/nettrack/volatile.db")).toStdString();
    config.socketPath = (runtimeDirPath() + QStringLiteral("/nettrack.sock")).toStdString();
    return config;
}

void applyConfigJson(TrackingConfig &config, const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw ConfigError("config document must be a JSON object");
    }

    readMillis(document, "configQuietPeriodMs", config.configQuietPeriod);
    readMillis(document, "networkQuietPeriodMs", config.networkQuietPeriod);
    readBool(document, "trackConfigDirectory", config.trackConfigDirectory);
    readString(document, "configDirectory", config.configDirectory);

    if (document.contains("captureAttempts")) {
        const auto &value = document.at("captureAttempts");
        if (!value.is_number_integer() || value.get<int>() < 1) {
            throw ConfigError("config key 'captureAttempts' must be a positive integer");
        }
        config.captureAttempts = value.get<int>();
    }
    readMillis(document, "captureBackoffMs", config.captureBackoff);
    readMillis(document, "captureBackoffMaxMs", config.captureBackoffMax);
    readMillis(document, "suspensionCeilingMs", config.suspensionCeiling);
    readBool(document, "skipUnchangedStates", config.skipUnchangedStates);

    readString(document, "nonVolatilePath", config.nonVolatilePath);
    readString(document, "volatilePath", config.volatilePath);
    readString(document, "socketPath", config.socketPath);
}

void applyConfigFile(TrackingConfig &config, const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw ConfigError("cannot open config file " + path.toStdString());
    }

    const auto document = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (document.is_discarded()) {
        throw ConfigError("config file " + path.toStdString() + " is not valid JSON");
    }
    applyConfigJson(config, document);
}

void applyEnvironment(TrackingConfig &config)
{
    envMillis("NETTRACK_CONFIG_QUIET_MS", config.configQuietPeriod);
    envMillis("NETTRACK_NETWORK_QUIET_MS", config.networkQuietPeriod);

    const QString trackDir = qEnvironmentVariable("NETTRACK_TRACK_CONFIG_DIR");
    if (!trackDir.isEmpty()) {
        config.trackConfigDirectory = trackDir == QStringLiteral("1")
            || trackDir.compare(QStringLiteral("true"), Qt::CaseInsensitive) == 0;
    }

    envString("NETTRACK_CONFIG_DIR", config.configDirectory);
    envString("NETTRACK_NONVOLATILE_PATH", config.nonVolatilePath);
    envString("NETTRACK_VOLATILE_PATH", config.volatilePath);
    envString("NETTRACK_SOCKET", config.socketPath);
}

TrackingConfig loadTrackingConfig(const QString &configPath)
{
    TrackingConfig config = defaultTrackingConfig();

    QString path = configPath;
    if (path.isEmpty()) {
        path = qEnvironmentVariable("NETTRACK_CONFIG");
    }
    if (!path.isEmpty()) {
        applyConfigFile(config, path);
    }

    applyEnvironment(config);
    return config;
}

nlohmann::json configToJson(const TrackingConfig &config)
{
    return nlohmann::json{
        {"configQuietPeriodMs", config.configQuietPeriod.count()},
        {"networkQuietPeriodMs", config.networkQuietPeriod.count()},
        {"trackConfigDirectory", config.trackConfigDirectory},
        {"configDirectory", config.configDirectory},
        {"captureAttempts", config.captureAttempts},
        {"captureBackoffMs", config.captureBackoff.count()},
        {"captureBackoffMaxMs", config.captureBackoffMax.count()},
        {"suspensionCeilingMs", config.suspensionCeiling.count()},
        {"skipUnchangedStates", config.skipUnchangedStates},
        {"nonVolatilePath", config.nonVolatilePath},
        {"volatilePath", config.volatilePath},
        {"socketPath", config.socketPath}
    };
}

} // namespace nettrack
