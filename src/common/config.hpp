#pragma once

#include <chrono>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

namespace nettrack {

struct TrackingConfig {
    // Quiet periods are placeholders until field data says otherwise.
    std::chrono::milliseconds configQuietPeriod{10000};
    std::chrono::milliseconds networkQuietPeriod{10000};

    // Off: configuration directory changes only feed the one-shot apply at start.
    bool trackConfigDirectory = false;
    std::string configDirectory = "/etc/nettrack";

    int captureAttempts = 5;
    std::chrono::milliseconds captureBackoff{500};
    std::chrono::milliseconds captureBackoffMax{8000};

    std::chrono::milliseconds suspensionCeiling{300000};
    bool skipUnchangedStates = false;

    std::string nonVolatilePath;
    std::string volatilePath;
    std::string socketPath;
};

// Built-in defaults with paths resolved against HOME / XDG_RUNTIME_DIR.
TrackingConfig defaultTrackingConfig();

// Overlay the keys present in a JSON document. Throws ConfigError on a key
// with the wrong type.
void applyConfigJson(TrackingConfig &config, const nlohmann::json &document);

// Overlay a JSON config file. Throws ConfigError if unreadable or malformed.
void applyConfigFile(TrackingConfig &config, const QString &path);

// Overlay NETTRACK_* environment variables.
void applyEnvironment(TrackingConfig &config);

// Defaults, then the file (explicit path or $NETTRACK_CONFIG), then environment.
TrackingConfig loadTrackingConfig(const QString &configPath = QString());

nlohmann::json configToJson(const TrackingConfig &config);

} // namespace nettrack
