#pragma once

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace nettrack {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toSourceString(ChangeSource source)
{
    switch (source) {
    case ChangeSource::UserRequest:
        return "user-request";
    case ChangeSource::ExternalTool:
        return "external-tool";
    case ChangeSource::ConfigDirectory:
        return "config-directory-change";
    case ChangeSource::NetlinkLinkStatus:
        return "netlink-link-status";
    case ChangeSource::DhcpLease:
        return "dhcp-lease";
    }
    return "external-tool";
}

inline std::optional<ChangeSource> parseSourceString(const std::string &value)
{
    if (value == "user-request") {
        return ChangeSource::UserRequest;
    }
    if (value == "external-tool") {
        return ChangeSource::ExternalTool;
    }
    if (value == "config-directory-change") {
        return ChangeSource::ConfigDirectory;
    }
    if (value == "netlink-link-status") {
        return ChangeSource::NetlinkLinkStatus;
    }
    if (value == "dhcp-lease") {
        return ChangeSource::DhcpLease;
    }
    return std::nullopt;
}

inline std::string toTrackString(Track track)
{
    return track == Track::Volatile ? "volatile" : "nonvolatile";
}

inline std::optional<Track> parseTrackString(const std::string &value)
{
    if (value == "volatile") {
        return Track::Volatile;
    }
    if (value == "nonvolatile" || value == "non-volatile") {
        return Track::NonVolatile;
    }
    return std::nullopt;
}

inline std::string toChangeKindString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Removed:
        return "removed";
    case ChangeKind::Modified:
        return "modified";
    }
    return "modified";
}

inline ChangeKind parseChangeKindString(const std::string &value)
{
    if (value == "added") {
        return ChangeKind::Added;
    }
    if (value == "removed") {
        return ChangeKind::Removed;
    }
    return ChangeKind::Modified;
}

inline std::string toPhaseString(TrackingPhase phase)
{
    switch (phase) {
    case TrackingPhase::Idle:
        return "idle";
    case TrackingPhase::Suspended:
        return "suspended";
    case TrackingPhase::Debouncing:
        return "debouncing";
    case TrackingPhase::Capturing:
        return "capturing";
    }
    return "idle";
}

inline void to_json(nlohmann::json &j, const InterfaceRecord &iface)
{
    j = nlohmann::json{
        {"name", iface.name},
        {"type", iface.type},
        {"state", iface.state},
        {"mtu", iface.mtu},
        {"mac-address", iface.macAddress},
        {"ipv4", iface.ipv4Addresses},
        {"ipv6", iface.ipv6Addresses},
        {"extra", iface.extra.is_object() ? iface.extra : nlohmann::json::object()}
    };
}

inline void from_json(const nlohmann::json &j, InterfaceRecord &iface)
{
    iface.name = j.value("name", "");
    iface.type = j.value("type", "");
    iface.state = j.value("state", "");
    iface.mtu = j.value("mtu", 0);
    iface.macAddress = j.value("mac-address", "");
    if (j.contains("ipv4") && j.at("ipv4").is_array()) {
        iface.ipv4Addresses = j.at("ipv4").get<std::vector<std::string>>();
    } else {
        iface.ipv4Addresses.clear();
    }
    if (j.contains("ipv6") && j.at("ipv6").is_array()) {
        iface.ipv6Addresses = j.at("ipv6").get<std::vector<std::string>>();
    } else {
        iface.ipv6Addresses.clear();
    }
    if (j.contains("extra") && j.at("extra").is_object()) {
        iface.extra = j.at("extra");
    } else {
        iface.extra = nlohmann::json::object();
    }
}

inline void to_json(nlohmann::json &j, const GlobalSettings &globals)
{
    j = nlohmann::json{
        {"hostname", globals.hostname},
        {"dns-servers", globals.dnsServers},
        {"dns-search", globals.dnsSearch},
        {"dns-options", globals.dnsOptions},
        {"routes", globals.routes.is_array() ? globals.routes : nlohmann::json::array()}
    };
}

inline void from_json(const nlohmann::json &j, GlobalSettings &globals)
{
    globals.hostname = j.value("hostname", "");
    auto readList = [&j](const char *key) {
        if (j.contains(key) && j.at(key).is_array()) {
            return j.at(key).get<std::vector<std::string>>();
        }
        return std::vector<std::string>{};
    };
    globals.dnsServers = readList("dns-servers");
    globals.dnsSearch = readList("dns-search");
    globals.dnsOptions = readList("dns-options");
    if (j.contains("routes") && j.at("routes").is_array()) {
        globals.routes = j.at("routes");
    } else {
        globals.routes = nlohmann::json::array();
    }
}

inline void to_json(nlohmann::json &j, const NetworkState &state)
{
    j = nlohmann::json{
        {"interfaces", state.interfaces},
        {"globals", state.globals},
        {"capturedAt", toIso8601Utc(state.capturedAt)}
    };
}

inline void from_json(const nlohmann::json &j, NetworkState &state)
{
    if (j.contains("interfaces") && j.at("interfaces").is_array()) {
        state.interfaces = j.at("interfaces").get<std::vector<InterfaceRecord>>();
    } else {
        state.interfaces.clear();
    }
    if (j.contains("globals") && j.at("globals").is_object()) {
        state.globals = j.at("globals").get<GlobalSettings>();
    } else {
        state.globals = GlobalSettings{};
    }
    state.capturedAt = fromIso8601Utc(j.value("capturedAt", ""));
}

// Serialized text; invalid UTF-8 in strings is replaced with U+FFFD instead
// of throwing.
inline std::string dumpJson(const nlohmann::json &value)
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Null members carry no value: an explicit null and an absent key are the same.
inline nlohmann::json withoutNullMembers(const nlohmann::json &value)
{
    if (!value.is_object()) {
        return value;
    }
    nlohmann::json result = nlohmann::json::object();
    for (const auto &item : value.items()) {
        if (!item.value().is_null()) {
            result[item.key()] = withoutNullMembers(item.value());
        }
    }
    return result;
}

// Canonical form: interfaces ordered by name, order-insensitive lists
// sorted, capture time omitted. Object keys are ordered by nlohmann::json.
inline nlohmann::json canonicalInterfaceJson(const InterfaceRecord &iface)
{
    InterfaceRecord copy = iface;
    std::sort(copy.ipv4Addresses.begin(), copy.ipv4Addresses.end());
    std::sort(copy.ipv6Addresses.begin(), copy.ipv6Addresses.end());
    copy.extra = withoutNullMembers(copy.extra);
    return copy;
}

inline nlohmann::json canonicalGlobalsJson(const GlobalSettings &globals)
{
    GlobalSettings copy = globals;
    std::sort(copy.dnsOptions.begin(), copy.dnsOptions.end());
    if (copy.routes.is_array()) {
        std::vector<nlohmann::json> routes(copy.routes.begin(), copy.routes.end());
        std::sort(routes.begin(), routes.end(),
                  [](const nlohmann::json &a, const nlohmann::json &b) {
                      return dumpJson(a) < dumpJson(b);
                  });
        copy.routes = routes;
    }
    return copy;
}

inline nlohmann::json canonicalJson(const NetworkState &state)
{
    std::vector<const InterfaceRecord *> ordered;
    ordered.reserve(state.interfaces.size());
    for (const auto &iface : state.interfaces) {
        ordered.push_back(&iface);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const InterfaceRecord *a, const InterfaceRecord *b) {
                         return a->name < b->name;
                     });

    nlohmann::json interfaces = nlohmann::json::array();
    for (const auto *iface : ordered) {
        interfaces.push_back(canonicalInterfaceJson(*iface));
    }
    return nlohmann::json{
        {"interfaces", interfaces},
        {"globals", canonicalGlobalsJson(state.globals)}
    };
}

inline std::string canonicalForm(const NetworkState &state)
{
    return dumpJson(canonicalJson(state));
}

inline bool operator==(const NetworkState &a, const NetworkState &b)
{
    return canonicalForm(a) == canonicalForm(b);
}

inline bool operator!=(const NetworkState &a, const NetworkState &b)
{
    return !(a == b);
}

inline void to_json(nlohmann::json &j, const ChangeScope &scope)
{
    j = nlohmann::json{
        {"interfaces", scope.interfaces},
        {"global", scope.global},
        {"full", scope.full}
    };
}

inline void from_json(const nlohmann::json &j, ChangeScope &scope)
{
    scope.interfaces.clear();
    if (j.contains("interfaces") && j.at("interfaces").is_array()) {
        for (const auto &name : j.at("interfaces")) {
            if (name.is_string()) {
                scope.interfaces.insert(name.get<std::string>());
            }
        }
    }
    scope.global = j.value("global", false);
    scope.full = j.value("full", false);
}

inline void to_json(nlohmann::json &j, const Commit &commit)
{
    j = nlohmann::json{
        {"id", commit.id},
        {"parentId", commit.parentId},
        {"sequence", commit.sequence},
        {"timestamp", toIso8601Utc(commit.timestamp)},
        {"state", commit.state}
    };
}

inline void to_json(nlohmann::json &j, const Checkpoint &checkpoint)
{
    j = nlohmann::json{
        {"id", checkpoint.id},
        {"label", checkpoint.label},
        {"commitId", checkpoint.commitId},
        {"parentCheckpointId", checkpoint.parentCheckpointId},
        {"createdAt", toIso8601Utc(checkpoint.createdAt)}
    };
}

inline void to_json(nlohmann::json &j, const FieldChange &change)
{
    j = nlohmann::json{
        {"scope", change.scopeKind == ScopeKind::Global ? "global" : "interface"},
        {"name", change.name},
        {"kind", toChangeKindString(change.kind)},
        {"field", change.field},
        {"before", change.before},
        {"after", change.after}
    };
}

inline void from_json(const nlohmann::json &j, FieldChange &change)
{
    change.scopeKind = j.value("scope", "interface") == "global"
        ? ScopeKind::Global
        : ScopeKind::Interface;
    change.name = j.value("name", "");
    change.kind = parseChangeKindString(j.value("kind", "modified"));
    change.field = j.value("field", "");
    change.before = j.contains("before") ? j.at("before") : nlohmann::json();
    change.after = j.contains("after") ? j.at("after") : nlohmann::json();
}

inline void to_json(nlohmann::json &j, const TrackStatus &status)
{
    j = nlohmann::json{
        {"track", toTrackString(status.track)},
        {"phase", toPhaseString(status.phase)},
        {"degraded", status.degraded},
        {"degradedReason", status.degradedReason},
        {"head", status.head ? nlohmann::json(*status.head) : nlohmann::json()},
        {"currentCheckpoint",
         status.currentCheckpoint ? nlohmann::json(*status.currentCheckpoint)
                                  : nlohmann::json()}
    };
}

} // namespace nettrack
