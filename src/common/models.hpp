#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace nettrack {

struct InterfaceRecord {
    std::string name;
    std::string type;
    std::string state;
    int mtu = 0;
    std::string macAddress;
    std::vector<std::string> ipv4Addresses;
    std::vector<std::string> ipv6Addresses;
    // Backend specific attributes that have no dedicated field.
    nlohmann::json extra = nlohmann::json::object();
};

struct GlobalSettings {
    std::string hostname;
    std::vector<std::string> dnsServers;
    std::vector<std::string> dnsSearch;
    std::vector<std::string> dnsOptions;
    nlohmann::json routes = nlohmann::json::array();
};

// Full snapshot of network configuration at one instant. Treated as
// immutable once captured; equality is defined on the canonical form
// (see json_utils.hpp), which excludes capturedAt.
struct NetworkState {
    std::vector<InterfaceRecord> interfaces;
    GlobalSettings globals;
    std::chrono::system_clock::time_point capturedAt;
};

// The entities a settle needs to refresh.
struct ChangeScope {
    std::set<std::string> interfaces;
    bool global = false;
    bool full = false;

    bool empty() const
    {
        return interfaces.empty() && !global && !full;
    }

    void merge(const ChangeScope &other)
    {
        interfaces.insert(other.interfaces.begin(), other.interfaces.end());
        global = global || other.global;
        full = full || other.full;
    }
};

struct ChangeEvent {
    ChangeSource source = ChangeSource::ExternalTool;
    // Interface name, or empty when the change affects global settings.
    std::string interfaceName;
    std::chrono::system_clock::time_point timestamp;
    // Link events only.
    std::optional<bool> linkUp;
    std::string detail;
};

struct Commit {
    std::string id;
    std::string parentId;
    std::int64_t sequence = 0;
    std::chrono::system_clock::time_point timestamp;
    NetworkState state;
};

// A weak reference into a track's history: an identifier plus the commit
// it resolves to. Never owns the state.
struct Checkpoint {
    std::string id;
    std::string label;
    std::string commitId;
    std::string parentCheckpointId;
    std::chrono::system_clock::time_point createdAt;
};

struct FieldChange {
    ScopeKind scopeKind = ScopeKind::Interface;
    std::string name;
    ChangeKind kind = ChangeKind::Modified;
    // Dotted path inside the record; empty for whole-record add/remove.
    std::string field;
    nlohmann::json before;
    nlohmann::json after;
};

struct TrackStatus {
    Track track = Track::NonVolatile;
    TrackingPhase phase = TrackingPhase::Idle;
    bool degraded = false;
    std::string degradedReason;
    std::optional<std::string> head;
    std::optional<std::string> currentCheckpoint;
};

} // namespace nettrack
