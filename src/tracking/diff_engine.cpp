#include "tracking/diff_engine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

#include "common/json_utils.hpp"

namespace nettrack {

namespace {

constexpr const char *kGlobalScopeName = "global";

// Nested objects are only descended into when their keys cannot be
// confused with the dotted path separator.
bool isPathSafeObject(const nlohmann::json &value)
{
    if (!value.is_object()) {
        return false;
    }
    for (const auto &item : value.items()) {
        if (item.key().find('.') != std::string::npos) {
            return false;
        }
    }
    return true;
}

void diffObjects(ScopeKind scopeKind,
                 const std::string &name,
                 const std::string &prefix,
                 const nlohmann::json &a,
                 const nlohmann::json &b,
                 std::vector<FieldChange> &out)
{
    std::set<std::string> keys;
    for (const auto &item : a.items()) {
        keys.insert(item.key());
    }
    for (const auto &item : b.items()) {
        keys.insert(item.key());
    }

    for (const auto &key : keys) {
        const nlohmann::json before = a.contains(key) ? a.at(key) : nlohmann::json();
        const nlohmann::json after = b.contains(key) ? b.at(key) : nlohmann::json();
        if (before == after) {
            continue;
        }
        if (isPathSafeObject(before) && isPathSafeObject(after)) {
            diffObjects(scopeKind, name, prefix + key + ".", before, after, out);
            continue;
        }
        out.push_back(FieldChange{scopeKind, name, ChangeKind::Modified,
                                  prefix + key, before, after});
    }
}

std::map<std::string, nlohmann::json> interfacesByName(const NetworkState &state)
{
    std::map<std::string, nlohmann::json> byName;
    for (const auto &iface : state.interfaces) {
        byName[iface.name] = canonicalInterfaceJson(iface);
    }
    return byName;
}

std::vector<std::string> splitPath(const std::string &path)
{
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        const auto dot = path.find('.', start);
        parts.push_back(path.substr(start, dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return parts;
}

// A null value removes the key.
void setPath(nlohmann::json &target, const std::string &path, const nlohmann::json &value)
{
    const auto parts = splitPath(path);
    nlohmann::json *node = &target;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        nlohmann::json &child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = nlohmann::json::object();
        }
        node = &child;
    }
    if (value.is_null()) {
        node->erase(parts.back());
    } else {
        (*node)[parts.back()] = value;
    }
}

} // namespace

std::vector<FieldChange> diffStates(const NetworkState &a, const NetworkState &b)
{
    std::vector<FieldChange> changes;

    const auto ifacesA = interfacesByName(a);
    const auto ifacesB = interfacesByName(b);

    std::set<std::string> names;
    for (const auto &[name, iface] : ifacesA) {
        names.insert(name);
    }
    for (const auto &[name, iface] : ifacesB) {
        names.insert(name);
    }

    for (const auto &name : names) {
        auto inA = ifacesA.find(name);
        auto inB = ifacesB.find(name);
        if (inB == ifacesB.end()) {
            changes.push_back(FieldChange{ScopeKind::Interface, name, ChangeKind::Removed,
                                          std::string(), inA->second, nlohmann::json()});
            continue;
        }
        if (inA == ifacesA.end()) {
            changes.push_back(FieldChange{ScopeKind::Interface, name, ChangeKind::Added,
                                          std::string(), nlohmann::json(), inB->second});
            continue;
        }

        nlohmann::json before = inA->second;
        nlohmann::json after = inB->second;
        before.erase("name");
        after.erase("name");
        diffObjects(ScopeKind::Interface, name, std::string(), before, after, changes);
    }

    diffObjects(ScopeKind::Global, kGlobalScopeName, std::string(),
                canonicalGlobalsJson(a.globals), canonicalGlobalsJson(b.globals), changes);
    return changes;
}

std::vector<FieldChange> invertChanges(const std::vector<FieldChange> &changes)
{
    std::vector<FieldChange> inverted;
    inverted.reserve(changes.size());
    for (const auto &change : changes) {
        FieldChange reversed = change;
        std::swap(reversed.before, reversed.after);
        if (change.kind == ChangeKind::Added) {
            reversed.kind = ChangeKind::Removed;
        } else if (change.kind == ChangeKind::Removed) {
            reversed.kind = ChangeKind::Added;
        }
        inverted.push_back(std::move(reversed));
    }
    return inverted;
}

NetworkState applyChanges(const NetworkState &base, const std::vector<FieldChange> &changes)
{
    auto ifaces = interfacesByName(base);
    nlohmann::json globals = canonicalGlobalsJson(base.globals);

    for (const auto &change : changes) {
        if (change.scopeKind == ScopeKind::Global) {
            setPath(globals, change.field, change.after);
            continue;
        }

        switch (change.kind) {
        case ChangeKind::Added: {
            nlohmann::json record = change.after;
            record["name"] = change.name;
            ifaces[change.name] = record;
            break;
        }
        case ChangeKind::Removed:
            ifaces.erase(change.name);
            break;
        case ChangeKind::Modified: {
            auto it = ifaces.find(change.name);
            if (it == ifaces.end()) {
                throw std::runtime_error("cannot modify missing interface " + change.name);
            }
            setPath(it->second, change.field, change.after);
            break;
        }
        }
    }

    NetworkState result;
    result.capturedAt = base.capturedAt;
    result.globals = globals.get<GlobalSettings>();
    for (const auto &[name, record] : ifaces) {
        result.interfaces.push_back(record.get<InterfaceRecord>());
    }
    return result;
}

std::string describeChange(const FieldChange &change)
{
    const std::string kind = toChangeKindString(change.kind);
    if (change.kind != ChangeKind::Modified) {
        return kind + " " + change.name;
    }

    auto render = [](const nlohmann::json &value) {
        if (value.is_null()) {
            return std::string("(none)");
        }
        if (value.is_string()) {
            return value.get<std::string>();
        }
        return dumpJson(value);
    };
    return kind + " " + change.name + " (" + change.field + ": " + render(change.before)
        + " -> " + render(change.after) + ")";
}

} // namespace nettrack
