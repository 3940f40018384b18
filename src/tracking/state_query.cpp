#include "tracking/state_query.hpp"

#include <algorithm>
#include <map>

namespace nettrack {

NetworkState mergeScopedCapture(const NetworkState &base,
                                const NetworkState &captured,
                                const ChangeScope &scope)
{
    if (scope.full) {
        return captured;
    }

    std::map<std::string, InterfaceRecord> capturedByName;
    for (const auto &iface : captured.interfaces) {
        capturedByName[iface.name] = iface;
    }

    NetworkState merged;
    merged.capturedAt = captured.capturedAt;
    merged.globals = scope.global ? captured.globals : base.globals;

    for (const auto &iface : base.interfaces) {
        if (scope.interfaces.count(iface.name) == 0) {
            merged.interfaces.push_back(iface);
            continue;
        }
        auto it = capturedByName.find(iface.name);
        if (it != capturedByName.end()) {
            merged.interfaces.push_back(it->second);
            capturedByName.erase(it);
        }
    }

    for (const auto &name : scope.interfaces) {
        auto it = capturedByName.find(name);
        if (it != capturedByName.end()) {
            merged.interfaces.push_back(it->second);
        }
    }

    std::stable_sort(merged.interfaces.begin(), merged.interfaces.end(),
                     [](const InterfaceRecord &a, const InterfaceRecord &b) {
                         return a.name < b.name;
                     });
    return merged;
}

} // namespace nettrack
