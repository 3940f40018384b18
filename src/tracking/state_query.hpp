#pragma once

#include "common/models.hpp"

namespace nettrack {

// Source of the live network state. Implementations throw CaptureError
// when the state cannot be read.
class StateQuery
{
public:
    virtual ~StateQuery() = default;

    // Capture the entities named by scope. A full scope returns the whole
    // state; otherwise only the listed interfaces (and globals when
    // scope.global is set) need to be populated.
    virtual NetworkState capture(const ChangeScope &scope) = 0;
};

// Fold a scoped capture into a base state. Listed interfaces present in the
// capture replace or add records; listed interfaces missing from it are
// removed. A full scope returns the capture unchanged.
NetworkState mergeScopedCapture(const NetworkState &base,
                                const NetworkState &captured,
                                const ChangeScope &scope);

} // namespace nettrack
