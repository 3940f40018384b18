#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace nettrack {

/**
 * Semantic difference between two states. Interfaces are matched by name;
 * matched interfaces are compared field by field (nested objects produce
 * dotted field paths). Output is ordered by interface name, then field,
 * with global settings last. Inputs are never modified.
 */
std::vector<FieldChange> diffStates(const NetworkState &a, const NetworkState &b);

// Swap the direction of every change.
std::vector<FieldChange> invertChanges(const std::vector<FieldChange> &changes);

// Replay changes onto a state. Throws std::runtime_error if a modification
// targets an interface the state does not have.
NetworkState applyChanges(const NetworkState &base, const std::vector<FieldChange> &changes);

// One line, e.g. "modified eth0 (state: up -> down)".
std::string describeChange(const FieldChange &change);

} // namespace nettrack
