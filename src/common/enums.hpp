#pragma once

namespace nettrack {

// Where a change notification came from.
enum class ChangeSource {
    UserRequest,
    ExternalTool,
    ConfigDirectory,
    NetlinkLinkStatus,
    DhcpLease
};

enum class Track {
    Volatile,
    NonVolatile
};

// Result of classifying a change. ConfigBootstrap means the change is only
// honoured by the one-shot apply at daemon start and is not tracked.
enum class TrackRoute {
    Volatile,
    NonVolatile,
    ConfigBootstrap
};

enum class ChangeKind {
    Added,
    Removed,
    Modified
};

enum class ScopeKind {
    Interface,
    Global
};

enum class TrackingPhase {
    Idle,
    Suspended,
    Debouncing,
    Capturing
};

} // namespace nettrack
