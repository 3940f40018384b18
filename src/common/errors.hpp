#pragma once

#include <stdexcept>
#include <string>

namespace nettrack {

class StoreError : public std::runtime_error
{
public:
    enum class Kind {
        ParentNotFound,
        CheckpointNotFound,
        EmptyHistory,
        StoreIOFailure
    };

    StoreError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    Kind kind() const
    {
        return m_kind;
    }

private:
    Kind m_kind;
};

class TrackingError : public std::runtime_error
{
public:
    enum class Kind {
        CaptureFailed,
        SuspensionLeak,
        TrackDegraded
    };

    TrackingError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    Kind kind() const
    {
        return m_kind;
    }

private:
    Kind m_kind;
};

// Thrown by state-query collaborators when the live state cannot be read.
class CaptureError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

inline const char *toString(StoreError::Kind kind)
{
    switch (kind) {
    case StoreError::Kind::ParentNotFound:
        return "parent_not_found";
    case StoreError::Kind::CheckpointNotFound:
        return "checkpoint_not_found";
    case StoreError::Kind::EmptyHistory:
        return "empty_history";
    case StoreError::Kind::StoreIOFailure:
        return "store_io_failure";
    }
    return "store_io_failure";
}

inline const char *toString(TrackingError::Kind kind)
{
    switch (kind) {
    case TrackingError::Kind::CaptureFailed:
        return "capture_failed";
    case TrackingError::Kind::SuspensionLeak:
        return "suspension_leak";
    case TrackingError::Kind::TrackDegraded:
        return "track_degraded";
    }
    return "capture_failed";
}

} // namespace nettrack
