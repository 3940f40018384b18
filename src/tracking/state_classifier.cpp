#include "tracking/state_classifier.hpp"

namespace nettrack {

StateClassifier::StateClassifier(bool trackConfigDirectory)
    : m_trackConfigDirectory(trackConfigDirectory)
{
}

TrackRoute StateClassifier::classify(const ChangeEvent &event) const
{
    switch (event.source) {
    case ChangeSource::UserRequest:
        // Explicit apply through the daemon is the only user-driven source.
        return TrackRoute::NonVolatile;
    case ChangeSource::ExternalTool:
    case ChangeSource::NetlinkLinkStatus:
    case ChangeSource::DhcpLease:
        return TrackRoute::Volatile;
    case ChangeSource::ConfigDirectory:
        return m_trackConfigDirectory ? TrackRoute::NonVolatile
                                      : TrackRoute::ConfigBootstrap;
    }
    return TrackRoute::Volatile;
}

std::optional<Track> StateClassifier::trackFor(TrackRoute route)
{
    switch (route) {
    case TrackRoute::Volatile:
        return Track::Volatile;
    case TrackRoute::NonVolatile:
        return Track::NonVolatile;
    case TrackRoute::ConfigBootstrap:
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace nettrack
