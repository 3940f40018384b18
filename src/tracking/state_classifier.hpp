#pragma once

#include <optional>

#include "common/models.hpp"

namespace nettrack {

class StateClassifier
{
public:
    explicit StateClassifier(bool trackConfigDirectory = false);

    // Deterministic: the same event always lands on the same route.
    TrackRoute classify(const ChangeEvent &event) const;

    // The store a route commits to; nullopt for the bootstrap-only route.
    static std::optional<Track> trackFor(TrackRoute route);

    bool tracksConfigDirectory() const
    {
        return m_trackConfigDirectory;
    }

private:
    bool m_trackConfigDirectory;
};

} // namespace nettrack
