#pragma once

#include "Uid.h"
#include <juce_core/juce_core.h>
#include <vector>

namespace model {

// Owns the ordered list of tracks. A track's entity chain is kept by the
// EntityRepository, keyed by TrackUid.
class TrackRepository
{
public:
    TrackRepository() = default;

    TrackUid createTrack();

    // Adds a track whose uid was minted elsewhere (e.g. loaded from disk)
    juce::Result insertTrack(TrackUid uid);

    juce::Result deleteTrack(TrackUid uid);

    // Removes the track and reinserts it at newPosition, which may be at most
    // the current track count.
    juce::Result setTrackPosition(TrackUid uid, int newPosition);

    bool contains(TrackUid uid) const;
    int getTrackPosition(TrackUid uid) const;  // -1 if unknown
    int getTrackCount() const { return static_cast<int>(trackUids_.size()); }
    const std::vector<TrackUid>& getTrackUids() const { return trackUids_; }

    void clear() { trackUids_.clear(); }

private:
    UidFactory<TrackUid> uidFactory_;
    std::vector<TrackUid> trackUids_;
};

} // namespace model
