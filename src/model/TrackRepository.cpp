#include "TrackRepository.h"
#include <algorithm>

namespace model {

TrackUid TrackRepository::createTrack()
{
    auto uid = uidFactory_.mintNext();
    trackUids_.push_back(uid);
    return uid;
}

juce::Result TrackRepository::insertTrack(TrackUid uid)
{
    if (!uid.isValid() || contains(uid))
        return juce::Result::fail("Duplicate track uid");

    uidFactory_.notifyExternallyMintedUid(uid);
    trackUids_.push_back(uid);
    return juce::Result::ok();
}

juce::Result TrackRepository::deleteTrack(TrackUid uid)
{
    auto it = std::find(trackUids_.begin(), trackUids_.end(), uid);
    if (it == trackUids_.end())
        return juce::Result::fail("Track not found");

    trackUids_.erase(it);
    return juce::Result::ok();
}

juce::Result TrackRepository::setTrackPosition(TrackUid uid, int newPosition)
{
    auto it = std::find(trackUids_.begin(), trackUids_.end(), uid);
    if (it == trackUids_.end())
        return juce::Result::fail("Track not found");

    if (newPosition < 0 || newPosition > getTrackCount())
        return juce::Result::fail("Position out of bounds");

    trackUids_.erase(it);
    // Removing may have shortened the list past the requested slot
    auto position = std::min(static_cast<size_t>(newPosition), trackUids_.size());
    trackUids_.insert(trackUids_.begin() + static_cast<std::ptrdiff_t>(position), uid);
    return juce::Result::ok();
}

bool TrackRepository::contains(TrackUid uid) const
{
    return std::find(trackUids_.begin(), trackUids_.end(), uid) != trackUids_.end();
}

int TrackRepository::getTrackPosition(TrackUid uid) const
{
    auto it = std::find(trackUids_.begin(), trackUids_.end(), uid);
    if (it == trackUids_.end())
        return -1;
    return static_cast<int>(it - trackUids_.begin());
}

} // namespace model
