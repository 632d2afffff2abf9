#pragma once

#include "../model/Uid.h"
#include <map>
#include <vector>

namespace audio {

// A scaled copy of one track's audio sent into an aux track
struct BusRoute
{
    model::TrackUid auxTrack;
    float amount = 0.0f;
};

class BusStation
{
public:
    // Adding a send to an aux track that already has one from source
    // replaces its amount
    void addSend(model::TrackUid source, model::TrackUid auxTrack, float amount);
    void removeSend(model::TrackUid source, model::TrackUid auxTrack);
    // Removes every send from or to track
    void removeSendsForTrack(model::TrackUid track);

    const std::map<model::TrackUid, std::vector<BusRoute>>& getSends() const { return sends_; }
    const std::vector<BusRoute>* getSendsFor(model::TrackUid source) const;

    void clear() { sends_.clear(); }

private:
    std::map<model::TrackUid, std::vector<BusRoute>> sends_;
};

} // namespace audio
