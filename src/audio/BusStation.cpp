#include "BusStation.h"
#include <algorithm>

namespace audio {

void BusStation::addSend(model::TrackUid source, model::TrackUid auxTrack, float amount)
{
    auto& routes = sends_[source];
    for (auto& route : routes)
    {
        if (route.auxTrack == auxTrack)
        {
            route.amount = amount;
            return;
        }
    }
    routes.push_back({ auxTrack, amount });
}

void BusStation::removeSend(model::TrackUid source, model::TrackUid auxTrack)
{
    auto it = sends_.find(source);
    if (it == sends_.end())
        return;

    auto& routes = it->second;
    routes.erase(std::remove_if(routes.begin(), routes.end(),
                                [auxTrack](const BusRoute& r) { return r.auxTrack == auxTrack; }),
                 routes.end());
}

void BusStation::removeSendsForTrack(model::TrackUid track)
{
    sends_.erase(track);
    for (auto& [source, routes] : sends_)
    {
        routes.erase(std::remove_if(routes.begin(), routes.end(),
                                    [track](const BusRoute& r) { return r.auxTrack == track; }),
                     routes.end());
    }
}

const std::vector<BusRoute>* BusStation::getSendsFor(model::TrackUid source) const
{
    auto it = sends_.find(source);
    return it != sends_.end() ? &it->second : nullptr;
}

} // namespace audio
