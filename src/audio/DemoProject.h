#pragma once

#include "EntityFactory.h"
#include "Orchestrator.h"

namespace audio {

// The two-track demo song: a drum track playing a 16-step kick pattern and a
// lead track playing an 8-note scale.
struct DemoProject
{
    static constexpr double TEMPO_BPM = 128.0;
    static constexpr int DRUM_CHANNEL = 9;
    static constexpr int LEAD_CHANNEL = 0;

    model::TrackUid drumTrack;
    model::TrackUid leadTrack;
    model::Uid drumSequencer;
    model::Uid drumKit;
    model::Uid leadSequencer;
    model::Uid leadSynth;

    // Length of the arrangement
    model::MusicalTime length;

    // Clears orchestrator and builds the demo into it
    static juce::Result build(Orchestrator& orchestrator, const EntityFactory& factory, DemoProject& demo);
};

} // namespace audio
