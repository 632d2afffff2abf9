#include "DemoProject.h"
#include "PatternSequencer.h"
#include <algorithm>

namespace audio {

static const int R = model::Pattern::REST;

// Adds a factory-made entity to track and reports its uid
static juce::Result addFromFactory(Orchestrator& orchestrator, const EntityFactory& factory,
                                   model::TrackUid track, const char* key, model::Uid& uid)
{
    auto entity = factory.create(key);
    if (entity == nullptr)
        return juce::Result::fail("Unknown entity type");
    return orchestrator.addEntity(track, std::move(entity), &uid);
}

juce::Result DemoProject::build(Orchestrator& orchestrator, const EntityFactory& factory, DemoProject& demo)
{
    orchestrator.clear();
    orchestrator.updateTempo(model::Tempo(TEMPO_BPM));

    const auto ts = orchestrator.getTimeSignature();
    demo.drumTrack = orchestrator.createTrack();
    demo.leadTrack = orchestrator.createTrack();

    // Four on the floor, two bars
    auto kick = model::Pattern::fromNoteSequence(
        { 36, R, R, R, 36, R, R, R, 36, R, R, R, 36, R, R, R },
        model::MusicalTime::sixteenth(), "Kick");
    kick.setTimeSignature(ts);

    auto drums = std::make_unique<PatternSequencer>();
    const auto drumEnd = drums->recordSequence(DRUM_CHANNEL, { kick, kick }, model::MusicalTime::start());

    // C major, one note per beat
    auto scale = model::Pattern::fromNoteSequence(
        { 60, 62, 64, 65, 67, 69, 71, 72 },
        model::MusicalTime::fromBeats(1), "Scale");
    scale.setTimeSignature(ts);

    auto lead = std::make_unique<PatternSequencer>();
    const auto leadEnd = lead->recordSequence(LEAD_CHANNEL, { scale }, model::MusicalTime::start());

    demo.length = std::max(drumEnd, leadEnd);

    auto result = orchestrator.addEntity(demo.drumTrack, std::move(drums), &demo.drumSequencer);
    if (result.wasOk())
        result = addFromFactory(orchestrator, factory, demo.drumTrack, "drum-kit", demo.drumKit);
    if (result.wasOk())
        result = orchestrator.addEntity(demo.leadTrack, std::move(lead), &demo.leadSequencer);
    if (result.wasOk())
        result = addFromFactory(orchestrator, factory, demo.leadTrack, "tone-synth", demo.leadSynth);
    if (result.wasOk())
        result = orchestrator.setMidiReceiverChannel(demo.drumKit, DRUM_CHANNEL);
    if (result.wasOk())
        result = orchestrator.setMidiReceiverChannel(demo.leadSynth, LEAD_CHANNEL);

    return result;
}

} // namespace audio
