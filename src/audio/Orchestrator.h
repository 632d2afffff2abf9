#pragma once

#include "Automator.h"
#include "BusStation.h"
#include "EngineConfig.h"
#include "MidiRouter.h"
#include "Mixer.h"
#include "Transport.h"
#include "../model/Entity.h"
#include "../model/EntityRepository.h"
#include "../model/TrackRepository.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace audio {

// Owns the whole project graph (tracks, entities, routing, automation) and
// turns it into audio one buffer at a time.
class Orchestrator
{
public:
    static constexpr int NUM_CHANNELS = 2;

    using MidiOutFn = std::function<void(model::MidiChannel, const juce::MidiMessage&)>;

    explicit Orchestrator(int renderChunkSize = EngineConfig::DEFAULT_RENDER_CHUNK_SIZE);

    // Tracks
    model::TrackUid createTrack();
    model::TrackUid createAuxTrack();
    juce::Result insertTrack(model::TrackUid uid, bool isAux);
    // Also deletes the track's entities, sends and mixer state
    juce::Result deleteTrack(model::TrackUid track);
    juce::Result setTrackPosition(model::TrackUid track, int newPosition);
    bool isAuxTrack(model::TrackUid track) const { return auxTrackUids_.count(track) > 0; }
    const std::vector<model::TrackUid>& getTrackUids() const { return tracks_.getTrackUids(); }

    // Entities
    juce::Result addEntity(model::TrackUid track, std::unique_ptr<model::Entity> entity,
                           model::Uid* assignedUid = nullptr);
    juce::Result moveEntity(model::Uid uid, std::optional<model::TrackUid> newTrack,
                            std::optional<int> newPosition);
    juce::Result removeEntity(model::Uid uid, std::unique_ptr<model::Entity>& removed);
    juce::Result deleteEntity(model::Uid uid);
    model::Entity* getEntity(model::Uid uid) { return entities_.getEntity(uid); }
    const std::vector<model::Uid>& getEntitiesForTrack(model::TrackUid track) const
    {
        return entities_.getEntitiesForTrack(track);
    }

    // Routing
    juce::Result addSend(model::TrackUid source, model::TrackUid auxTrack, float amount);
    void removeSend(model::TrackUid source, model::TrackUid auxTrack) { busStation_.removeSend(source, auxTrack); }
    juce::Result link(model::Uid source, model::Uid target, model::ControlIndex param);
    void unlink(model::Uid source, model::Uid target, model::ControlIndex param) { automator_.unlink(source, target, param); }
    juce::Result setMidiReceiverChannel(model::Uid uid, std::optional<model::MidiChannel> channel);

    // MIDI arriving from outside the engine
    juce::Result routeMidi(model::MidiChannel channel, const juce::MidiMessage& message);
    void allNotesOff();
    void setMidiOutCallback(MidiOutFn fn) { midiOut_ = std::move(fn); }

    // Transport
    void play();
    // Stops, or rewinds everything when already stopped
    void stop();
    void skipToStart();
    bool isPerforming() const { return transport_.isPerforming(); }
    bool isFinished() const { return entities_.isFinished(); }

    void updateSampleRate(double sampleRate);
    void updateTempo(model::Tempo tempo);
    juce::Result updateTimeSignature(model::TimeSignature timeSignature);
    double getSampleRate() const { return transport_.getSampleRate(); }
    model::Tempo getTempo() const { return transport_.getTempo(); }
    model::TimeSignature getTimeSignature() const { return transport_.getTimeSignature(); }

    // Rendering. render() clears output and fills it in chunks, each chunk
    // running the controllers and then generate(). Returns whether anything
    // non-silent was produced.
    bool render(juce::AudioBuffer<float>& output);
    // Advances the clock and runs every controller once
    void handleControllers(int frameCount);
    // Instruments, effects, sends, aux tracks and the final mix, added into output
    bool generate(juce::AudioBuffer<float>& output);

    // Persistence hooks
    void beforeSer();
    void afterDeser();
    void reset();
    void clear();

    int getRenderChunkSize() const { return renderChunkSize_; }

    Transport& getTransport() { return transport_; }
    Mixer& getMixer() { return mixer_; }
    const Mixer& getMixer() const { return mixer_; }
    Humidifier& getHumidifier() { return humidifier_; }
    const Humidifier& getHumidifier() const { return humidifier_; }
    BusStation& getBusStation() { return busStation_; }
    const BusStation& getBusStation() const { return busStation_; }
    Automator& getAutomator() { return automator_; }
    const Automator& getAutomator() const { return automator_; }
    MidiRouter& getMidiRouter() { return midiRouter_; }
    const MidiRouter& getMidiRouter() const { return midiRouter_; }
    model::EntityRepository& getEntityRepository() { return entities_; }
    const model::EntityRepository& getEntityRepository() const { return entities_; }

private:
    void dispatchPendingEvents();
    juce::AudioBuffer<float>& prepareTrackBuffer(model::TrackUid track, int numSamples);
    void runChain(model::TrackUid track, juce::AudioBuffer<float>& buffer, bool generateAudio);
    void forgetEntity(model::Uid uid);

    int renderChunkSize_;

    Transport transport_;
    model::TrackRepository tracks_;
    model::EntityRepository entities_;
    std::set<model::TrackUid> auxTrackUids_;
    BusStation busStation_;
    Humidifier humidifier_;
    Mixer mixer_;
    Automator automator_;
    MidiRouter midiRouter_;
    MidiOutFn midiOut_;

    std::map<model::TrackUid, juce::AudioBuffer<float>> trackBuffers_;
    juce::AudioBuffer<float> chunkBuffer_;
    std::vector<std::pair<model::Uid, model::WorkEvent>> entityEvents_;
    std::vector<std::pair<model::PathUid, model::WorkEvent>> pathEvents_;
};

} // namespace audio
