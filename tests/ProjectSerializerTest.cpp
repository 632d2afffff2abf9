#include <gtest/gtest.h>
#include "../src/audio/DemoProject.h"
#include "../src/audio/GainEffect.h"
#include "../src/audio/LfoController.h"
#include "../src/audio/PatternSequencer.h"
#include "../src/audio/ProjectSerializer.h"
#include "../src/audio/ToneSynth.h"
#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

using namespace audio;
using model::MusicalTime;

class ProjectSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerBuiltInEntities(factory);
    }

    template <typename E>
    model::Uid add(Orchestrator& o, model::TrackUid track, std::unique_ptr<E> entity) {
        model::Uid uid;
        auto result = o.addEntity(track, std::move(entity), &uid);
        EXPECT_TRUE(result.wasOk()) << result.getErrorMessage();
        return uid;
    }

    // Saves source and loads it into loaded
    void roundTrip() {
        const auto json = ProjectSerializer::toJson(source);
        auto result = ProjectSerializer::fromJson(loaded, factory, json);
        ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    }

    static std::vector<float> render(Orchestrator& o, int numBlocks) {
        std::vector<float> samples;
        juce::AudioBuffer<float> buffer(Orchestrator::NUM_CHANNELS, 512);
        o.play();
        for (int block = 0; block < numBlocks; ++block) {
            o.render(buffer);
            for (int i = 0; i < buffer.getNumSamples(); ++i)
                samples.push_back(buffer.getSample(0, i));
        }
        return samples;
    }

    EntityFactory factory;
    Orchestrator source;
    Orchestrator loaded;
};

TEST_F(ProjectSerializerTest, EmptyProject) {
    roundTrip();
    EXPECT_TRUE(loaded.getTrackUids().empty());
}

// Track order and kind, and the mixer settings on each track
TEST_F(ProjectSerializerTest, TracksAndMixer) {
    const auto first = source.createTrack();
    const auto aux = source.createAuxTrack();
    const auto second = source.createTrack();
    ASSERT_TRUE(source.setTrackPosition(second, 0).wasOk());

    source.getMixer().setTrackOutput(first, 0.25f);
    source.getMixer().setTrackMuted(aux, true);
    source.getMixer().setSoloTrack(first);
    ASSERT_TRUE(source.addSend(first, aux, 0.4f).wasOk());
    source.updateTempo(model::Tempo(96.0));
    ASSERT_TRUE(source.updateTimeSignature(model::TimeSignature(3, 4)).wasOk());

    roundTrip();

    EXPECT_EQ(loaded.getTrackUids(), (std::vector<model::TrackUid> { second, first, aux }));
    EXPECT_TRUE(loaded.isAuxTrack(aux));
    EXPECT_FALSE(loaded.isAuxTrack(first));
    EXPECT_NEAR(loaded.getMixer().getTrackOutput(first), 0.25f, 1.0e-6f);
    EXPECT_TRUE(loaded.getMixer().isTrackMuted(aux));
    ASSERT_TRUE(loaded.getMixer().getSoloTrack().has_value());
    EXPECT_EQ(*loaded.getMixer().getSoloTrack(), first);
    EXPECT_DOUBLE_EQ(loaded.getTempo().bpm, 96.0);
    EXPECT_EQ(loaded.getTimeSignature().top, 3);

    const auto* sends = loaded.getBusStation().getSendsFor(first);
    ASSERT_NE(sends, nullptr);
    ASSERT_EQ(sends->size(), 1u);
    EXPECT_EQ((*sends)[0].auxTrack, aux);
    EXPECT_NEAR((*sends)[0].amount, 0.4f, 1.0e-6f);

    // New tracks never reuse a loaded uid
    const auto fresh = loaded.createTrack();
    EXPECT_NE(fresh, first);
    EXPECT_NE(fresh, second);
    EXPECT_NE(fresh, aux);
}

// Entities come back under their old uids with parameters, state and routing
TEST_F(ProjectSerializerTest, EntitiesAndRouting) {
    const auto track = source.createTrack();

    auto sequencer = std::make_unique<PatternSequencer>();
    sequencer->record(5, model::Pattern::fromNoteSequence({ 60, 64, 67 }, MusicalTime::sixteenth()),
                      MusicalTime::fromBeats(4));
    const auto sequencerUid = add(source, track, std::move(sequencer));

    auto synth = std::make_unique<ToneSynth>();
    synth->setParameter(ToneSynth::kGain, 0.3f);
    synth->setParameter(ToneSynth::kPan, 0.7f);
    const auto synthUid = add(source, track, std::move(synth));
    const auto gainUid = add(source, track, std::make_unique<GainEffect>(0.6f));
    const auto lfoUid = add(source, track, std::make_unique<LfoController>());

    ASSERT_TRUE(source.setMidiReceiverChannel(synthUid, 5).wasOk());
    source.getHumidifier().setHumidity(gainUid, 0.35f);
    ASSERT_TRUE(source.link(lfoUid, synthUid, ToneSynth::kPan).wasOk());

    roundTrip();

    EXPECT_EQ(loaded.getEntitiesForTrack(track),
              (std::vector<model::Uid> { sequencerUid, synthUid, gainUid, lfoUid }));

    auto* loadedSynth = loaded.getEntity(synthUid);
    ASSERT_NE(loadedSynth, nullptr);
    EXPECT_STREQ(loadedSynth->getTypeName(), "tone-synth");
    EXPECT_NEAR(loadedSynth->getParameter(ToneSynth::kGain), 0.3f, 1.0e-6f);
    EXPECT_NEAR(loadedSynth->getParameter(ToneSynth::kPan), 0.7f, 1.0e-6f);

    auto* loadedGain = loaded.getEntity(gainUid);
    ASSERT_NE(loadedGain, nullptr);
    EXPECT_NEAR(loadedGain->getParameter(GainEffect::kGain), 0.6f, 1.0e-6f);
    EXPECT_NEAR(loaded.getHumidifier().getHumidity(gainUid), 0.35f, 1.0e-6f);

    auto* loadedSequencer = dynamic_cast<PatternSequencer*>(loaded.getEntity(sequencerUid));
    ASSERT_NE(loadedSequencer, nullptr);
    ASSERT_EQ(loadedSequencer->getArrangements().size(), 1u);
    EXPECT_EQ(loadedSequencer->getArrangements()[0].channel, 5);
    EXPECT_EQ(loadedSequencer->getArrangements()[0].position, MusicalTime::fromBeats(4));
    EXPECT_EQ(loadedSequencer->getEvents().size(), 6u);

    const auto channel = loaded.getMidiRouter().getReceiverChannel(synthUid);
    ASSERT_TRUE(channel.has_value());
    EXPECT_EQ(*channel, 5);

    const auto& links = loaded.getAutomator().getLinks(lfoUid);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].target, synthUid);
    EXPECT_EQ(links[0].param, ToneSynth::kPan);

    // New entities never reuse a loaded uid
    model::Uid fresh;
    ASSERT_TRUE(loaded.addEntity(track, std::make_unique<GainEffect>(), &fresh).wasOk());
    EXPECT_TRUE(lfoUid < fresh);
}

TEST_F(ProjectSerializerTest, SignalPaths) {
    const auto track = source.createTrack();
    const auto gainUid = add(source, track, std::make_unique<GainEffect>());

    auto& automator = source.getAutomator();
    const auto pathUid = automator.addPath(SignalPathBuilder()
                                               .point(MusicalTime::start(), 0.0f)
                                               .point(MusicalTime::fromBeats(4), 1.0f)
                                               .build());
    ASSERT_TRUE(automator.linkPath(pathUid, gainUid, GainEffect::kGain).wasOk());

    roundTrip();

    auto* path = loaded.getAutomator().getPath(pathUid);
    ASSERT_NE(path, nullptr);
    ASSERT_EQ(path->getPoints().size(), 2u);
    EXPECT_EQ(path->getPoints()[1].when, MusicalTime::fromBeats(4));
    EXPECT_NEAR(path->getPoints()[1].value, 1.0f, 1.0e-6f);
    ASSERT_TRUE(path->calculateValue(MusicalTime::fromBeats(2)).has_value());
    EXPECT_NEAR(*path->calculateValue(MusicalTime::fromBeats(2)), 0.5f, 1.0e-5f);
    EXPECT_TRUE(loaded.getAutomator().isPathLinked(pathUid, gainUid, GainEffect::kGain));
}

// Links left behind by a deleted entity do not stop the project loading
TEST_F(ProjectSerializerTest, LinksToDeletedEntitiesAreDropped) {
    const auto track = source.createTrack();
    const auto lfoUid = add(source, track, std::make_unique<LfoController>());
    const auto keptUid = add(source, track, std::make_unique<GainEffect>());
    const auto deletedUid = add(source, track, std::make_unique<GainEffect>());

    ASSERT_TRUE(source.link(lfoUid, keptUid, GainEffect::kGain).wasOk());
    ASSERT_TRUE(source.link(lfoUid, deletedUid, GainEffect::kGain).wasOk());

    auto& automator = source.getAutomator();
    const auto pathUid = automator.addPath(SignalPathBuilder().point(MusicalTime::start(), 0.5f).build());
    ASSERT_TRUE(automator.linkPath(pathUid, deletedUid, GainEffect::kGain).wasOk());

    ASSERT_TRUE(source.deleteEntity(deletedUid).wasOk());
    ASSERT_EQ(source.getAutomator().getLinks(lfoUid).size(), 2u);

    roundTrip();

    ASSERT_EQ(loaded.getEntitiesForTrack(track).size(), 2u);
    const auto& links = loaded.getAutomator().getLinks(lfoUid);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].target, keptUid);
    ASSERT_NE(loaded.getAutomator().getPath(pathUid), nullptr);
    EXPECT_TRUE(loaded.getAutomator().getPathLinks(pathUid).empty());
}

// A file that still names a missing entity in its links loads without them
TEST_F(ProjectSerializerTest, LoadSkipsLinksToMissingEntities) {
    const auto track = source.createTrack();
    const auto gainUid = add(source, track, std::make_unique<GainEffect>());

    auto root = ProjectSerializer::toVar(source);

    juce::DynamicObject::Ptr link = new juce::DynamicObject();
    link->setProperty("source", 4242);
    link->setProperty("target", static_cast<juce::int64>(gainUid.value));
    link->setProperty("param", GainEffect::kGain);
    root.getDynamicObject()->setProperty("links", juce::Array<juce::var> { juce::var(link.get()) });

    auto result = ProjectSerializer::fromJson(loaded, factory, juce::JSON::toString(root));
    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    EXPECT_EQ(loaded.getEntitiesForTrack(track).size(), 1u);
    EXPECT_TRUE(loaded.getAutomator().getAllLinks().empty());
}

// A receiver listening on several channels keeps all of them
TEST_F(ProjectSerializerTest, MidiChannelsRoundTrip) {
    const auto track = source.createTrack();
    const auto synthUid = add(source, track, std::make_unique<ToneSynth>());
    ASSERT_TRUE(source.setMidiReceiverChannel(synthUid, 1).wasOk());
    ASSERT_TRUE(source.setMidiReceiverChannel(synthUid, 9).wasOk());

    roundTrip();

    EXPECT_EQ(loaded.getMidiRouter().getReceiverChannels(synthUid), (std::vector<model::MidiChannel> { 1, 9 }));
}

// A loaded project sounds exactly like the one that was saved
TEST_F(ProjectSerializerTest, DemoRendersTheSame) {
    source.updateSampleRate(44100.0);
    DemoProject demo;
    ASSERT_TRUE(DemoProject::build(source, factory, demo).wasOk());

    roundTrip();
    loaded.updateSampleRate(44100.0);

    const auto expected = render(source, 32);
    const auto actual = render(loaded, 32);
    ASSERT_EQ(actual.size(), expected.size());

    float maxDiff = 0.0f;
    for (size_t i = 0; i < expected.size(); ++i)
        maxDiff = std::max(maxDiff, std::abs(expected[i] - actual[i]));
    EXPECT_LT(maxDiff, 1.0e-5f);
}

// A project naming a type the factory cannot build loads nothing at all
TEST_F(ProjectSerializerTest, UnknownEntityTypeFails) {
    const auto track = source.createTrack();
    add(source, track, std::make_unique<GainEffect>());

    auto json = ProjectSerializer::toJson(source);
    json = json.replace("\"gain\"", "\"theremin\"");

    loaded.createTrack();
    auto result = ProjectSerializer::fromJson(loaded, factory, json);
    EXPECT_TRUE(result.failed());
    EXPECT_EQ(result.getErrorMessage(), "Unknown entity type");
    EXPECT_TRUE(loaded.getTrackUids().empty()) << "A failed load leaves an empty project";
}

TEST_F(ProjectSerializerTest, InvalidJsonFails) {
    EXPECT_TRUE(ProjectSerializer::fromJson(loaded, factory, "{ \"tracks\": [").failed());
    EXPECT_TRUE(ProjectSerializer::fromJson(loaded, factory, "42").failed());
}

TEST_F(ProjectSerializerTest, SaveAndLoadFile) {
    const auto track = source.createTrack();
    add(source, track, std::make_unique<ToneSynth>());

    juce::TemporaryFile temp(".json");
    ASSERT_TRUE(ProjectSerializer::save(source, temp.getFile()).wasOk());

    auto result = ProjectSerializer::load(loaded, factory, temp.getFile());
    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    EXPECT_EQ(loaded.getEntitiesForTrack(track).size(), 1u);

    const auto missing = temp.getFile().getSiblingFile("does-not-exist.json");
    EXPECT_TRUE(ProjectSerializer::load(loaded, factory, missing).failed());
}
