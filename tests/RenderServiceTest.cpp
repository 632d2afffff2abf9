#include <gtest/gtest.h>
#include "../src/audio/RenderService.h"
#include "../src/audio/ToneSynth.h"
#include "TestEntities.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace audio;
using testentities::RecordingEntity;

namespace {

EngineConfig makeConfig() {
    EngineConfig config;
    config.periodSize = 64;
    config.renderChunkSize = 16;
    return config;
}

class RecordingListener : public RenderService::Listener {
public:
    void performingChanged(bool isPerforming) override { performing.push_back(isPerforming); }
    void underrun() override { ++underruns; }
    void entityAdded(model::Uid uid, const std::string& key) override { added.emplace_back(uid, key); }

    std::vector<bool> performing;
    int underruns = 0;
    std::vector<std::pair<model::Uid, std::string>> added;
};

// Signals once the transport starts
class StartListener : public RenderService::Listener {
public:
    void performingChanged(bool isPerforming) override {
        if (isPerforming)
            started.signal();
    }

    juce::WaitableEvent started;
};

} // namespace

// Apart from ListenersChangeWhileRunning, the thread is never started; processPending() runs its loop body directly
class RenderServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerBuiltInEntities(factory);
        renderer.addListener(&listener);
    }

    void TearDown() override {
        renderer.removeListener(&listener);
    }

    model::TrackUid createTrack() {
        model::TrackUid track;
        renderer.modifyProject([&track](Orchestrator& o) { track = o.createTrack(); });
        return track;
    }

    EngineConfig config { makeConfig() };
    EntityFactory factory;
    AudioService audioService { config };
    RenderService renderer { config, audioService, factory };
    RecordingListener listener;
};

TEST_F(RenderServiceTest, NothingPending) {
    EXPECT_FALSE(renderer.processPending());
}

// The audio service's first request is rendered straight into the queue
TEST_F(RenderServiceTest, AnswersFrameRequests) {
    audioService.start(48000.0, 2);
    EXPECT_TRUE(renderer.processPending());

    EXPECT_EQ(audioService.getQueue().getNumReady(), 64);
    renderer.readProject([](const Orchestrator& o) {
        EXPECT_DOUBLE_EQ(o.getSampleRate(), 48000.0);
    });
}

TEST_F(RenderServiceTest, PlayAndPause) {
    audioService.setPaused(true);

    EXPECT_TRUE(renderer.sendCommand(RenderService::Command::play()));
    renderer.processPending();

    EXPECT_FALSE(audioService.isPaused());
    renderer.readProject([](const Orchestrator& o) { EXPECT_TRUE(o.isPerforming()); });
    ASSERT_EQ(listener.performing.size(), 1u);
    EXPECT_TRUE(listener.performing[0]);

    renderer.sendCommand(RenderService::Command::pause());
    renderer.processPending();
    EXPECT_TRUE(audioService.isPaused());
    renderer.readProject([](const Orchestrator& o) { EXPECT_TRUE(o.isPerforming()); });

    renderer.sendCommand(RenderService::Command::stop());
    renderer.processPending();
    ASSERT_EQ(listener.performing.size(), 2u);
    EXPECT_FALSE(listener.performing[1]);
}

TEST_F(RenderServiceTest, AddEntityUsesFactory) {
    const auto track = createTrack();

    renderer.sendCommand(RenderService::Command::addEntity(track, ToneSynth::TYPE_NAME));
    renderer.processPending();

    ASSERT_EQ(listener.added.size(), 1u);
    EXPECT_EQ(listener.added[0].second, "tone-synth");

    const auto uid = listener.added[0].first;
    renderer.modifyProject([uid](Orchestrator& o) {
        auto* entity = o.getEntity(uid);
        ASSERT_NE(entity, nullptr);
        EXPECT_STREQ(entity->getTypeName(), "tone-synth");
    });
}

TEST_F(RenderServiceTest, AddUnknownEntityIsIgnored) {
    const auto track = createTrack();

    renderer.sendCommand(RenderService::Command::addEntity(track, "theremin"));
    renderer.processPending();

    EXPECT_TRUE(listener.added.empty());
    renderer.readProject([track](const Orchestrator& o) {
        EXPECT_TRUE(o.getEntitiesForTrack(track).empty());
    });
}

// Entities cannot be added to a track that does not exist
TEST_F(RenderServiceTest, AddEntityToMissingTrack) {
    renderer.sendCommand(RenderService::Command::addEntity(model::TrackUid(99), ToneSynth::TYPE_NAME));
    renderer.processPending();
    EXPECT_TRUE(listener.added.empty());
}

TEST_F(RenderServiceTest, MidiCommandReachesReceiver) {
    const auto track = createTrack();
    RecordingEntity* recorder = nullptr;

    renderer.modifyProject([&](Orchestrator& o) {
        auto entity = std::make_unique<RecordingEntity>();
        recorder = entity.get();
        model::Uid uid;
        ASSERT_TRUE(o.addEntity(track, std::move(entity), &uid).wasOk());
        ASSERT_TRUE(o.setMidiReceiverChannel(uid, 3).wasOk());
    });

    renderer.sendCommand(RenderService::Command::midi(3, juce::MidiMessage::noteOn(4, 60, 0.5f)));
    renderer.processPending();

    ASSERT_NE(recorder, nullptr);
    ASSERT_EQ(recorder->received.size(), 1u);
    EXPECT_EQ(recorder->received[0].first, 3);
    EXPECT_TRUE(recorder->received[0].second.isNoteOn());
}

TEST_F(RenderServiceTest, ForwardsUnderruns) {
    float left[16] = {};
    float right[16] = {};
    float* channels[] = { left, right };
    audioService.fillOutput(channels, 2, 16);

    renderer.processPending();
    EXPECT_EQ(listener.underruns, 1);
    EXPECT_GT(audioService.getQueue().getNumReady(), 0) << "The request after an underrun is rendered too";
}

TEST_F(RenderServiceTest, SetSampleRate) {
    renderer.sendCommand(RenderService::Command::setSampleRate(96000.0));
    renderer.processPending();
    renderer.readProject([](const Orchestrator& o) { EXPECT_DOUBLE_EQ(o.getSampleRate(), 96000.0); });
}

// Listeners can be registered from another thread while the render thread runs
TEST_F(RenderServiceTest, ListenersChangeWhileRunning) {
    renderer.startThread();

    StartListener late;
    renderer.addListener(&late);
    ASSERT_TRUE(renderer.sendCommand(RenderService::Command::play()));
    EXPECT_TRUE(late.started.wait(2000)) << "Render thread never reported the transport starting";
    renderer.removeListener(&late);

    ASSERT_TRUE(renderer.sendCommand(RenderService::Command::quit()));
    EXPECT_TRUE(renderer.waitForThreadToExit(2000));
}
