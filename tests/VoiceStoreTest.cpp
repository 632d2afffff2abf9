#include <gtest/gtest.h>
#include "../src/audio/VoiceStore.h"
#include <memory>
#include <vector>

using namespace audio;

namespace {

// Writes a constant level while held
class TestVoice : public Voice {
public:
    explicit TestVoice(float lvl = 0.25f) : level(lvl) {}

    void setSampleRate(double sr) override { sampleRate = sr; }
    void noteOn(int n, float velocity) override {
        (void)velocity;
        if (playing)
            ++steals;
        playing = true;
        note = n;
    }
    void noteOff(float velocity) override {
        (void)velocity;
        playing = false;
    }
    bool isPlaying() const override { return playing; }
    void render(float* outL, float* outR, int numSamples) override {
        for (int i = 0; i < numSamples; ++i) {
            outL[i] += level;
            outR[i] += level;
        }
    }

    float level;
    bool playing = false;
    int note = -1;
    int steals = 0;
    double sampleRate = 0.0;
};

std::vector<std::unique_ptr<TestVoice>> makeVoices(int count) {
    std::vector<std::unique_ptr<TestVoice>> voices;
    for (int i = 0; i < count; ++i)
        voices.push_back(std::make_unique<TestVoice>());
    return voices;
}

// Claims a voice for note and starts it
juce::Result play(VoiceStore<TestVoice>& store, int note, TestVoice** claimed = nullptr) {
    TestVoice* voice = nullptr;
    auto result = store.getVoice(note, voice);
    if (result.wasOk()) {
        voice->noteOn(note, 1.0f);
        if (claimed != nullptr)
            *claimed = voice;
    }
    return result;
}

} // namespace

class VoiceStoreTest : public ::testing::Test {
protected:
    static constexpr int NUM_VOICES = 4;
};

// N distinct held notes fit, the next one does not
TEST_F(VoiceStoreTest, FixedPoolRunsOut) {
    FixedVoiceStore<TestVoice> store(makeVoices(NUM_VOICES));

    std::vector<TestVoice*> claimed;
    for (int i = 0; i < NUM_VOICES; ++i) {
        TestVoice* voice = nullptr;
        EXPECT_TRUE(play(store, 60 + i, &voice).wasOk()) << "note " << 60 + i;
        claimed.push_back(voice);
    }
    for (int i = 1; i < NUM_VOICES; ++i)
        EXPECT_NE(claimed[static_cast<size_t>(i)], claimed[0]) << "Each note should get its own voice";

    auto result = play(store, 72);
    EXPECT_TRUE(result.failed());
    EXPECT_EQ(result.getErrorMessage(), juce::String("Out of voices"));
}

TEST_F(VoiceStoreTest, SameNoteReusesVoice) {
    FixedVoiceStore<TestVoice> store(makeVoices(NUM_VOICES));

    TestVoice* first = nullptr;
    TestVoice* second = nullptr;
    ASSERT_TRUE(play(store, 64, &first).wasOk());
    ASSERT_TRUE(play(store, 64, &second).wasOk());
    EXPECT_EQ(first, second);
    EXPECT_EQ(store.activeVoiceCount(), 1);
}

// A voice that went idle gives its slot back after the next generate
TEST_F(VoiceStoreTest, IdleVoiceIsReleased) {
    FixedVoiceStore<TestVoice> store(makeVoices(1));

    TestVoice* voice = nullptr;
    ASSERT_TRUE(play(store, 60, &voice).wasOk());
    EXPECT_TRUE(play(store, 62).failed());

    voice->noteOff(0.0f);
    juce::AudioBuffer<float> buffer(2, 32);
    buffer.clear();
    store.generate(buffer);

    EXPECT_EQ(store.getNotesPlaying()[0], PooledVoiceStore<TestVoice>::NO_NOTE);
    EXPECT_TRUE(play(store, 62).wasOk());
}

// The stealing pool never fails; by default it takes slot 0
TEST_F(VoiceStoreTest, StealingPoolReassigns) {
    auto voices = makeVoices(NUM_VOICES);
    auto* firstSlot = voices[0].get();
    StealingVoiceStore<TestVoice> store(std::move(voices));

    for (int i = 0; i < NUM_VOICES; ++i)
        ASSERT_TRUE(play(store, 60 + i).wasOk());

    TestVoice* stolen = nullptr;
    EXPECT_TRUE(play(store, 72, &stolen).wasOk());
    EXPECT_EQ(stolen, firstSlot);
    EXPECT_EQ(stolen->steals, 1) << "noteOn on a playing voice is a steal";
    EXPECT_EQ(store.getNotesPlaying()[0], 72);
}

TEST_F(VoiceStoreTest, StealPolicyIsReplaceable) {
    auto voices = makeVoices(NUM_VOICES);
    auto* lastSlot = voices.back().get();
    StealingVoiceStore<TestVoice> store(std::move(voices));
    store.setStealPolicy([](const std::vector<int>& notes) { return static_cast<int>(notes.size()) - 1; });

    for (int i = 0; i < NUM_VOICES; ++i)
        ASSERT_TRUE(play(store, 60 + i).wasOk());

    TestVoice* stolen = nullptr;
    ASSERT_TRUE(play(store, 80, &stolen).wasOk());
    EXPECT_EQ(stolen, lastSlot);
    EXPECT_EQ(store.getNotesPlaying().back(), 80);
}

TEST_F(VoiceStoreTest, VoicePerNote) {
    VoicePerNoteStore<TestVoice> store;
    store.addVoice(36, std::make_unique<TestVoice>());

    TestVoice* voice = nullptr;
    auto result = store.getVoice(38, voice);
    EXPECT_TRUE(result.failed());
    EXPECT_EQ(result.getErrorMessage(), juce::String("No voice for note"));
    EXPECT_EQ(voice, nullptr);

    EXPECT_TRUE(store.getVoice(36, voice).wasOk());
    EXPECT_NE(voice, nullptr);
    EXPECT_EQ(store.voiceCount(), 1);
}

// Rebinding a note replaces its voice
TEST_F(VoiceStoreTest, VoicePerNoteRebind) {
    VoicePerNoteStore<TestVoice> store;
    store.addVoice(36, std::make_unique<TestVoice>());
    auto replacement = std::make_unique<TestVoice>();
    auto* raw = replacement.get();
    store.addVoice(36, std::move(replacement));

    TestVoice* voice = nullptr;
    ASSERT_TRUE(store.getVoice(36, voice).wasOk());
    EXPECT_EQ(voice, raw);
    EXPECT_EQ(store.voiceCount(), 1);
    EXPECT_EQ(store.getVoiceAt(0), raw);
}

// Each voice renders into a cleared scratch buffer, so the mix is an exact sum
TEST_F(VoiceStoreTest, VoicesDoNotLeakIntoEachOther) {
    std::vector<std::unique_ptr<TestVoice>> voices;
    voices.push_back(std::make_unique<TestVoice>(0.25f));
    voices.push_back(std::make_unique<TestVoice>(0.5f));
    FixedVoiceStore<TestVoice> store(std::move(voices));

    ASSERT_TRUE(play(store, 60).wasOk());
    ASSERT_TRUE(play(store, 61).wasOk());

    juce::AudioBuffer<float> buffer(2, 64);
    buffer.clear();
    EXPECT_TRUE(store.generate(buffer));

    for (int ch = 0; ch < 2; ++ch)
        for (int i = 0; i < 64; ++i)
            EXPECT_FLOAT_EQ(buffer.getSample(ch, i), 0.75f) << "ch " << ch << " sample " << i;
}

TEST_F(VoiceStoreTest, SilentWhenIdle) {
    FixedVoiceStore<TestVoice> store(makeVoices(NUM_VOICES));
    juce::AudioBuffer<float> buffer(2, 64);
    buffer.clear();

    EXPECT_FALSE(store.generate(buffer));
    EXPECT_EQ(buffer.getMagnitude(0, 64), 0.0f);
}

TEST_F(VoiceStoreTest, SampleRateReachesVoices) {
    auto voices = makeVoices(2);
    auto* voice = voices[1].get();
    FixedVoiceStore<TestVoice> store(std::move(voices));

    store.setSampleRate(96000.0);
    EXPECT_EQ(voice->sampleRate, 96000.0);
}
