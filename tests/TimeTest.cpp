#include <gtest/gtest.h>
#include "../src/model/Time.h"

using namespace model;

// 22050 frames at 120 BPM and 44.1kHz is exactly one beat
TEST(TimeTest, FramesToMusicalTime) {
    const auto t = MusicalTime::fromFrames(Tempo(120.0), 44100.0, 22050);
    EXPECT_EQ(t.totalUnits(), MusicalTime::UNITS_IN_BEAT);
    EXPECT_EQ(t.totalBeats(), 1u);
}

TEST(TimeTest, MusicalTimeToFrames) {
    EXPECT_EQ(MusicalTime::fromBeats(2).toFrames(Tempo(120.0), 44100.0), 44100u);
    EXPECT_EQ(MusicalTime::fromParts(8).toFrames(Tempo(120.0), 44100.0), 11025u);
}

// Converting back and forth loses at most a frame
TEST(TimeTest, FrameConversionIsClose) {
    const Tempo tempo(128.0);
    for (uint64_t frames : { 1ull, 64ull, 12345ull, 441000ull }) {
        const auto t = MusicalTime::fromFrames(tempo, 44100.0, frames);
        const auto back = t.toFrames(tempo, 44100.0);
        EXPECT_LE(back > frames ? back - frames : frames - back, 1u) << "frames=" << frames;
    }
}

TEST(TimeTest, ZeroSampleRateGivesZeroTime) {
    EXPECT_EQ(MusicalTime::fromFrames(Tempo(120.0), 0.0, 1000), MusicalTime());
}

TEST(TimeTest, SixteenthIsQuarterBeat) {
    auto t = MusicalTime::start();
    for (int i = 0; i < 4; ++i)
        t += MusicalTime::sixteenth();
    EXPECT_EQ(t, MusicalTime::fromBeats(1));
}

TEST(TimeTest, QuantizeToBar) {
    const TimeSignature fourFour;
    EXPECT_EQ(MusicalTime::fromBeats(5).quantizedToBar(fourFour), MusicalTime::fromBeats(8));
    EXPECT_EQ(MusicalTime::fromBeats(4).quantizedToBar(fourFour), MusicalTime::fromBeats(4));
    EXPECT_EQ(MusicalTime::start().quantizedToBar(fourFour), MusicalTime::start());

    const TimeSignature threeFour(3, 4);
    EXPECT_EQ(MusicalTime::fromParts(1).quantizedToBar(threeFour), MusicalTime::fromBeats(3));
}

TEST(TimeTest, BarsAndBeats) {
    const TimeSignature ts(3, 4);
    const auto t = MusicalTime::fromBeats(7) + MusicalTime::fromParts(5);
    EXPECT_EQ(t.bars(ts), 2u);
    EXPECT_EQ(t.beatInBar(ts), 1u);
    EXPECT_EQ(t.partsInBeat(), 5u);
    EXPECT_EQ(MusicalTime::fromBars(ts, 2), MusicalTime::fromBeats(6));
}

// Arithmetic saturates instead of wrapping
TEST(TimeTest, SaturatingArithmetic) {
    EXPECT_EQ(MusicalTime::max() + MusicalTime::fromBeats(1), MusicalTime::max());
    EXPECT_EQ(MusicalTime::fromBeats(1) - MusicalTime::fromBeats(2), MusicalTime::start());
    EXPECT_EQ(MusicalTime::fromBeats(3) - MusicalTime::fromBeats(1), MusicalTime::fromBeats(2));
}

TEST(TimeTest, ToString) {
    const auto t = MusicalTime::fromBeats(3) + MusicalTime::fromParts(2) + MusicalTime::fromUnits(7);
    EXPECT_EQ(t.toString(), juce::String("3.2.7"));
}

TEST(TimeTest, TimeSignatureValidity) {
    EXPECT_TRUE(TimeSignature(4, 4).isValid().wasOk());
    EXPECT_TRUE(TimeSignature(7, 8).isValid().wasOk());
    EXPECT_TRUE(TimeSignature(1, 512).isValid().wasOk());

    EXPECT_TRUE(TimeSignature(0, 4).isValid().failed());
    EXPECT_TRUE(TimeSignature(3, 5).isValid().failed());
    EXPECT_TRUE(TimeSignature(4, 1024).isValid().failed());
    EXPECT_TRUE(TimeSignature(4, 0).isValid().failed());
}

// Ranges are half open
TEST(TimeTest, TimeRangeContains) {
    const TimeRange range(MusicalTime::fromBeats(1), MusicalTime::fromBeats(2));
    EXPECT_TRUE(range.contains(MusicalTime::fromBeats(1)));
    EXPECT_FALSE(range.contains(MusicalTime::fromBeats(2)));
    EXPECT_FALSE(range.contains(MusicalTime::start()));
    EXPECT_EQ(range.length(), MusicalTime::fromBeats(1));
    EXPECT_FALSE(range.isEmpty());
    EXPECT_TRUE(TimeRange().isEmpty());
}
