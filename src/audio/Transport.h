#pragma once

#include "../model/Time.h"
#include <cstdint>

namespace audio {

// The project clock: musical-time cursor plus frame counter
class Transport
{
public:
    Transport() = default;

    // Returns the musical time covered by the next frameCount frames. The
    // cursor only moves while performing; a stopped transport keeps reporting
    // the same range so interactive devices stay responsive.
    model::TimeRange advance(int frameCount);

    void play() { performing_ = true; }
    // Stops, or rewinds to the start when already stopped
    void stop();
    void skipToStart();
    bool isPerforming() const { return performing_; }

    model::MusicalTime getCurrentTime() const { return currentTime_; }
    uint64_t getCurrentFrame() const { return currentFrame_; }

    void updateSampleRate(double sampleRate) { sampleRate_ = sampleRate; }
    void updateTempo(model::Tempo tempo) { tempo_ = tempo; }
    void updateTimeSignature(model::TimeSignature ts) { timeSignature_ = ts; }

    double getSampleRate() const { return sampleRate_; }
    model::Tempo getTempo() const { return tempo_; }
    model::TimeSignature getTimeSignature() const { return timeSignature_; }

private:
    model::Tempo tempo_;
    model::TimeSignature timeSignature_;
    double sampleRate_ = model::DEFAULT_SAMPLE_RATE;

    model::MusicalTime currentTime_;
    uint64_t currentFrame_ = 0;
    bool performing_ = false;
};

} // namespace audio
