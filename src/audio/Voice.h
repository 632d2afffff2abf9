#pragma once

namespace audio {

// One note's worth of synthesis state inside a polyphonic instrument
class Voice
{
public:
    virtual ~Voice() = default;

    virtual void setSampleRate(double sampleRate) = 0;

    // Calling noteOn on a playing voice is a steal: the voice must shut its
    // current note down quickly and then start the new one.
    virtual void noteOn(int note, float velocity) = 0;
    virtual void noteOff(float velocity) = 0;
    virtual void aftertouch(float /*pressure*/) {}
    virtual void setPitchBend(float /*semitones*/) {}

    virtual bool isPlaying() const = 0;

    // Writes numSamples into outL/outR (added to what is there)
    virtual void render(float* outL, float* outR, int numSamples) = 0;
};

} // namespace audio
