// Naive (non band-limited) oscillator for the built-in devices

#pragma once

#include <cmath>

namespace dsp {

enum class Waveform {
    Sine = 0,
    Triangle,
    Saw,
    Square,
    NumWaveforms
};

class Oscillator {
public:
    void setSampleRate(float sampleRate) {
        sampleRate_ = sampleRate;
        updateIncrement();
    }

    void setFrequency(float frequency) {
        frequency_ = frequency;
        updateIncrement();
    }
    float getFrequency() const { return frequency_; }

    void setWaveform(Waveform waveform) { waveform_ = waveform; }
    Waveform getWaveform() const { return waveform_; }

    void reset() { phase_ = 0.0f; }

    // Returns -1..1 and advances one sample
    float process() {
        float output = 0.0f;
        switch (waveform_) {
            case Waveform::Sine:
                output = std::sin(phase_ * kTwoPi);
                break;
            case Waveform::Triangle:
                output = phase_ < 0.5f ? 4.0f * phase_ - 1.0f : 3.0f - 4.0f * phase_;
                break;
            case Waveform::Saw:
                output = 2.0f * phase_ - 1.0f;
                break;
            case Waveform::Square:
                output = phase_ < 0.5f ? 1.0f : -1.0f;
                break;
            default:
                break;
        }

        phase_ += increment_;
        while (phase_ >= 1.0f) {
            phase_ -= 1.0f;
        }
        return output;
    }

    static float noteToFrequency(float note) {
        return 440.0f * std::pow(2.0f, (note - 69.0f) / 12.0f);
    }

private:
    static constexpr float kTwoPi = 6.28318530718f;

    void updateIncrement() {
        increment_ = sampleRate_ > 0.0f ? frequency_ / sampleRate_ : 0.0f;
    }

    Waveform waveform_ = Waveform::Sine;
    float sampleRate_ = 44100.0f;
    float frequency_ = 440.0f;
    float increment_ = 440.0f / 44100.0f;
    float phase_ = 0.0f;
};

} // namespace dsp
