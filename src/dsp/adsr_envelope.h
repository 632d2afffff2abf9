#pragma once

#include <algorithm>
#include <cmath>

namespace dsp {

// Linear ADSR with an extra fast Shutdown stage used when a voice is stolen
class AdsrEnvelope {
public:
    enum class Stage { Idle, Attack, Decay, Sustain, Release, Shutdown };

    static constexpr float SHUTDOWN_SECONDS = 0.002f;

    struct Params {
        float attack = 0.005f;   // seconds
        float decay = 0.1f;      // seconds
        float sustain = 0.7f;    // level 0..1
        float release = 0.2f;    // seconds
    };

    AdsrEnvelope() { recalculate(); }

    void setSampleRate(float sampleRate) {
        sampleRate_ = sampleRate;
        recalculate();
    }

    void setParams(const Params& params) {
        params_.attack = std::max(0.001f, params.attack);
        params_.decay = std::max(0.001f, params.decay);
        params_.sustain = std::clamp(params.sustain, 0.0f, 1.0f);
        params_.release = std::max(0.001f, params.release);
        recalculate();
    }
    const Params& getParams() const { return params_; }

    void trigger() {
        stage_ = Stage::Attack;
    }

    void release() {
        if (stage_ != Stage::Idle && stage_ != Stage::Shutdown) {
            stage_ = Stage::Release;
            releaseStep_ = value_ * releaseRate_;
        }
    }

    // Ramps to zero within a couple of milliseconds
    void shutdown() {
        if (stage_ != Stage::Idle) {
            stage_ = Stage::Shutdown;
            shutdownStep_ = std::max(value_, 1.0e-6f) / std::max(1.0f, SHUTDOWN_SECONDS * sampleRate_);
        }
    }

    float process() {
        switch (stage_) {
            case Stage::Idle:
                value_ = 0.0f;
                break;

            case Stage::Attack:
                value_ += attackRate_;
                if (value_ >= 1.0f) {
                    value_ = 1.0f;
                    stage_ = Stage::Decay;
                }
                break;

            case Stage::Decay:
                value_ -= decayRate_;
                if (value_ <= params_.sustain) {
                    value_ = params_.sustain;
                    stage_ = Stage::Sustain;
                }
                break;

            case Stage::Sustain:
                value_ = params_.sustain;
                break;

            case Stage::Release:
                value_ -= releaseStep_;
                if (value_ <= 0.0f) {
                    value_ = 0.0f;
                    stage_ = Stage::Idle;
                }
                break;

            case Stage::Shutdown:
                value_ -= shutdownStep_;
                if (value_ <= 0.0f) {
                    value_ = 0.0f;
                    stage_ = Stage::Idle;
                }
                break;
        }
        return value_;
    }

    bool isActive() const { return stage_ != Stage::Idle; }
    bool isShuttingDown() const { return stage_ == Stage::Shutdown; }
    Stage getStage() const { return stage_; }
    float getValue() const { return value_; }

    void reset() {
        stage_ = Stage::Idle;
        value_ = 0.0f;
    }

private:
    void recalculate() {
        if (sampleRate_ <= 0.0f) return;
        attackRate_ = 1.0f / (params_.attack * sampleRate_);
        decayRate_ = (1.0f - params_.sustain) / (params_.decay * sampleRate_);
        releaseRate_ = 1.0f / (params_.release * sampleRate_);
    }

    Params params_;
    float sampleRate_ = 44100.0f;

    float attackRate_ = 0.0f;
    float decayRate_ = 0.0f;
    float releaseRate_ = 0.0f;
    float releaseStep_ = 0.0f;
    float shutdownStep_ = 0.0f;

    Stage stage_ = Stage::Idle;
    float value_ = 0.0f;
};

} // namespace dsp
