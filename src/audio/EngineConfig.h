#pragma once

#include "../model/Time.h"

namespace audio {

struct EngineConfig
{
    static constexpr int SUGGESTED_PERIOD_SIZE = 512;
    static constexpr int DEFAULT_RENDER_CHUNK_SIZE = 64;

    double sampleRate = model::DEFAULT_SAMPLE_RATE;
    int periodSize = SUGGESTED_PERIOD_SIZE;
    // Frames rendered per orchestrator pass
    int renderChunkSize = DEFAULT_RENDER_CHUNK_SIZE;
    // Ring buffer holds periodSize * queueCapacityPeriods frames
    int queueCapacityPeriods = 3;
    int outputChannels = 2;

    int getQueueCapacity() const { return periodSize * queueCapacityPeriods; }
};

} // namespace audio
