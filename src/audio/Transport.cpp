#include "Transport.h"

namespace audio {

model::TimeRange Transport::advance(int frameCount)
{
    const uint64_t frames = frameCount > 0 ? static_cast<uint64_t>(frameCount) : 0;
    const uint64_t newFrame = currentFrame_ + frames;
    const auto newTime = model::MusicalTime::fromFrames(tempo_, sampleRate_, newFrame);
    const auto length = newTime >= currentTime_ ? newTime - currentTime_ : model::MusicalTime();

    model::TimeRange range(currentTime_, currentTime_ + length);

    if (performing_)
    {
        currentFrame_ = newFrame;
        currentTime_ = newTime;
    }
    return range;
}

void Transport::stop()
{
    if (performing_)
        performing_ = false;
    else
        skipToStart();
}

void Transport::skipToStart()
{
    currentTime_ = model::MusicalTime();
    currentFrame_ = 0;
}

} // namespace audio
