#include "RenderService.h"
#include <algorithm>

namespace audio {

RenderService::RenderService(const EngineConfig& config, AudioService& audioService,
                             const EntityFactory& factory)
    : juce::Thread("Render"),
      config_(config),
      audioService_(audioService),
      factory_(factory),
      orchestrator_(config.renderChunkSize),
      renderBuffer_(Orchestrator::NUM_CHANNELS, std::max(1, config.getQueueCapacity()))
{
    orchestrator_.updateSampleRate(config.sampleRate);
    orchestrator_.setMidiOutCallback([this](model::MidiChannel channel, const juce::MidiMessage& message)
    {
        listeners_.call([&](Listener& l) { l.midiOut(channel, message); });
    });
}

RenderService::~RenderService()
{
    // Give run() a moment to see the exit flag before it is forced
    stopThread(2000);
}

bool RenderService::processPending()
{
    bool didWork = false;

    Command command;
    while (commands_.pop(command))
    {
        handleCommand(command);
        didWork = true;
    }

    AudioService::Event event;
    while (audioService_.getEvent(event))
    {
        handleEvent(event);
        didWork = true;
    }

    return didWork;
}

void RenderService::run()
{
    while (!threadShouldExit())
    {
        if (!processPending())
            wait(1);
    }
}

void RenderService::handleCommand(const Command& command)
{
    switch (command.type)
    {
        case Command::Type::Play:
            modifyProject([](Orchestrator& o) { o.play(); });
            audioService_.setPaused(false);
            break;

        case Command::Type::Stop:
            modifyProject([](Orchestrator& o) { o.stop(); });
            break;

        case Command::Type::Pause:
            audioService_.setPaused(true);
            break;

        case Command::Type::Quit:
            signalThreadShouldExit();
            break;

        case Command::Type::SetSampleRate:
        {
            const double sampleRate = command.sampleRate;
            modifyProject([sampleRate](Orchestrator& o) { o.updateSampleRate(sampleRate); });
            break;
        }

        case Command::Type::Midi:
            modifyProject([&command](Orchestrator& o)
            {
                auto result = o.routeMidi(command.channel, command.message);
                if (result.failed())
                    DBG("MIDI input: " << result.getErrorMessage());
            });
            break;

        case Command::Type::AddEntity:
        {
            auto entity = factory_.create(command.entityKey);
            if (entity == nullptr)
            {
                DBG("Cannot add entity: " << juce::String(command.entityKey) << " is not a known type");
                break;
            }

            model::Uid uid;
            juce::Result result = juce::Result::ok();
            modifyProject([&](Orchestrator& o) { result = o.addEntity(command.track, std::move(entity), &uid); });

            if (result.failed())
                DBG("Cannot add " << juce::String(command.entityKey) << ": " << result.getErrorMessage());
            else
                listeners_.call([&](Listener& l) { l.entityAdded(uid, command.entityKey); });
            break;
        }
    }
}

void RenderService::handleEvent(const AudioService::Event& event)
{
    switch (event.type)
    {
        case AudioService::Event::Type::Reset:
        {
            const double sampleRate = event.sampleRate;
            DBG("Audio device started at " << sampleRate << " Hz, " << event.channelCount << " channels");
            modifyProject([sampleRate](Orchestrator& o) { o.updateSampleRate(sampleRate); });
            break;
        }

        case AudioService::Event::Type::FramesNeeded:
            renderFrames(event.frames);
            break;

        case AudioService::Event::Type::Underrun:
            DBG("Audio underrun");
            listeners_.call([](Listener& l) { l.underrun(); });
            break;
    }
}

void RenderService::renderFrames(int numFrames)
{
    if (numFrames <= 0)
        return;

    renderBuffer_.setSize(Orchestrator::NUM_CHANNELS, numFrames, false, false, true);
    modifyProject([this](Orchestrator& o) { o.render(renderBuffer_); });

    const int pushed = audioService_.pushFrames(renderBuffer_, numFrames);
    if (pushed < numFrames)
        DBG("Audio queue overrun: dropped " << (numFrames - pushed) << " frames");
}

void RenderService::notifyIfPerformingChanged()
{
    const bool performing = orchestrator_.isPerforming();
    if (performing == wasPerforming_)
        return;

    wasPerforming_ = performing;
    listeners_.call([performing](Listener& l) { l.performingChanged(performing); });
}

} // namespace audio
