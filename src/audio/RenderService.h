#pragma once

#include "AudioService.h"
#include "EngineConfig.h"
#include "EntityFactory.h"
#include "MessageQueue.h"
#include "Orchestrator.h"
#include <juce_core/juce_core.h>
#include <string>

namespace audio {

// The render thread. Owns the project, answers the audio service's frame
// requests and runs commands from the control thread. Everything that touches
// the orchestrator happens here or under the project lock.
class RenderService : public juce::Thread
{
public:
    static constexpr int COMMAND_QUEUE_SIZE = 256;

    struct Command
    {
        enum class Type { Play, Stop, Pause, Quit, SetSampleRate, Midi, AddEntity };

        Type type = Type::Play;
        double sampleRate = 0.0;
        model::MidiChannel channel = 0;
        juce::MidiMessage message;
        model::TrackUid track;
        std::string entityKey;

        static Command play() { return make(Type::Play); }
        static Command stop() { return make(Type::Stop); }
        static Command pause() { return make(Type::Pause); }
        static Command quit() { return make(Type::Quit); }

        static Command setSampleRate(double sampleRate)
        {
            auto c = make(Type::SetSampleRate);
            c.sampleRate = sampleRate;
            return c;
        }

        static Command midi(model::MidiChannel channel, const juce::MidiMessage& message)
        {
            auto c = make(Type::Midi);
            c.channel = channel;
            c.message = message;
            return c;
        }

        static Command addEntity(model::TrackUid track, const std::string& key)
        {
            auto c = make(Type::AddEntity);
            c.track = track;
            c.entityKey = key;
            return c;
        }

    private:
        static Command make(Type type)
        {
            Command c;
            c.type = type;
            return c;
        }
    };

    // Called on the render thread
    class Listener
    {
    public:
        virtual ~Listener() = default;
        virtual void performingChanged(bool isPerforming) { juce::ignoreUnused(isPerforming); }
        virtual void midiOut(model::MidiChannel channel, const juce::MidiMessage& message)
        {
            juce::ignoreUnused(channel, message);
        }
        virtual void underrun() {}
        virtual void entityAdded(model::Uid uid, const std::string& key) { juce::ignoreUnused(uid, key); }
    };

    RenderService(const EngineConfig& config, AudioService& audioService, const EntityFactory& factory);
    ~RenderService() override;

    // False if the command queue is full
    bool sendCommand(const Command& command) { return commands_.push(command); }

    // Safe to call while the thread is running
    void addListener(Listener* listener) { listeners_.add(listener); }
    void removeListener(Listener* listener) { listeners_.remove(listener); }

    // Runs fn with exclusive access to the project
    template <typename Fn>
    void modifyProject(Fn&& fn)
    {
        const juce::ScopedWriteLock lock(projectLock_);
        fn(orchestrator_);
        notifyIfPerformingChanged();
    }

    // Runs fn with shared, read-only access to the project
    template <typename Fn>
    void readProject(Fn&& fn) const
    {
        const juce::ScopedReadLock lock(projectLock_);
        fn(static_cast<const Orchestrator&>(orchestrator_));
    }

    // Handles every pending command and audio event once. Returns whether
    // there was anything to do.
    bool processPending();

    void run() override;

private:
    void handleCommand(const Command& command);
    void handleEvent(const AudioService::Event& event);
    void renderFrames(int numFrames);
    void notifyIfPerformingChanged();

    EngineConfig config_;
    AudioService& audioService_;
    const EntityFactory& factory_;

    Orchestrator orchestrator_;
    juce::ReadWriteLock projectLock_;
    juce::AudioBuffer<float> renderBuffer_;

    MessageQueue<Command> commands_ { COMMAND_QUEUE_SIZE };
    juce::ListenerList<Listener, juce::Array<Listener*, juce::CriticalSection>> listeners_;
    bool wasPerforming_ = false;

    JUCE_DECLARE_NON_COPYABLE(RenderService)
};

} // namespace audio
