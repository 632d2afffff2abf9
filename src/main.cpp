// cadence_render - plays the demo project live or renders it to a WAV file

#include "audio/AudioService.h"
#include "audio/DemoProject.h"
#include "audio/EngineConfig.h"
#include "audio/EntityFactory.h"
#include "audio/Orchestrator.h"
#include "audio/RenderService.h"
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_events/juce_events.h>
#include <algorithm>
#include <atomic>

namespace {

constexpr double MAX_SECONDS = 600.0;

void log(const juce::String& message)
{
    juce::Logger::writeToLog(message);
}

void printUsage()
{
    log("Usage: cadence_render [--play | --export=<file.wav>] [options]\n"
        "  --seconds=<n>      stop after n seconds (default: when the song ends)\n"
        "  --bpm=<n>          tempo (default 128)\n"
        "  --period=<n>       device period size in frames (default 512)\n"
        "  --sample-rate=<n>  sample rate (default 44100)");
}

struct Options
{
    audio::EngineConfig config;
    juce::File exportFile;
    bool play = false;
    double seconds = 0.0;
    double bpm = audio::DemoProject::TEMPO_BPM;
};

juce::Result parseArguments(const juce::ArgumentList& args, Options& options)
{
    if (args.containsOption("--export"))
    {
        const auto path = args.getValueForOption("--export");
        if (path.isEmpty())
            return juce::Result::fail("--export needs a file name");
        options.exportFile = juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }
    options.play = args.containsOption("--play");

    if (!options.play && options.exportFile == juce::File())
        return juce::Result::fail("Nothing to do: pass --play or --export=<file.wav>");

    if (args.containsOption("--seconds"))
        options.seconds = juce::jlimit(0.0, MAX_SECONDS, args.getValueForOption("--seconds").getDoubleValue());
    if (args.containsOption("--bpm"))
        options.bpm = args.getValueForOption("--bpm").getDoubleValue();
    if (args.containsOption("--period"))
        options.config.periodSize = juce::jmax(16, args.getValueForOption("--period").getIntValue());
    if (args.containsOption("--sample-rate"))
        options.config.sampleRate = juce::jmax(8000.0, args.getValueForOption("--sample-rate").getDoubleValue());

    return juce::Result::ok();
}

juce::Result buildProject(audio::Orchestrator& orchestrator, const audio::EntityFactory& factory,
                          const Options& options, audio::DemoProject& demo)
{
    auto result = audio::DemoProject::build(orchestrator, factory, demo);
    if (result.failed())
        return result;
    orchestrator.updateTempo(model::Tempo(options.bpm));
    return juce::Result::ok();
}

//==============================================================================
// Offline rendering

juce::Result exportWav(const Options& options, const audio::EntityFactory& factory)
{
    audio::Orchestrator orchestrator(options.config.renderChunkSize);
    orchestrator.updateSampleRate(options.config.sampleRate);

    audio::DemoProject demo;
    auto result = buildProject(orchestrator, factory, options, demo);
    if (result.failed())
        return result;

    const auto sampleRate = options.config.sampleRate;
    const auto maxFrames = static_cast<int64_t>(
        (options.seconds > 0.0 ? options.seconds : MAX_SECONDS) * sampleRate);

    const auto& file = options.exportFile;
    if (!file.deleteFile())
        return juce::Result::fail("Could not replace " + file.getFullPathName());

    std::unique_ptr<juce::FileOutputStream> stream(file.createOutputStream());
    if (stream == nullptr)
        return juce::Result::fail("Could not open " + file.getFullPathName());

    juce::WavAudioFormat wav;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wav.createWriterFor(stream.get(), sampleRate,
                            static_cast<unsigned int>(audio::Orchestrator::NUM_CHANNELS), 16, {}, 0));
    if (writer == nullptr)
        return juce::Result::fail("Could not create a WAV writer");
    stream.release(); // the writer owns it now

    juce::AudioBuffer<float> block(audio::Orchestrator::NUM_CHANNELS, options.config.periodSize);
    int64_t framesWritten = 0;

    orchestrator.play();
    // Without --seconds, stop when the song does
    while (framesWritten < maxFrames && (options.seconds > 0.0 || orchestrator.isPerforming()))
    {
        const auto numFrames = static_cast<int>(std::min<int64_t>(options.config.periodSize, maxFrames - framesWritten));
        block.setSize(audio::Orchestrator::NUM_CHANNELS, numFrames, false, false, true);
        orchestrator.render(block);

        if (!writer->writeFromAudioSampleBuffer(block, 0, numFrames))
            return juce::Result::fail("Write failed");
        framesWritten += numFrames;
    }

    log("Wrote " + juce::String(static_cast<double>(framesWritten) / sampleRate, 2)
        + " seconds to " + file.getFullPathName());
    return juce::Result::ok();
}

//==============================================================================
// Live playback

class PlaybackMonitor : public audio::RenderService::Listener
{
public:
    void performingChanged(bool isPerforming) override
    {
        if (isPerforming)
            started_ = true;
        else if (started_)
            finished_ = true;
    }

    void underrun() override { ++underruns_; }

    bool isFinished() const { return finished_; }
    int getUnderrunCount() const { return underruns_; }

private:
    std::atomic<bool> started_ { false };
    std::atomic<bool> finished_ { false };
    std::atomic<int> underruns_ { 0 };
};

juce::Result playLive(Options options, const audio::EntityFactory& factory)
{
    juce::AudioDeviceManager deviceManager;
    auto error = deviceManager.initialiseWithDefaultDevices(0, options.config.outputChannels);
    if (error.isNotEmpty())
        return juce::Result::fail("Audio device: " + error);

    auto setup = deviceManager.getAudioDeviceSetup();
    setup.bufferSize = options.config.periodSize;
    setup.sampleRate = options.config.sampleRate;
    error = deviceManager.setAudioDeviceSetup(setup, true);
    if (error.isNotEmpty())
        log("Using the device's own settings: " + error);

    if (auto* device = deviceManager.getCurrentAudioDevice())
    {
        options.config.sampleRate = device->getCurrentSampleRate();
        log("Playing on " + device->getName() + " at " + juce::String(options.config.sampleRate) + " Hz");
    }

    audio::AudioService audioService(options.config);
    audio::RenderService renderService(options.config, audioService, factory);
    PlaybackMonitor monitor;
    renderService.addListener(&monitor);

    audio::DemoProject demo;
    auto result = juce::Result::ok();
    renderService.modifyProject([&](audio::Orchestrator& o) { result = buildProject(o, factory, options, demo); });
    if (result.failed())
        return result;

    if (!renderService.startThread())
        return juce::Result::fail("Could not start the render thread");

    deviceManager.addAudioCallback(&audioService);
    if (!renderService.sendCommand(audio::RenderService::Command::play()))
        log("Render thread is not taking commands");

    const auto startMs = juce::Time::getMillisecondCounterHiRes();
    const double limitMs = (options.seconds > 0.0 ? options.seconds : MAX_SECONDS) * 1000.0;
    while (!monitor.isFinished() && juce::Time::getMillisecondCounterHiRes() - startMs < limitMs)
        juce::Thread::sleep(20);

    deviceManager.removeAudioCallback(&audioService);
    if (!renderService.sendCommand(audio::RenderService::Command::quit()))
        renderService.signalThreadShouldExit();
    renderService.stopThread(2000);
    renderService.removeListener(&monitor);

    if (monitor.getUnderrunCount() > 0)
        log(juce::String(monitor.getUnderrunCount()) + " underruns");
    return juce::Result::ok();
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ArgumentList args(argc, argv);
    if (args.containsOption("--help|-h"))
    {
        printUsage();
        return 0;
    }

    Options options;
    auto result = parseArguments(args, options);
    if (result.failed())
    {
        log(result.getErrorMessage());
        printUsage();
        return 1;
    }

    juce::ScopedJuceInitialiser_GUI juceInit;

    audio::EntityFactory factory;
    audio::registerBuiltInEntities(factory);

    if (options.exportFile != juce::File())
    {
        result = exportWav(options, factory);
        if (result.failed())
        {
            log("Export failed: " + result.getErrorMessage());
            return 1;
        }
    }

    if (options.play)
    {
        result = playLive(options, factory);
        if (result.failed())
        {
            log("Playback failed: " + result.getErrorMessage());
            return 1;
        }
    }

    return 0;
}
