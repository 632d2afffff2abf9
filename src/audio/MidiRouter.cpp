#include "MidiRouter.h"
#include <algorithm>
#include <deque>

namespace audio {

void MidiRouter::setMidiReceiverChannel(model::Uid uid, std::optional<model::MidiChannel> channel)
{
    if (!channel.has_value())
    {
        for (auto& [ch, receivers] : midiReceivers_)
            receivers.erase(std::remove(receivers.begin(), receivers.end(), uid), receivers.end());
        uidToChannel_.erase(uid);
        return;
    }

    // Adds to any channels uid already listens on
    auto& receivers = midiReceivers_[*channel];
    if (std::find(receivers.begin(), receivers.end(), uid) == receivers.end())
        receivers.push_back(uid);
    uidToChannel_[uid] = *channel;
}

std::optional<model::MidiChannel> MidiRouter::getReceiverChannel(model::Uid uid) const
{
    auto it = uidToChannel_.find(uid);
    if (it == uidToChannel_.end())
        return std::nullopt;
    return it->second;
}

std::vector<model::MidiChannel> MidiRouter::getReceiverChannels(model::Uid uid) const
{
    std::vector<model::MidiChannel> channels;
    for (const auto& [channel, receivers] : midiReceivers_)
    {
        if (std::find(receivers.begin(), receivers.end(), uid) != receivers.end())
            channels.push_back(channel);
    }
    return channels;
}

const std::vector<model::Uid>& MidiRouter::getReceiversForChannel(model::MidiChannel channel) const
{
    static const std::vector<model::Uid> none;
    auto it = midiReceivers_.find(channel);
    return it != midiReceivers_.end() ? it->second : none;
}

juce::Result MidiRouter::route(model::EntityRepository& entities, model::MidiChannel channel,
                               const juce::MidiMessage& message)
{
    std::deque<std::pair<model::MidiChannel, juce::MidiMessage>> pending;
    pending.emplace_back(channel, message);
    bool loopDetected = false;

    while (!pending.empty())
    {
        const auto currentChannel = pending.front().first;
        const auto currentMessage = pending.front().second;
        pending.pop_front();

        auto it = midiReceivers_.find(currentChannel);
        if (it == midiReceivers_.end())
            continue;

        // Copy: a receiver may change routing while handling the message
        const auto receivers = it->second;
        for (auto uid : receivers)
        {
            auto* entity = entities.getEntity(uid);
            if (entity == nullptr)
                continue;

            entity->handleMidiMessage(currentChannel, currentMessage,
                [&pending, &loopDetected, currentChannel, uid](model::MidiChannel outChannel,
                                                               const juce::MidiMessage& outMessage)
                {
                    if (outChannel == currentChannel)
                    {
                        DBG("Entity " << uid.toString() << " tried to send MIDI to its own channel "
                                      << currentChannel);
                        loopDetected = true;
                    }
                    else
                    {
                        pending.emplace_back(outChannel, outMessage);
                    }
                });
        }
    }

    if (loopDetected)
        return juce::Result::fail("Device attempted to send MIDI message to itself");
    return juce::Result::ok();
}

void MidiRouter::allNotesOff(model::EntityRepository& entities)
{
    for (int channel = 0; channel < model::MIDI_CHANNEL_COUNT; ++channel)
    {
        auto result = route(entities, channel, juce::MidiMessage::allNotesOff(channel + 1));
        if (result.failed())
            DBG("All notes off on channel " << channel << ": " << result.getErrorMessage());
    }
}

void MidiRouter::afterDeser()
{
    uidToChannel_.clear();
    for (const auto& [channel, receivers] : midiReceivers_)
        for (auto uid : receivers)
            uidToChannel_[uid] = channel;
}

void MidiRouter::clear()
{
    midiReceivers_.clear();
    uidToChannel_.clear();
}

} // namespace audio
