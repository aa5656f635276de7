#include "core/LfoRouter.h"

#include <juce_core/juce_core.h>

namespace sympathetic {

LfoRouter::LfoRouter(AudioContext& context, const LfoSettings& settings)
    : context_(context), settings_(settings)
{
    oscillator_ = context_.createOscillator(settings_.frequency,
                                            settings_.waveform);
    pitchBus_ = context_.createGain(settings_.depth);
    filterBus_ = context_.createGain(settings_.depth * kFilterDepthScale);

    context_.connect(oscillator_, pitchBus_);
    context_.connect(oscillator_, filterBus_);

    // Runs for the lifetime of the router; depth 0 keeps it inaudible.
    (void)oscillator_->start(context_.currentTime());
}

LfoRouter::~LfoRouter()
{
    for (auto& [id, taps] : taps_) {
        removeTaps(taps);
    }
    taps_.clear();

    (void)oscillator_->stop(context_.currentTime());
    context_.disconnect(oscillator_);
    context_.disconnect(pitchBus_);
    context_.disconnect(filterBus_);
}

void LfoRouter::update(const LfoPatch& patch)
{
    if (patch.waveform.has_value()) {
        settings_.waveform = *patch.waveform;
        oscillator_->setWaveform(settings_.waveform);
    }
    if (patch.frequency.has_value()) {
        settings_.frequency = *patch.frequency;
        oscillator_->frequency().setValue(settings_.frequency);
    }
    if (patch.depth.has_value()) {
        settings_.depth = *patch.depth;
        pitchBus_->gain().setValue(settings_.depth);
        filterBus_->gain().setValue(settings_.depth * kFilterDepthScale);
    }

    juce::Logger::writeToLog(
        juce::String("[sympathetic-core] LFO ") +
        WaveformName(settings_.waveform) + " freq=" +
        juce::String(settings_.frequency, 2) + "Hz depth=" +
        juce::String(settings_.depth, 2));
}

void LfoRouter::connectVoice(
    const VoiceId voice,
    const std::vector<std::shared_ptr<OscillatorNode>>& oscillators,
    const std::vector<std::shared_ptr<FilterNode>>& filters)
{
    (void)disconnectVoice(voice);

    VoiceTaps taps;
    taps.oscillators = oscillators;
    taps.filters = filters;

    for (const auto& osc : taps.oscillators) {
        if (osc != nullptr) {
            context_.connect(pitchBus_, osc, osc->detune());
        }
    }
    for (const auto& filter : taps.filters) {
        if (filter != nullptr) {
            context_.connect(filterBus_, filter, filter->frequency());
        }
    }

    taps_.emplace(voice, std::move(taps));
}

bool LfoRouter::disconnectVoice(const VoiceId voice)
{
    auto it = taps_.find(voice);
    if (it == taps_.end()) {
        return false;
    }
    removeTaps(it->second);
    taps_.erase(it);
    return true;
}

bool LfoRouter::isVoiceConnected(const VoiceId voice) const
{
    return taps_.find(voice) != taps_.end();
}

std::size_t LfoRouter::tapCount() const
{
    std::size_t count = 0;
    for (const auto& [id, taps] : taps_) {
        count += taps.oscillators.size() + taps.filters.size();
    }
    return count;
}

void LfoRouter::removeTaps(VoiceTaps& taps)
{
    for (const auto& osc : taps.oscillators) {
        if (osc != nullptr) {
            (void)context_.disconnect(pitchBus_, osc->detune());
        }
    }
    for (const auto& filter : taps.filters) {
        if (filter != nullptr) {
            (void)context_.disconnect(filterBus_, filter->frequency());
        }
    }
}

}  // namespace sympathetic
