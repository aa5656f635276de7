#include "core/MixerBus.h"

#include <algorithm>
#include <cmath>

namespace sympathetic {

CompressorSettings MixerBus::LimiterSettings()
{
    CompressorSettings settings;
    settings.threshold_db = -3.0F;
    settings.knee_db = 6.0F;
    settings.ratio = 12.0F;
    settings.attack_seconds = 0.003F;
    settings.release_seconds = 0.1F;
    return settings;
}

MixerBus::MixerBus(AudioContext& context,
                   const std::array<MixerChannel, kNumOscillators>& channels,
                   const SynthOptions& options)
    : context_(context), settings_(channels)
{
    for (auto& channel : settings_) {
        if (!std::isfinite(channel.volume)) {
            channel.volume = MixerChannel{}.volume;
        }
        channel.volume = std::clamp(channel.volume, 0.0F, 1.0F);
    }
    if (std::isfinite(options.master_volume)) {
        masterVolume_ = std::clamp(options.master_volume, 0.0F, 1.0F);
    }

    limiter_ = context_.createCompressor(LimiterSettings());
    master_ = context_.createGain(masterVolume_);

    for (int slot = 0; slot < kNumOscillators; ++slot) {
        const auto& channel = settings_[static_cast<std::size_t>(slot)];
        auto gain = context_.createGain(channel.active ? channel.volume : 0.0F);
        context_.connect(gain, limiter_);
        channels_[static_cast<std::size_t>(slot)] = std::move(gain);
    }

    context_.connect(limiter_, master_);

    if (options.speakers_on) {
        context_.connect(master_, context_.destination());
    } else {
        output_ = context_.createGain(1.0);
        context_.connect(master_, output_);
    }
}

MixerBus::~MixerBus()
{
    for (const auto& channel : channels_) {
        context_.disconnect(channel);
    }
    context_.disconnect(limiter_);
    context_.disconnect(master_);
    if (output_ != nullptr) {
        context_.disconnect(output_);
    }
}

bool MixerBus::validSlot(const int slot) noexcept
{
    return slot >= 0 && slot < kNumOscillators;
}

bool MixerBus::setChannelVolume(const int slot, const float volume)
{
    if (!validSlot(slot)) {
        return false;
    }
    // Non-finite input keeps the current volume.
    if (!std::isfinite(volume)) {
        return true;
    }
    settings_[static_cast<std::size_t>(slot)].volume =
        std::clamp(volume, 0.0F, 1.0F);
    applyChannelGain(slot);
    return true;
}

bool MixerBus::setChannelActive(const int slot, const bool active)
{
    if (!validSlot(slot)) {
        return false;
    }
    settings_[static_cast<std::size_t>(slot)].active = active;
    applyChannelGain(slot);
    return true;
}

void MixerBus::setVolume(const float volume)
{
    if (!std::isfinite(volume)) {
        return;
    }
    masterVolume_ = std::clamp(volume, 0.0F, 1.0F);
    master_->gain().setValue(masterVolume_);
}

const MixerChannel& MixerBus::channelSettings(const int slot) const
{
    return settings_.at(static_cast<std::size_t>(slot));
}

const std::shared_ptr<GainNode>& MixerBus::channel(const int slot) const
{
    return channels_.at(static_cast<std::size_t>(slot));
}

void MixerBus::applyChannelGain(const int slot)
{
    const auto index = static_cast<std::size_t>(slot);
    const auto& channel = settings_[index];
    channels_[index]->gain().setValue(channel.active ? channel.volume : 0.0F);
}

}  // namespace sympathetic
