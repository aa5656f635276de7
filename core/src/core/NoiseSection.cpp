#include "core/NoiseSection.h"

#include <algorithm>
#include <cmath>

namespace sympathetic {

NoiseSection::NoiseSection(AudioContext& context,
                           const NoiseSettings& settings,
                           const std::shared_ptr<AudioNode>& sink)
    : context_(context), settings_(settings)
{
    const NoiseSettings defaults;
    if (!std::isfinite(settings_.level)) {
        settings_.level = defaults.level;
    }
    if (!std::isfinite(settings_.filter_frequency)) {
        settings_.filter_frequency = defaults.filter_frequency;
    }
    if (!std::isfinite(settings_.filter_q)) {
        settings_.filter_q = defaults.filter_q;
    }
    settings_.level = std::clamp(settings_.level, 0.0F, 1.0F);
    settings_.filter_frequency = std::clamp(
        settings_.filter_frequency, kMinFilterFrequency, kMaxFilterFrequency);
    settings_.filter_q =
        std::clamp(settings_.filter_q, kMinFilterQ, kMaxFilterQ);

    source_ = context_.createNoise();
    filter_ = context_.createFilter(FilterType::kBandpass,
                                    settings_.filter_frequency,
                                    settings_.filter_q);
    level_ = context_.createGain(settings_.level);
    gate_ = context_.createGain(0.0);

    context_.connect(source_, filter_);
    context_.connect(filter_, level_);
    context_.connect(level_, gate_);
    context_.connect(gate_, sink);

    if (settings_.level > 0.0F) {
        (void)source_->start(context_.currentTime());
    }
}

NoiseSection::~NoiseSection()
{
    context_.disconnect(source_);
    context_.disconnect(filter_);
    context_.disconnect(level_);
    context_.disconnect(gate_);
}

// Non-finite input is ignored by every setter.

void NoiseSection::setLevel(const float level)
{
    if (!std::isfinite(level)) {
        return;
    }
    settings_.level = std::clamp(level, 0.0F, 1.0F);
    level_->gain().setValue(settings_.level);

    if (settings_.level > 0.0F && !source_->started()) {
        (void)source_->start(context_.currentTime());
    }
}

void NoiseSection::setFilterFrequency(const float frequencyHz)
{
    if (!std::isfinite(frequencyHz)) {
        return;
    }
    settings_.filter_frequency =
        std::clamp(frequencyHz, kMinFilterFrequency, kMaxFilterFrequency);
    filter_->frequency().setValue(settings_.filter_frequency);
}

void NoiseSection::setFilterQ(const float q)
{
    if (!std::isfinite(q)) {
        return;
    }
    settings_.filter_q = std::clamp(q, kMinFilterQ, kMaxFilterQ);
    filter_->q().setValue(settings_.filter_q);
}

void NoiseSection::tuneTo(const double frequencyHz)
{
    if (!std::isfinite(frequencyHz)) {
        return;
    }
    filter_->frequency().setValue(
        std::clamp(frequencyHz, static_cast<double>(kMinFilterFrequency),
                   static_cast<double>(kMaxFilterFrequency)));
}

void NoiseSection::openGate()
{
    gate_->gain().setValue(1.0);
    gateOpen_ = true;
}

void NoiseSection::closeGate()
{
    gate_->gain().setValue(0.0);
    gateOpen_ = false;
}

bool NoiseSection::sourceStarted() const
{
    return source_->started();
}

}  // namespace sympathetic
