#include "core/Envelope.h"

#include <algorithm>
#include <utility>

namespace sympathetic {

namespace {

double SafeLevel(const float level)
{
    return std::max(static_cast<double>(level),
                    static_cast<double>(kMinimumLevel));
}

double SafeDuration(const float seconds)
{
    return std::max(static_cast<double>(seconds),
                    Envelope::kMinimumSegmentSeconds);
}

}  // namespace

Envelope::Envelope(const EnvelopeSettings& settings) : settings_(settings) {}

Envelope& Envelope::connect(std::shared_ptr<void> owner, AudioParam& param)
{
    targetOwner_ = std::move(owner);
    target_ = &param;
    return *this;
}

bool Envelope::trigger(const double startTime)
{
    if (target_ == nullptr) {
        return false;
    }

    const Phase phase = phaseAt(startTime);
    if (phase != Phase::kIdle && phase != Phase::kSustain) {
        return false;
    }

    const double attack = SafeDuration(settings_.attack);
    const double decay = SafeDuration(settings_.decay);

    target_->cancelScheduledValues(startTime);
    target_->setValueAtTime(SafeLevel(settings_.start_level), startTime);
    target_->exponentialRampToValueAtTime(SafeLevel(settings_.max_level),
                                          startTime + attack);
    target_->exponentialRampToValueAtTime(SafeLevel(settings_.sustain),
                                          startTime + attack + decay);

    triggerTime_ = startTime;
    scheduledAttack_ = attack;
    scheduledDecay_ = decay;
    releaseStartTime_.reset();
    scheduledRelease_ = 0.0;
    return true;
}

bool Envelope::triggerRelease(const double releaseTime)
{
    if (target_ == nullptr || !triggerTime_.has_value()) {
        return false;
    }

    // Read the curve before cancelling so that a release during attack
    // or decay continues from where the curve actually is.
    const double current = std::max(target_->valueAtTime(releaseTime),
                                    static_cast<double>(kMinimumLevel));
    const double release = SafeDuration(settings_.release);

    target_->cancelScheduledValues(releaseTime);
    target_->setValueAtTime(current, releaseTime);
    target_->exponentialRampToValueAtTime(SafeLevel(settings_.start_level),
                                          releaseTime + release);

    releaseStartTime_ = releaseTime;
    scheduledRelease_ = release;
    return true;
}

double Envelope::getEndTime(const std::optional<double> releaseTime) const
{
    const double releaseStart =
        releaseTime.value_or(releaseStartTime_.value_or(0.0));
    return releaseStart + static_cast<double>(settings_.release);
}

void Envelope::update(const EnvelopePatch& patch)
{
    if (patch.attack.has_value()) {
        settings_.attack = *patch.attack;
    }
    if (patch.decay.has_value()) {
        settings_.decay = *patch.decay;
    }
    if (patch.sustain.has_value()) {
        settings_.sustain = *patch.sustain;
    }
    if (patch.release.has_value()) {
        settings_.release = *patch.release;
    }
    if (patch.start_level.has_value()) {
        settings_.start_level = *patch.start_level;
    }
    if (patch.max_level.has_value()) {
        settings_.max_level = *patch.max_level;
    }
}

Envelope::Phase Envelope::phaseAt(const double time) const
{
    if (!triggerTime_.has_value() || time < *triggerTime_) {
        return Phase::kIdle;
    }

    if (releaseStartTime_.has_value() && time >= *releaseStartTime_) {
        return time < *releaseStartTime_ + scheduledRelease_ ? Phase::kRelease
                                                              : Phase::kIdle;
    }

    const double elapsed = time - *triggerTime_;
    if (elapsed < scheduledAttack_) {
        return Phase::kAttack;
    }
    if (elapsed < scheduledAttack_ + scheduledDecay_) {
        return Phase::kDecay;
    }
    return Phase::kSustain;
}

const char* EnvelopePhaseName(const Envelope::Phase phase)
{
    switch (phase) {
    case Envelope::Phase::kIdle: return "idle";
    case Envelope::Phase::kAttack: return "attack";
    case Envelope::Phase::kDecay: return "decay";
    case Envelope::Phase::kSustain: return "sustain";
    case Envelope::Phase::kRelease: return "release";
    }
    return "idle";
}

}  // namespace sympathetic
