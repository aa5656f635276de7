#pragma once

#include <memory>
#include <optional>

#include "core/AudioParam.h"
#include "core/SynthPatch.h"
#include "core/SynthSettings.h"

namespace sympathetic {

// ADSR automation generator for a single AudioParam.
//
// All curves are exponential, so every endpoint is clamped to
// kMinimumLevel and every segment lasts at least kMinimumSegmentSeconds.
// The envelope keeps the target alive through a shared_ptr to the node
// that owns it.
class Envelope {
public:
    enum class Phase {
        kIdle = 0,
        kAttack,
        kDecay,
        kSustain,
        kRelease,
    };

    static constexpr double kMinimumSegmentSeconds = 0.001;

    explicit Envelope(const EnvelopeSettings& settings);

    // Binds the envelope to `param`, which belongs to `owner`.
    Envelope& connect(std::shared_ptr<void> owner, AudioParam& param);

    [[nodiscard]] bool connected() const noexcept { return target_ != nullptr; }

    // Schedules attack and decay from `startTime`. Only accepted from
    // Idle or Sustain and when a target is connected.
    bool trigger(double startTime);

    // Schedules the release from the value the curve has at
    // `releaseTime`. Only accepted after trigger().
    bool triggerRelease(double releaseTime);

    // `releaseTime` (or the last release start) plus the release
    // duration.
    [[nodiscard]] double getEndTime(
        std::optional<double> releaseTime = std::nullopt) const;

    // Applies the present fields; affects the next trigger/release.
    void update(const EnvelopePatch& patch);

    [[nodiscard]] Phase phaseAt(double time) const;

    [[nodiscard]] const EnvelopeSettings& settings() const noexcept
    {
        return settings_;
    }

    [[nodiscard]] float release() const noexcept { return settings_.release; }

    [[nodiscard]] std::optional<double> triggerTime() const noexcept
    {
        return triggerTime_;
    }

    [[nodiscard]] std::optional<double> releaseStartTime() const noexcept
    {
        return releaseStartTime_;
    }

private:
    EnvelopeSettings settings_;

    std::shared_ptr<void> targetOwner_;
    AudioParam* target_{nullptr};

    std::optional<double> triggerTime_;
    // Attack and decay durations actually scheduled by the last
    // trigger().
    double scheduledAttack_{0.0};
    double scheduledDecay_{0.0};

    std::optional<double> releaseStartTime_;
    double scheduledRelease_{0.0};
};

[[nodiscard]] const char* EnvelopePhaseName(Envelope::Phase phase);

}  // namespace sympathetic
