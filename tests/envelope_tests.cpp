#include <cassert>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/AudioParam.h"
#include "core/Envelope.h"
#include "core/SynthPatch.h"

// Automation timeline and ADSR envelope behaviour against a manual
// clock.

using sympathetic::AudioParam;
using sympathetic::AutomationEvent;
using sympathetic::Clock;
using sympathetic::Envelope;
using sympathetic::EnvelopePatch;
using sympathetic::EnvelopePhaseName;
using sympathetic::EnvelopeSettings;
using sympathetic::kMinimumLevel;

namespace {

class ManualClock : public Clock {
public:
    double currentTime() const override { return now; }
    double now{0.0};
};

// Envelope durations are floats, so scheduled times carry float
// rounding.
bool near(const double a, const double b, const double eps = 1e-6)
{
    return std::abs(a - b) <= eps;
}

// Every exponential endpoint must be strictly positive and at least the
// floor.
bool exponentialEndpointsSafe(const AudioParam& param)
{
    for (const auto& event : param.events()) {
        if (event.kind == AutomationEvent::Kind::kExponentialRamp &&
            event.value < static_cast<double>(kMinimumLevel)) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main()
{
    ManualClock clock;

    // --- AudioParam -----------------------------------------------------
    {
        AudioParam param(0.5, clock);
        assert(param.value() == 0.5);

        // Without events, setValue changes the default.
        param.setValue(0.25);
        assert(param.defaultValue() == 0.25);
        assert(param.events().empty());

        param.setValueAtTime(1.0, 1.0);
        param.linearRampToValueAtTime(3.0, 2.0);
        assert(param.valueAtTime(0.5) == 0.25);
        assert(param.valueAtTime(1.0) == 1.0);
        assert(near(param.valueAtTime(1.5), 2.0));
        assert(param.valueAtTime(2.0) == 3.0);
        assert(param.valueAtTime(10.0) == 3.0);

        // Exponential segments interpolate geometrically.
        param.exponentialRampToValueAtTime(12.0, 4.0);
        assert(near(param.valueAtTime(3.0), 6.0));

        // Non-positive exponential targets are programmer errors.
        bool threw = false;
        try {
            param.exponentialRampToValueAtTime(0.0, 5.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(param.events().size() == 3U);

        // Cancel drops every event at or after the time.
        param.cancelScheduledValues(2.0);
        assert(param.events().size() == 1U);
        assert(param.valueAtTime(3.0) == 1.0);

        // Events inserted out of order end up sorted.
        AudioParam sorted(0.0, clock);
        sorted.setValueAtTime(2.0, 2.0);
        sorted.setValueAtTime(1.0, 1.0);
        const auto events = sorted.events();
        assert(events.size() == 2U);
        assert(events[0].time == 1.0 && events[1].time == 2.0);

        // With events present, setValue acts at the clock's now.
        clock.now = 1.5;
        sorted.setValue(7.0);
        assert(sorted.valueAtTime(1.6) == 7.0);
        assert(sorted.valueAtTime(2.5) == 2.0);
        clock.now = 0.0;
    }

    // --- Envelope: trigger ---------------------------------------------
    {
        EnvelopeSettings settings;
        settings.attack = 0.1F;
        settings.decay = 0.2F;
        settings.sustain = 0.5F;
        settings.release = 0.4F;
        settings.start_level = 0.0F;
        settings.max_level = 1.0F;

        Envelope unconnected(settings);
        assert(!unconnected.trigger(0.0));
        assert(!unconnected.triggerRelease(0.0));

        auto owner = std::make_shared<int>(0);
        AudioParam gain(0.0, clock);
        Envelope envelope(settings);
        envelope.connect(owner, gain);
        assert(envelope.connected());

        // Release before any trigger is rejected.
        assert(!envelope.triggerRelease(0.0));

        assert(envelope.trigger(1.0));
        assert(exponentialEndpointsSafe(gain));

        // Start level 0 is floored; peak and sustain are reached on time.
        assert(near(gain.valueAtTime(1.0), kMinimumLevel, 1e-7));
        assert(near(gain.valueAtTime(1.1), 1.0));
        assert(near(gain.valueAtTime(1.3), 0.5));
        assert(near(gain.valueAtTime(5.0), 0.5));

        assert(envelope.phaseAt(0.5) == Envelope::Phase::kIdle);
        assert(envelope.phaseAt(1.05) == Envelope::Phase::kAttack);
        assert(envelope.phaseAt(1.2) == Envelope::Phase::kDecay);
        assert(envelope.phaseAt(2.0) == Envelope::Phase::kSustain);
        assert(std::string(EnvelopePhaseName(envelope.phaseAt(0.5))) == "idle");
        assert(std::string(EnvelopePhaseName(envelope.phaseAt(1.05))) == "attack");
        assert(std::string(EnvelopePhaseName(envelope.phaseAt(1.2))) == "decay");
        assert(std::string(EnvelopePhaseName(envelope.phaseAt(2.0))) == "sustain");

        // Retrigger only from Idle or Sustain.
        assert(!envelope.trigger(1.05));
        assert(!envelope.trigger(1.2));

        // Release from sustain ramps from the sustain value to the floor.
        assert(envelope.triggerRelease(2.0));
        assert(exponentialEndpointsSafe(gain));
        assert(near(gain.valueAtTime(2.0), 0.5));
        assert(near(gain.valueAtTime(2.4), kMinimumLevel, 1e-7));
        assert(envelope.phaseAt(2.2) == Envelope::Phase::kRelease);
        assert(std::string(EnvelopePhaseName(Envelope::Phase::kRelease)) == "release");
        assert(envelope.phaseAt(2.5) == Envelope::Phase::kIdle);
        assert(near(envelope.getEndTime(), 2.4));
        assert(near(envelope.getEndTime(3.0), 3.4));

        // After the release finished the envelope can start again.
        assert(envelope.trigger(3.0));
        assert(near(gain.valueAtTime(3.0), kMinimumLevel, 1e-7));
    }

    // --- Envelope: release during attack ---------------------------------
    {
        EnvelopeSettings settings;
        settings.attack = 1.0F;
        settings.decay = 1.0F;
        settings.sustain = 0.2F;
        settings.release = 0.5F;
        settings.start_level = 0.0F;
        settings.max_level = 1.0F;

        auto owner = std::make_shared<int>(0);
        AudioParam gain(0.0, clock);
        Envelope envelope(settings);
        envelope.connect(owner, gain);
        assert(envelope.trigger(0.0));

        const double midAttack = gain.valueAtTime(0.5);
        assert(midAttack > 0.0 && midAttack < 1.0);

        // The release starts from the curve value, not from sustain.
        assert(envelope.triggerRelease(0.5));
        assert(near(gain.valueAtTime(0.5), midAttack));
        assert(gain.valueAtTime(0.75) < midAttack);
        assert(near(gain.valueAtTime(1.0), kMinimumLevel, 1e-7));
        // Nothing of the old attack/decay survives.
        for (const auto& event : gain.events()) {
            assert(event.time <= 1.0);
        }
    }

    // --- Envelope: zero durations and update -----------------------------
    {
        EnvelopeSettings settings;
        settings.attack = 0.0F;
        settings.decay = 0.0F;
        settings.sustain = 0.0F;
        settings.release = 0.0F;
        settings.start_level = 0.0F;
        settings.max_level = 0.0F;

        auto owner = std::make_shared<int>(0);
        AudioParam param(1.0, clock);
        Envelope envelope(settings);
        envelope.connect(owner, param);
        assert(envelope.trigger(0.0));
        assert(exponentialEndpointsSafe(param));

        // Segments last at least a millisecond.
        const auto events = param.events();
        assert(events.size() == 3U);
        assert(near(events[1].time, Envelope::kMinimumSegmentSeconds));
        assert(near(events[2].time, 2.0 * Envelope::kMinimumSegmentSeconds));

        EnvelopePatch patch;
        patch.release = 2.0F;
        patch.sustain = 0.3F;
        envelope.update(patch);
        assert(envelope.release() == 2.0F);
        assert(envelope.settings().sustain == 0.3F);
        assert(envelope.settings().attack == 0.0F);
    }

    return 0;
}
