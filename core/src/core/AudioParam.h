#pragma once

#include <mutex>
#include <vector>

namespace sympathetic {

// Source of "now" for automation targets. AudioContext implementations
// provide it; tests can use a manual clock.
class Clock {
public:
    virtual ~Clock() = default;

    // Current rendering time in seconds.
    [[nodiscard]] virtual double currentTime() const = 0;
};

// One point of an automation timeline.
struct AutomationEvent {
    enum class Kind {
        kSetValue = 0,
        kLinearRamp,
        kExponentialRamp,
    };

    Kind kind{Kind::kSetValue};
    double value{0.0};
    double time{0.0};
};

// Sample-accurate automation target owned by an audio node.
//
// The timeline follows the Web Audio AudioParam model: a sorted list of
// set/ramp events that is evaluated lazily at any time. Ramps are keyed
// by their end time and interpolate from the previous event.
//
// Thread-safety: the control thread schedules events while the render
// thread evaluates them, so every method takes the internal mutex.
class AudioParam {
public:
    AudioParam(double defaultValue, const Clock& clock);

    AudioParam(const AudioParam&) = delete;
    AudioParam& operator=(const AudioParam&) = delete;

    // Value at the clock's current time.
    [[nodiscard]] double value() const;

    [[nodiscard]] double valueAtTime(double time) const;

    // Immediate change. Without scheduled events this replaces the
    // default value; otherwise it behaves as setValueAtTime(value, now).
    void setValue(double value);

    AudioParam& setValueAtTime(double value, double time);
    AudioParam& linearRampToValueAtTime(double value, double endTime);

    // Throws std::invalid_argument when `value` is not strictly
    // positive: an exponential curve cannot reach or cross zero.
    AudioParam& exponentialRampToValueAtTime(double value, double endTime);

    // Removes every event whose time is at or after `time`.
    AudioParam& cancelScheduledValues(double time);

    // Copy of the scheduled timeline, in time order.
    [[nodiscard]] std::vector<AutomationEvent> events() const;

    [[nodiscard]] double defaultValue() const;

    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

private:
    void insertLocked(const AutomationEvent& event);
    [[nodiscard]] double valueAtTimeLocked(double time) const;

    const Clock& clock_;

    mutable std::mutex mutex_;
    double defaultValue_;
    std::vector<AutomationEvent> events_;
};

}  // namespace sympathetic
