#include "core/AudioParam.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sympathetic {

AudioParam::AudioParam(const double defaultValue, const Clock& clock)
    : clock_(clock), defaultValue_(defaultValue)
{
}

double AudioParam::value() const
{
    return valueAtTime(clock_.currentTime());
}

double AudioParam::valueAtTime(const double time) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return valueAtTimeLocked(time);
}

double AudioParam::valueAtTimeLocked(const double time) const
{
    if (events_.empty()) {
        return defaultValue_;
    }

    const auto next = std::upper_bound(
        events_.begin(), events_.end(), time,
        [](const double t, const AutomationEvent& e) { return t < e.time; });

    const bool hasPrevious = next != events_.begin();
    const double v0 = hasPrevious ? std::prev(next)->value : defaultValue_;
    const double t0 = hasPrevious ? std::prev(next)->time : 0.0;

    if (next == events_.end() ||
        next->kind == AutomationEvent::Kind::kSetValue) {
        return v0;
    }

    const double v1 = next->value;
    const double t1 = next->time;
    if (t1 <= t0 || time <= t0) {
        return v0;
    }

    const double progress = (time - t0) / (t1 - t0);

    if (next->kind == AutomationEvent::Kind::kLinearRamp) {
        return v0 + (v1 - v0) * progress;
    }

    // Exponential segments are undefined when the start value is zero
    // or the endpoints have opposite signs; hold the start value until
    // the ramp event takes over.
    if (v0 == 0.0 || v0 * v1 < 0.0) {
        return v0;
    }
    return v0 * std::pow(v1 / v0, progress);
}

void AudioParam::setValue(const double value)
{
    const double now = clock_.currentTime();

    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        defaultValue_ = value;
        return;
    }
    insertLocked(AutomationEvent{AutomationEvent::Kind::kSetValue, value, now});
}

AudioParam& AudioParam::setValueAtTime(const double value, const double time)
{
    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(AutomationEvent{AutomationEvent::Kind::kSetValue, value, time});
    return *this;
}

AudioParam& AudioParam::linearRampToValueAtTime(const double value,
                                                const double endTime)
{
    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(
        AutomationEvent{AutomationEvent::Kind::kLinearRamp, value, endTime});
    return *this;
}

AudioParam& AudioParam::exponentialRampToValueAtTime(const double value,
                                                     const double endTime)
{
    if (!(value > 0.0)) {
        throw std::invalid_argument(
            "exponential ramp target must be strictly positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(AutomationEvent{AutomationEvent::Kind::kExponentialRamp,
                                 value, endTime});
    return *this;
}

AudioParam& AudioParam::cancelScheduledValues(const double time)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto first = std::lower_bound(
        events_.begin(), events_.end(), time,
        [](const AutomationEvent& e, const double t) { return e.time < t; });
    events_.erase(first, events_.end());
    return *this;
}

std::vector<AutomationEvent> AudioParam::events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

double AudioParam::defaultValue() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultValue_;
}

void AudioParam::insertLocked(const AutomationEvent& event)
{
    // Events sharing a timestamp keep their insertion order.
    const auto pos = std::upper_bound(
        events_.begin(), events_.end(), event.time,
        [](const double t, const AutomationEvent& e) { return t < e.time; });
    events_.insert(pos, event);
}

}  // namespace sympathetic
