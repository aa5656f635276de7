#pragma once

#include <atomic>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>

#include "AudioGraphContext.h"

namespace sympathetic {

// Render graph driven by the default sound card.
//
// Owns a juce::AudioDeviceManager opened with no inputs and stereo
// outputs. The mono graph output is copied to every output channel.
// The clock advances with the device callback, so it stands still
// until the device has started.
class AudioDeviceContext : public AudioGraphContext,
                           public juce::AudioIODeviceCallback {
public:
    AudioDeviceContext();
    ~AudioDeviceContext() override;

    // True when the default device could not be opened; the context
    // still works but time never advances.
    [[nodiscard]] bool initError() const noexcept { return initError_; }

    [[nodiscard]] juce::String deviceName() const;

    // Stops the callback. Safe to call more than once.
    void shutdown();

    // juce::AudioIODeviceCallback
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData,
        int numInputChannels,
        float* const* outputChannelData,
        int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

private:
    juce::AudioDeviceManager deviceManager_;
    std::vector<float> mono_;
    bool initError_{false};
    bool isShutdown_{false};
};

}  // namespace sympathetic
