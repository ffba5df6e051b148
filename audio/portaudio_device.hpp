#pragma once
#include <string>
#include <vector>

#include <portaudio.h>

#include "audio/audio_device.hpp"

namespace Parley {

// ------------------------------------------------------------
// PortAudio output stream (float32, callback mode)
// ------------------------------------------------------------
class PortAudioOutput : public AudioOutputDevice {
public:
    PortAudioOutput() = default;
    ~PortAudioOutput() override;

    PortAudioOutput(const PortAudioOutput&) = delete;
    PortAudioOutput& operator=(const PortAudioOutput&) = delete;

    // Tries the requested rate, the device default, then the common rates;
    // for each rate the configured block size and then 0 (host chooses)
    VoiceResult open(const OutputStreamParams& params, RenderCallback render) override;
    void close() override;
    bool isOpen() const override { return stream_ != nullptr; }
    int sampleRate() const override { return sampleRate_; }

private:
    static int paCallback(const void* input, void* output, unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags, void* userData);

    PaStream* stream_ = nullptr;
    RenderCallback render_;
    int channels_ = 1;
    int sampleRate_ = 0;
    bool initialized_ = false;
};

// ------------------------------------------------------------
// PortAudio capture stream (mono float32, callback mode)
// ------------------------------------------------------------
class PortAudioInput : public AudioInputDevice {
public:
    PortAudioInput() = default;
    ~PortAudioInput() override;

    PortAudioInput(const PortAudioInput&) = delete;
    PortAudioInput& operator=(const PortAudioInput&) = delete;

    VoiceResult open(const InputStreamParams& params, CaptureCallback capture) override;
    void close() override;
    bool isOpen() const override { return stream_ != nullptr; }
    int sampleRate() const override { return sampleRate_; }

private:
    static int paCallback(const void* input, void* output, unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags, void* userData);

    PaStream* stream_ = nullptr;
    CaptureCallback capture_;
    int sampleRate_ = 0;
    bool initialized_ = false;
};

// ------------------------------------------------------------
// Device listing
// ------------------------------------------------------------
struct AudioDeviceInfo {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    int maxOutputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefaultInput = false;
    bool isDefaultOutput = false;
};

// Empty when PortAudio cannot initialise
std::vector<AudioDeviceInfo> listAudioDevices();

} // namespace Parley
