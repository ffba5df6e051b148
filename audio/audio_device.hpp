#pragma once
#include <functional>
#include <string>

#include "error_manager.hpp"

namespace Parley {

// ------------------------------------------------------------
// Stream parameters
// ------------------------------------------------------------
struct OutputStreamParams {
    int sampleRate = 24000;
    int framesPerBuffer = 480;
    int channels = 1;
    int deviceIndex = -1;   // -1 = host default
};

struct InputStreamParams {
    int sampleRate = 16000;
    int framesPerBuffer = 480;
    int channels = 1;
    int deviceIndex = -1;
};

// ------------------------------------------------------------
// AudioOutputDevice: owns one output stream. The render callback
// runs on the driver's real-time thread.
// ------------------------------------------------------------
class AudioOutputDevice {
public:
    // out: interleaved buffer of frames * channels floats
    // underflow: the driver reported an output underflow since the last call
    using RenderCallback =
        std::function<void(float* out, unsigned long frames, int channels, bool underflow)>;

    virtual ~AudioOutputDevice() = default;

    // Fails with ERR_DEVICE_UNAVAILABLE; no retry loop
    virtual VoiceResult open(const OutputStreamParams& params, RenderCallback render) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Rate the stream actually runs at (may differ from the request)
    virtual int sampleRate() const = 0;
};

// ------------------------------------------------------------
// AudioInputDevice: owns one capture stream
// ------------------------------------------------------------
class AudioInputDevice {
public:
    using CaptureCallback =
        std::function<void(const float* in, unsigned long frames, bool overflow)>;

    virtual ~AudioInputDevice() = default;

    virtual VoiceResult open(const InputStreamParams& params, CaptureCallback capture) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual int sampleRate() const = 0;
};

} // namespace Parley
