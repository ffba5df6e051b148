#include "audio/portaudio_device.hpp"
#include "logger.hpp"

#include <algorithm>

namespace Parley {

static const int kFallbackRates[] = {48000, 44100, 24000, 22050, 16000};

static std::string paError(PaError err) {
    return std::string(Pa_GetErrorText(err)) + " (" + std::to_string(err) + ")";
}

// ============================================================
// Output
// ============================================================
PortAudioOutput::~PortAudioOutput() {
    close();
}

int PortAudioOutput::paCallback(const void* /*input*/, void* output, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo*,
                                PaStreamCallbackFlags statusFlags, void* userData) {
    auto* self = static_cast<PortAudioOutput*>(userData);
    float* out = static_cast<float*>(output);
    if (self->render_) {
        self->render_(out, frameCount, self->channels_, (statusFlags & paOutputUnderflow) != 0);
    } else {
        std::fill(out, out + frameCount * self->channels_, 0.0f);
    }
    return paContinue;
}

VoiceResult PortAudioOutput::open(const OutputStreamParams& params, RenderCallback render) {
    if (stream_) {
        return ErrorManager::ok();
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return ErrorManager::report(Errors::DeviceUnavailable, "Pa_Initialize: " + paError(err));
    }
    initialized_ = true;

    int deviceIndex = (params.deviceIndex >= 0) ? params.deviceIndex : Pa_GetDefaultOutputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        close();
        return ErrorManager::report(Errors::DeviceUnavailable,
                                    "no output device (index " + std::to_string(params.deviceIndex) + ")");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo || devInfo->maxOutputChannels < 1) {
        close();
        return ErrorManager::report(Errors::DeviceUnavailable,
                                    "device " + std::to_string(deviceIndex) + " has no output channels");
    }
    LOG_DEBUG("Audio", "Using output device: " + std::string(devInfo->name));

    channels_ = std::max(1, std::min(params.channels, devInfo->maxOutputChannels));
    render_ = std::move(render);

    PaStreamParameters outputParams;
    outputParams.device = deviceIndex;
    outputParams.channelCount = channels_;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = devInfo->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    std::vector<int> rates{params.sampleRate, static_cast<int>(devInfo->defaultSampleRate)};
    rates.insert(rates.end(), std::begin(kFallbackRates), std::end(kFallbackRates));

    std::vector<int> tried;
    for (int rate : rates) {
        if (rate <= 0 || std::find(tried.begin(), tried.end(), rate) != tried.end()) continue;
        tried.push_back(rate);

        for (unsigned long block : {static_cast<unsigned long>(params.framesPerBuffer), 0UL}) {
            err = Pa_OpenStream(&stream_, nullptr, &outputParams, rate, block,
                                paClipOff, &PortAudioOutput::paCallback, this);
            if (err != paNoError) {
                stream_ = nullptr;
                LOG_TRACE("Audio", "Output open failed at " + std::to_string(rate) + " Hz / block " +
                                   std::to_string(block) + ": " + paError(err));
                continue;
            }

            err = Pa_StartStream(stream_);
            if (err != paNoError) {
                Pa_CloseStream(stream_);
                stream_ = nullptr;
                LOG_TRACE("Audio", "Output start failed: " + paError(err));
                continue;
            }

            sampleRate_ = rate;
            if (rate != params.sampleRate) {
                LOG_WARN("Audio", "Output running at " + std::to_string(rate) + " Hz (requested " +
                                  std::to_string(params.sampleRate) + ")");
            }
            LOG_PHASE("Output stream open", true);
            return ErrorManager::ok();
        }
    }

    close();
    LOG_PHASE("Output stream open", false);
    return ErrorManager::report(Errors::DeviceUnavailable, "no supported output rate on " +
                                                           std::string(devInfo->name));
}

void PortAudioOutput::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
    render_ = nullptr;
}

// ============================================================
// Input
// ============================================================
PortAudioInput::~PortAudioInput() {
    close();
}

int PortAudioInput::paCallback(const void* input, void* /*output*/, unsigned long frameCount,
                               const PaStreamCallbackTimeInfo*,
                               PaStreamCallbackFlags statusFlags, void* userData) {
    auto* self = static_cast<PortAudioInput*>(userData);
    const float* in = static_cast<const float*>(input);
    if (in && self->capture_) {
        self->capture_(in, frameCount, (statusFlags & paInputOverflow) != 0);
    }
    return paContinue;
}

VoiceResult PortAudioInput::open(const InputStreamParams& params, CaptureCallback capture) {
    if (stream_) {
        return ErrorManager::ok();
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return ErrorManager::report(Errors::DeviceUnavailable, "Pa_Initialize: " + paError(err));
    }
    initialized_ = true;

    int deviceIndex = (params.deviceIndex >= 0) ? params.deviceIndex : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        close();
        return ErrorManager::report(Errors::DeviceUnavailable,
                                    "no input device (index " + std::to_string(params.deviceIndex) + ")");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo || devInfo->maxInputChannels < 1) {
        close();
        return ErrorManager::report(Errors::DeviceUnavailable,
                                    "device " + std::to_string(deviceIndex) + " has no input channels");
    }
    LOG_DEBUG("Audio", "Using input device: " + std::string(devInfo->name));

    capture_ = std::move(capture);

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_, &inputParams, nullptr, params.sampleRate,
                        static_cast<unsigned long>(params.framesPerBuffer),
                        paNoFlag, &PortAudioInput::paCallback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        close();
        return ErrorManager::report(Errors::DeviceUnavailable, "Pa_OpenStream (input): " + paError(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        close();
        return ErrorManager::report(Errors::DeviceUnavailable, "Pa_StartStream (input): " + paError(err));
    }

    sampleRate_ = params.sampleRate;
    LOG_PHASE("Input stream open", true);
    return ErrorManager::ok();
}

void PortAudioInput::close() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
    capture_ = nullptr;
}

// ============================================================
// Device listing
// ============================================================
std::vector<AudioDeviceInfo> listAudioDevices() {
    std::vector<AudioDeviceInfo> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", "PortAudio error: " + paError(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    const int defaultIn = Pa_GetDefaultInputDevice();
    const int defaultOut = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        AudioDeviceInfo info;
        info.index = i;
        info.name = deviceInfo->name ? deviceInfo->name : "";
        info.hostApi = hostApiInfo ? hostApiInfo->name : "?";
        info.maxInputChannels = deviceInfo->maxInputChannels;
        info.maxOutputChannels = deviceInfo->maxOutputChannels;
        info.defaultSampleRate = deviceInfo->defaultSampleRate;
        info.isDefaultInput = (i == defaultIn);
        info.isDefaultOutput = (i == defaultOut);
        devices.push_back(info);
    }

    Pa_Terminate();
    return devices;
}

} // namespace Parley
