#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "audio/audio_device.hpp"
#include "audio/streaming_player.hpp"
#include "error_manager.hpp"
#include "voice/engines.hpp"

namespace Parley {
namespace fakes {

// Output device driven by the test: render() plays one period
class FakeOutputDevice : public AudioOutputDevice {
public:
    VoiceResult open(const OutputStreamParams& params, RenderCallback render) override {
        ++openCalls;
        if (failOpen) {
            return ErrorManager::report(Errors::DeviceUnavailable, "fake device");
        }
        params_ = params;
        render_ = std::move(render);
        open_ = true;
        return ErrorManager::ok();
    }

    void close() override {
        open_ = false;
        render_ = nullptr;
    }

    bool isOpen() const override { return open_; }
    int sampleRate() const override { return params_.sampleRate; }

    std::vector<float> render(unsigned long frames, bool underflow = false) {
        std::vector<float> out(frames * static_cast<size_t>(params_.channels), -2.0f);
        if (render_) render_(out.data(), frames, params_.channels, underflow);
        return out;
    }

    std::vector<float> renderPeriod() { return render(static_cast<unsigned long>(params_.framesPerBuffer)); }

    bool failOpen = false;
    int openCalls = 0;

private:
    OutputStreamParams params_;
    RenderCallback render_;
    bool open_ = false;
};

// Capture device; feed() plays the role of the driver callback
class FakeInputDevice : public AudioInputDevice {
public:
    VoiceResult open(const InputStreamParams& params, CaptureCallback capture) override {
        if (failOpen) {
            return ErrorManager::report(Errors::DeviceUnavailable, "fake microphone");
        }
        params_ = params;
        capture_ = std::move(capture);
        open_ = true;
        return ErrorManager::ok();
    }

    void close() override {
        open_ = false;
        capture_ = nullptr;
    }

    bool isOpen() const override { return open_; }
    int sampleRate() const override { return params_.sampleRate; }

    void feed(const std::vector<float>& samples, bool overflow = false) {
        if (capture_) capture_(samples.data(), samples.size(), overflow);
    }

    bool failOpen = false;

private:
    InputStreamParams params_;
    CaptureCallback capture_;
    bool open_ = false;
};

// Speech when the first sample is loud
class AmplitudeVad : public VoiceActivityDetector {
public:
    bool isSpeech(const float* frame, size_t count) override {
        if (throwNext.exchange(false)) throw std::runtime_error("vad failure");
        return count > 0 && frame[0] > 0.5f;
    }
    void calibrate(const std::vector<float>& ambient) override {
        calibratedSamples = ambient.size();
    }

    std::atomic<bool> throwNext{false};
    size_t calibratedSamples = 0;
};

// Returns queued replies in order, then `fallback`
class ScriptedTranscriber : public Transcriber {
public:
    std::string transcribe(const std::vector<float>& samples, int /*sampleRate*/) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        lastSamples = samples.size();
        if (throwNext) {
            throwNext = false;
            throw std::runtime_error("decoder failure");
        }
        if (!replies.empty()) {
            std::string r = replies.front();
            replies.pop_front();
            return r;
        }
        return fallback;
    }

    std::mutex mutex;
    std::deque<std::string> replies;
    std::string fallback;
    bool throwNext = false;
    int calls = 0;
    size_t lastSamples = 0;
};

// Produces `batches` blocks of `batchSize` samples at 0.25.
// hold() keeps synthesize() from producing anything until release().
class FakeSynthesizer : public SynthesisEngine {
public:
    void synthesize(const std::string& text, const BatchCallback& onBatch) override {
        {
            std::unique_lock<std::mutex> lock(mutex);
            texts.push_back(text);
            released.wait_for(lock, std::chrono::seconds(5), [this]() { return !held; });
        }
        if (throwOnSynthesize) throw std::runtime_error("voice model missing");
        for (int b = 0; b < batches; ++b) {
            std::vector<float> batch(static_cast<size_t>(batchSize), 0.25f);
            if (!onBatch(std::move(batch), sampleRate)) {
                stoppedEarly.store(true);
                return;
            }
        }
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex);
        held = true;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            held = false;
        }
        released.notify_all();
    }

    std::mutex mutex;
    std::condition_variable released;
    bool held = false;
    std::vector<std::string> texts;
    int batches = 3;
    int batchSize = 100;
    int sampleRate = 1000;
    bool throwOnSynthesize = false;
    std::atomic<bool> stoppedEarly{false};
};

class CountingEchoCanceller : public EchoCanceller {
public:
    void feedFarEnd(const std::vector<float>& samples, int /*sampleRate*/) override {
        farEndSamples += samples.size();
    }
    void process(float* /*nearEnd*/, size_t count) override {
        processedSamples += count;
    }

    size_t farEndSamples = 0;
    size_t processedSamples = 0;
};

// Records player events as strings ("start:1", "end:1:drained", ...)
class RecordingListener : public PlaybackListener {
public:
    void onSessionArmed(uint64_t id) override {
        std::lock_guard<std::mutex> lock(mutex);
        armed.push_back(id);
    }
    void onAudioStart(uint64_t id) override { push("start:" + std::to_string(id)); }
    void onAudioEnd(uint64_t id, bool drained) override {
        push("end:" + std::to_string(id) + (drained ? ":drained" : ":cancelled"));
    }
    void onAudioPause(uint64_t id) override { push("pause:" + std::to_string(id)); }
    void onAudioResume(uint64_t id) override { push("resume:" + std::to_string(id)); }
    void onFarEndAudio(const std::vector<float>& samples, int /*rate*/) override {
        std::lock_guard<std::mutex> lock(mutex);
        farEnd += samples.size();
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    std::mutex mutex;
    std::vector<std::string> events;
    std::vector<uint64_t> armed;
    size_t farEnd = 0;

private:
    void push(const std::string& e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(e);
    }
};

inline std::vector<float> loudFrame(size_t n) { return std::vector<float>(n, 0.9f); }
inline std::vector<float> quietFrame(size_t n) { return std::vector<float>(n, 0.0f); }

} // namespace fakes
} // namespace Parley
