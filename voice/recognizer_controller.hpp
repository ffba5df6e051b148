#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "audio/audio_device.hpp"
#include "audio/spsc_ring.hpp"
#include "error_manager.hpp"
#include "voice/engines.hpp"
#include "voice/stop_phrase.hpp"
#include "voice/voice_types.hpp"

namespace Parley {

// Segmentation profile. PushToTalk starts a segment on the first
// speech frame and closes it after pttSilenceTimeoutMs.
enum class RecognizerProfile : uint8_t {
    Normal,
    PushToTalk
};

const char* toString(RecognizerProfile profile);

// ------------------------------------------------------------
// RecognizerController
//
// Microphone frames -> (AEC) -> VAD -> segment assembly -> transcriber.
// Finished segments go to on_transcript, or to on_stop when the text is
// a stop phrase. While suppressed, transcripts are dropped but the most
// recent audio is checked for stop phrases every checkIntervalMs.
//
// Threads: the device callback only pushes samples into a lock-free
// ring; a capture thread slices them into frames and runs processFrame().
// Pause/suppress/interrupt flags are atomics read once per frame.
//
// Without AEC, far-end audio is kept as an echo reference: a speech
// frame that correlates with it does not trigger barge-in.
// ------------------------------------------------------------
class RecognizerController {
public:
    using Clock = std::chrono::steady_clock;
    using TranscriptCallback = std::function<void(const std::string& text)>;
    using StopCallback = std::function<void(const std::string& phrase)>;
    using InterruptCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const VoiceResult& error)>;

    struct Options {
        CaptureConfig capture;
        StopPhraseConfig stopPhrase;
        bool captureThread = true;   // false: caller drives drainCapture()/processFrame()
    };

    RecognizerController(Options options,
                         std::shared_ptr<AudioInputDevice> device,
                         std::shared_ptr<VoiceActivityDetector> vad,
                         std::shared_ptr<Transcriber> transcriber,
                         std::shared_ptr<EchoCanceller> echoCanceller = nullptr);
    ~RecognizerController();

    RecognizerController(const RecognizerController&) = delete;
    RecognizerController& operator=(const RecognizerController&) = delete;

    // Opens the capture device and starts the capture thread.
    // ERR_DEVICE_UNAVAILABLE leaves the controller Idle.
    VoiceResult start(TranscriptCallback onTranscript, StopCallback onStop);
    void stop();
    bool isRunning() const { return running_.load(); }

    // Frames are dropped while paused; device and thread stay up
    void pauseProcessing();
    void resumeProcessing();
    bool isProcessingPaused() const { return paused_.load(); }

    void setSuppressed(bool suppressed);
    bool isSuppressed() const { return suppressed_.load(); }

    // Barge-in: called once per speech run reaching minSpeechMs
    // (echo frames excluded)
    void setInterruptEnabled(bool enabled) { interruptEnabled_.store(enabled); }
    bool isInterruptEnabled() const { return interruptEnabled_.load(); }
    void setInterruptCallback(InterruptCallback cb);

    // Reference audio for the echo canceller (AEC on) and the echo gate
    void feedFarEndAudio(const std::vector<float>& samples, int sampleRate);
    VoiceResult setAecEnabled(bool enabled);
    bool isAecEnabled() const { return aecEnabled_.load(); }

    // True when the frame correlates with the echo reference at some lag
    // by at least echoGateThreshold
    bool isLikelyEcho(const float* frame, size_t count) const;
    void clearEchoReference();
    size_t echoReferenceSamples() const;

    void setProfile(RecognizerProfile profile);
    RecognizerProfile profile() const { return profile_.load(); }
    int minSpeechFrames() const;
    int silenceTimeoutFrames() const;

    // Sends the open segment (if any) to the transcriber now
    void flushSegment(Clock::time_point now = Clock::now());

    // One VAD frame. Public so tests can drive the pipeline directly.
    void processFrame(const float* frame, size_t count, Clock::time_point now = Clock::now());

    // Slices captured samples into frames and processes them
    size_t drainCapture(Clock::time_point now = Clock::now());

    // Next calibrationMs of raw audio goes to the VAD's calibrate()
    void beginCalibration(int calibrationMs);
    bool isCalibrating() const { return calibrating_.load(); }

    RecognizerState state() const;

    void setErrorCallback(ErrorCallback cb);

    StopPhraseDetector& stopDetector() { return detector_; }

    uint64_t overrunCount() const { return overruns_.load(); }

private:
    void captureLoop();
    void onCapture(const float* in, unsigned long frames, bool overflow);

    // Caller holds processMutex_
    std::vector<float> takeSegmentLocked();
    void resetSegmentLocked();
    bool checkStopWindowLocked(Clock::time_point now, std::vector<float>& out);

    // Outside processMutex_
    void handleSegment(std::vector<float> segment, Clock::time_point now);
    bool handleStopWindow(const std::vector<float>& window, Clock::time_point now);
    bool transcribe(const std::vector<float>& samples, std::string& text);
    void reportError(const VoiceResult& error);

    Options options_;
    std::shared_ptr<AudioInputDevice> device_;
    std::shared_ptr<VoiceActivityDetector> vad_;
    std::shared_ptr<Transcriber> transcriber_;
    std::shared_ptr<EchoCanceller> echoCanceller_;

    StopPhraseDetector detector_;

    // Device callback -> capture thread
    SpscRing<float> captureRing_;
    std::vector<float> frameBuffer_;   // capture thread only
    std::atomic<uint64_t> overruns_{0};
    uint64_t reportedOverruns_ = 0;

    std::atomic<int> sampleRate_;

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> suppressed_{false};
    std::atomic<bool> interruptEnabled_{true};
    std::atomic<bool> aecEnabled_{false};
    std::atomic<bool> calibrating_{false};
    std::atomic<RecognizerProfile> profile_{RecognizerProfile::Normal};
    std::thread thread_;

    // Far-end history at the capture rate, newest last
    mutable std::mutex echoMutex_;
    std::vector<float> echoReference_;

    // Segment assembly (guarded by processMutex_)
    std::mutex processMutex_;
    std::vector<float> segment_;
    int speechFrames_ = 0;
    int silenceFrames_ = 0;
    bool recording_ = false;
    bool interruptFired_ = false;

    std::vector<float> stopWindow_;
    Clock::time_point lastWindowSpeech_{};
    Clock::time_point lastStopCheck_{};
    bool windowHasSpeech_ = false;
    bool stopCheckDone_ = false;

    std::vector<float> calibrationBuffer_;
    size_t calibrationTarget_ = 0;

    std::mutex transcribeMutex_;   // engines are not re-entrant

    std::mutex callbackMutex_;
    TranscriptCallback onTranscript_;
    StopCallback onStop_;
    InterruptCallback onInterrupt_;
    ErrorCallback onError_;
};

} // namespace Parley
