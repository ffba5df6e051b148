#include "voice/recognizer_controller.hpp"
#include "audio/resample.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Parley {

// Seconds of microphone audio the capture ring holds while a segment
// is being transcribed on the capture thread
static constexpr int kCaptureRingSeconds = 30;
static constexpr std::chrono::milliseconds kIdleSleep{10};

// Echo search: every kEchoCoarseStep lags, then each lag around the best
static constexpr size_t kEchoCoarseStep = 4;
// Per-sample variance below this is silence, never echo
static constexpr double kEchoMinVariance = 1e-6;

const char* toString(RecognizerProfile profile) {
    switch (profile) {
        case RecognizerProfile::Normal:     return "normal";
        case RecognizerProfile::PushToTalk: return "push_to_talk";
    }
    return "unknown";
}

// Pearson correlation of two equal-length blocks
static double correlation(const float* a, const float* b, size_t n) {
    double ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);

    double num = 0.0, va = 0.0, vb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double da = a[i] - ma;
        const double db = b[i] - mb;
        num += da * db;
        va += da * da;
        vb += db * db;
    }
    const double floor = kEchoMinVariance * static_cast<double>(n);
    if (va < floor || vb < floor) return 0.0;
    return num / std::sqrt(va * vb);
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

RecognizerController::RecognizerController(Options options,
                                           std::shared_ptr<AudioInputDevice> device,
                                           std::shared_ptr<VoiceActivityDetector> vad,
                                           std::shared_ptr<Transcriber> transcriber,
                                           std::shared_ptr<EchoCanceller> echoCanceller)
    : options_(std::move(options)),
      device_(std::move(device)),
      vad_(std::move(vad)),
      transcriber_(std::move(transcriber)),
      echoCanceller_(std::move(echoCanceller)),
      detector_(options_.stopPhrase),
      captureRing_(static_cast<size_t>(options_.capture.sampleRate) * kCaptureRingSeconds),
      sampleRate_(options_.capture.sampleRate) {
    frameBuffer_.reserve(static_cast<size_t>(std::max(1, options_.capture.frameSamples())));

    detector_.setStopHandler([this](const StopPhraseMatch& match) {
        StopCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            cb = onStop_;
        }
        if (cb) cb(match.text);
    });
}

RecognizerController::~RecognizerController() {
    stop();
}

// ============================================================
// Lifecycle
// ============================================================
VoiceResult RecognizerController::start(TranscriptCallback onTranscript, StopCallback onStop) {
    if (running_.load()) {
        return ErrorManager::ok();
    }
    if (!device_) {
        return ErrorManager::report(Errors::DeviceUnavailable, "no input device configured");
    }

    InputStreamParams params;
    params.sampleRate      = options_.capture.sampleRate;
    params.framesPerBuffer = std::max(1, options_.capture.frameSamples());
    params.deviceIndex     = options_.capture.inputDeviceIndex;

    VoiceResult opened = device_->open(params, [this](const float* in, unsigned long frames, bool overflow) {
        onCapture(in, frames, overflow);
    });
    if (!opened) {
        return opened;
    }
    sampleRate_.store(device_->sampleRate() > 0 ? device_->sampleRate() : options_.capture.sampleRate);

    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        onTranscript_ = std::move(onTranscript);
        onStop_ = std::move(onStop);
    }
    {
        std::lock_guard<std::mutex> lock(processMutex_);
        resetSegmentLocked();
        stopWindow_.clear();
        windowHasSpeech_ = false;
        stopCheckDone_ = false;
    }
    frameBuffer_.clear();

    running_.store(true);
    if (options_.captureThread) {
        thread_ = std::thread([this]() { captureLoop(); });
    }

    LOG_PHASE("Recognizer start", true);
    return ErrorManager::ok();
}

void RecognizerController::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
        thread_.join();
    }
    if (device_) {
        device_->close();
    }

    {
        std::lock_guard<std::mutex> lock(processMutex_);
        resetSegmentLocked();
        stopWindow_.clear();
        windowHasSpeech_ = false;
    }
    detector_.reset();

    LOG_DEBUG("Recognizer", "Stopped");
}

RecognizerState RecognizerController::state() const {
    if (!running_.load())   return RecognizerState::Idle;
    if (paused_.load())     return RecognizerState::ListeningPausedForPlayback;
    if (suppressed_.load()) return RecognizerState::Suppressed;
    return RecognizerState::Listening;
}

// ============================================================
// Control flags
// ============================================================
void RecognizerController::pauseProcessing() {
    if (!paused_.exchange(true)) {
        LOG_TRACE("Recognizer", "Processing paused");
    }
}

void RecognizerController::resumeProcessing() {
    if (paused_.exchange(false)) {
        LOG_TRACE("Recognizer", "Processing resumed");
    }
}

void RecognizerController::setSuppressed(bool suppressed) {
    if (suppressed_.exchange(suppressed) == suppressed) return;

    {
        std::lock_guard<std::mutex> lock(processMutex_);
        stopWindow_.clear();
        windowHasSpeech_ = false;
        stopCheckDone_ = false;
    }
    // New utterance, new stop-phrase window
    if (suppressed) detector_.reset();

    LOG_TRACE("Recognizer", suppressed ? "Transcripts suppressed" : "Transcripts restored");
}

void RecognizerController::setInterruptCallback(InterruptCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onInterrupt_ = std::move(cb);
}

void RecognizerController::setErrorCallback(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onError_ = std::move(cb);
}

VoiceResult RecognizerController::setAecEnabled(bool enabled) {
    if (enabled && !echoCanceller_) {
        aecEnabled_.store(false);
        return ErrorManager::report(Errors::AecUnavailable);
    }
    aecEnabled_.store(enabled);
    LOG_DEBUG("Recognizer", std::string("AEC ") + (enabled ? "enabled" : "disabled"));
    return ErrorManager::ok();
}

void RecognizerController::feedFarEndAudio(const std::vector<float>& samples, int sampleRate) {
    if (samples.empty()) return;
    if (aecEnabled_.load() && echoCanceller_) {
        echoCanceller_->feedFarEnd(samples, sampleRate);
    }
    if (!options_.capture.echoGate) return;

    const int rate = sampleRate_.load();
    std::vector<float> resampled = linearResampleMono(samples, sampleRate, rate);
    const size_t limit = static_cast<size_t>(std::max(0, options_.capture.echoHistoryMs)) *
                         static_cast<size_t>(rate) / 1000;

    std::lock_guard<std::mutex> lock(echoMutex_);
    echoReference_.insert(echoReference_.end(), resampled.begin(), resampled.end());
    if (echoReference_.size() > limit) {
        echoReference_.erase(echoReference_.begin(),
                             echoReference_.begin() + (echoReference_.size() - limit));
    }
}

bool RecognizerController::isLikelyEcho(const float* frame, size_t count) const {
    std::lock_guard<std::mutex> lock(echoMutex_);
    if (!frame || count == 0 || echoReference_.size() < count) return false;

    const size_t lags = echoReference_.size() - count + 1;
    const float* far = echoReference_.data();

    double best = 0.0;
    size_t bestLag = 0;
    for (size_t lag = 0; lag < lags; lag += kEchoCoarseStep) {
        const double c = correlation(frame, far + lag, count);
        if (c > best) {
            best = c;
            bestLag = lag;
        }
    }

    const size_t lo = bestLag >= kEchoCoarseStep ? bestLag - kEchoCoarseStep + 1 : 0;
    const size_t hi = std::min(lags - 1, bestLag + kEchoCoarseStep - 1);
    for (size_t lag = lo; lag <= hi; ++lag) {
        best = std::max(best, correlation(frame, far + lag, count));
    }
    return best >= options_.capture.echoGateThreshold;
}

void RecognizerController::clearEchoReference() {
    std::lock_guard<std::mutex> lock(echoMutex_);
    echoReference_.clear();
}

size_t RecognizerController::echoReferenceSamples() const {
    std::lock_guard<std::mutex> lock(echoMutex_);
    return echoReference_.size();
}

// ============================================================
// Segmentation profile
// ============================================================
void RecognizerController::setProfile(RecognizerProfile profile) {
    if (profile_.exchange(profile) != profile) {
        LOG_TRACE("Recognizer", std::string("Profile ") + toString(profile));
    }
}

int RecognizerController::minSpeechFrames() const {
    if (profile_.load() == RecognizerProfile::PushToTalk) return 1;
    const int frameMs = std::max(1, options_.capture.frameMs);
    return std::max(1, options_.capture.minSpeechMs / frameMs);
}

int RecognizerController::silenceTimeoutFrames() const {
    const CaptureConfig& cfg = options_.capture;
    const int frameMs = std::max(1, cfg.frameMs);
    int timeoutMs = cfg.silenceTimeoutMs;
    if (profile_.load() == RecognizerProfile::PushToTalk) {
        timeoutMs = std::min(timeoutMs, cfg.pttSilenceTimeoutMs);
    }
    return std::max(1, timeoutMs / frameMs);
}

void RecognizerController::beginCalibration(int calibrationMs) {
    std::lock_guard<std::mutex> lock(processMutex_);
    calibrationBuffer_.clear();
    calibrationTarget_ = static_cast<size_t>(std::max(1, calibrationMs)) *
                         static_cast<size_t>(sampleRate_.load()) / 1000;
    calibrating_.store(true);
    LOG_DEBUG("Recognizer", "Calibrating VAD for " + std::to_string(calibrationMs) + " ms");
}

// ============================================================
// Capture
// ============================================================
void RecognizerController::onCapture(const float* in, unsigned long frames, bool overflow) {
    bool dropped = false;
    for (unsigned long i = 0; i < frames; ++i) {
        if (!captureRing_.tryPush(in[i])) {
            dropped = true;
            break;
        }
    }
    if (overflow || dropped) {
        overruns_.fetch_add(1);
    }
}

void RecognizerController::captureLoop() {
    LOG_DEBUG("Recognizer", "Capture thread started");
    while (running_.load()) {
        if (drainCapture() == 0) {
            std::this_thread::sleep_for(kIdleSleep);
        }
    }
    LOG_DEBUG("Recognizer", "Capture thread stopped");
}

size_t RecognizerController::drainCapture(Clock::time_point now) {
    const uint64_t overruns = overruns_.load();
    if (overruns != reportedOverruns_) {
        LOG_WARN("Recognizer", std::string(Errors::Overrun) + " -> " +
                               ErrorManager::getDebugMessage(Errors::Overrun) +
                               " (" + std::to_string(overruns - reportedOverruns_) + " blocks)");
        reportedOverruns_ = overruns;
    }

    const size_t frameSamples = static_cast<size_t>(std::max(1, options_.capture.frameSamples()));
    size_t processed = 0;
    float s = 0.0f;

    while (captureRing_.tryPop(s)) {
        frameBuffer_.push_back(s);
        if (frameBuffer_.size() >= frameSamples) {
            processFrame(frameBuffer_.data(), frameBuffer_.size(), now);
            frameBuffer_.clear();
            ++processed;
        }
    }
    return processed;
}

// ============================================================
// Frame processing
// ============================================================
void RecognizerController::resetSegmentLocked() {
    segment_.clear();
    speechFrames_ = 0;
    silenceFrames_ = 0;
    recording_ = false;
    interruptFired_ = false;
}

std::vector<float> RecognizerController::takeSegmentLocked() {
    std::vector<float> out;
    out.swap(segment_);
    resetSegmentLocked();
    return out;
}

bool RecognizerController::checkStopWindowLocked(Clock::time_point now, std::vector<float>& out) {
    const auto interval = std::chrono::milliseconds(options_.stopPhrase.checkIntervalMs);
    if (stopCheckDone_ && now - lastStopCheck_ < interval) return false;
    lastStopCheck_ = now;
    stopCheckDone_ = true;

    const auto window = std::chrono::milliseconds(options_.stopPhrase.audioWindowMs);
    if (stopWindow_.empty() || !windowHasSpeech_ || now - lastWindowSpeech_ > window) {
        return false;
    }
    out = stopWindow_;
    return true;
}

void RecognizerController::processFrame(const float* frame, size_t count, Clock::time_point now) {
    if (!frame || count == 0) return;

    const CaptureConfig& cfg = options_.capture;
    const int minSpeech = minSpeechFrames();
    const int silenceFrames = silenceTimeoutFrames();
    const bool echoGated = cfg.echoGate && !aecEnabled_.load();
    const size_t rate = static_cast<size_t>(sampleRate_.load());
    const size_t maxSegmentSamples = static_cast<size_t>(std::max(0, cfg.maxSegmentMs)) * rate / 1000;
    const size_t windowSamples = static_cast<size_t>(std::max(0, options_.stopPhrase.audioWindowMs)) * rate / 1000;

    std::vector<float> calibration;
    std::vector<float> segment;
    std::vector<float> window;
    bool checkWindow = false;
    bool interrupt = false;
    bool heldAsEcho = false;
    VoiceResult vadError;

    {
        std::lock_guard<std::mutex> lock(processMutex_);

        if (calibrating_.load()) {
            calibrationBuffer_.insert(calibrationBuffer_.end(), frame, frame + count);
            if (calibrationBuffer_.size() >= calibrationTarget_) {
                calibration.swap(calibrationBuffer_);
                calibrating_.store(false);
            }
        }

        if (paused_.load()) {
            // Half-heard speech from before the pause is not worth keeping
            if (speechFrames_ > 0 || recording_) resetSegmentLocked();
        } else {
            std::vector<float> local(frame, frame + count);
            if (aecEnabled_.load() && echoCanceller_) {
                echoCanceller_->process(local.data(), local.size());
            }

            bool speech = false;
            try {
                speech = vad_ && vad_->isSpeech(local.data(), local.size());
            } catch (const std::exception& e) {
                vadError = ErrorManager::report(Errors::SegmentTranscriptionFailed,
                                                std::string("VAD: ") + e.what());
                resetSegmentLocked();
            }

            if (vadError.success) {
                if (suppressed_.load()) {
                    stopWindow_.insert(stopWindow_.end(), local.begin(), local.end());
                    if (stopWindow_.size() > windowSamples) {
                        stopWindow_.erase(stopWindow_.begin(),
                                          stopWindow_.begin() + (stopWindow_.size() - windowSamples));
                    }
                    if (speech) {
                        lastWindowSpeech_ = now;
                        windowHasSpeech_ = true;
                    }
                    checkWindow = checkStopWindowLocked(now, window);
                }

                if (speech) {
                    segment_.insert(segment_.end(), local.begin(), local.end());
                    ++speechFrames_;
                    silenceFrames_ = 0;

                    if (!recording_ && speechFrames_ >= minSpeech) {
                        recording_ = true;
                    }
                    // Checked on every speech frame: an echo frame only defers it
                    if (recording_ && !interruptFired_ && interruptEnabled_.load()) {
                        if (echoGated && isLikelyEcho(local.data(), local.size())) {
                            heldAsEcho = true;
                        } else {
                            interrupt = true;
                            interruptFired_ = true;
                        }
                    }
                    if (recording_ && maxSegmentSamples > 0 && segment_.size() >= maxSegmentSamples) {
                        segment = takeSegmentLocked();
                    }
                } else if (recording_) {
                    segment_.insert(segment_.end(), local.begin(), local.end());
                    if (++silenceFrames_ >= silenceFrames) {
                        segment = takeSegmentLocked();
                    }
                } else {
                    speechFrames_ = std::max(0, speechFrames_ - 1);
                    if (speechFrames_ == 0) segment_.clear();
                }
            }
        }
    }

    if (!calibration.empty() && vad_) {
        try {
            vad_->calibrate(calibration);
        } catch (const std::exception& e) {
            LOG_ERROR("Recognizer", std::string("VAD calibration failed: ") + e.what());
        }
    }

    if (!vadError.success) {
        reportError(vadError);
        return;
    }

    if (heldAsEcho) {
        LOG_TRACE("Recognizer", "Speech matches playback, not interrupting");
    }
    if (interrupt) {
        InterruptCallback cb;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            cb = onInterrupt_;
        }
        if (cb) {
            LOG_DEBUG("Recognizer", "Speech detected, interrupting playback");
            cb();
        }
    }

    if (checkWindow && handleStopWindow(window, now)) {
        segment.clear();
    }
    if (!segment.empty()) {
        handleSegment(std::move(segment), now);
    }
}

void RecognizerController::flushSegment(Clock::time_point now) {
    std::vector<float> segment;
    {
        std::lock_guard<std::mutex> lock(processMutex_);
        if (segment_.empty() || speechFrames_ == 0) {
            resetSegmentLocked();
            return;
        }
        segment = takeSegmentLocked();
    }
    handleSegment(std::move(segment), now);
}

// ============================================================
// Transcription
// ============================================================
bool RecognizerController::transcribe(const std::vector<float>& samples, std::string& text) {
    if (!transcriber_) {
        reportError(ErrorManager::report(Errors::SegmentTranscriptionFailed, "no transcriber configured"));
        return false;
    }

    std::lock_guard<std::mutex> lock(transcribeMutex_);
    try {
        text = trim(transcriber_->transcribe(samples, sampleRate_.load()));
    } catch (const std::exception& e) {
        reportError(ErrorManager::report(Errors::SegmentTranscriptionFailed, e.what()));
        return false;
    }
    return true;
}

bool RecognizerController::handleStopWindow(const std::vector<float>& window, Clock::time_point now) {
    std::string text;
    if (!transcribe(window, text) || text.empty()) return false;

    auto match = detector_.observe(text, now);
    if (!match) return false;

    // The words are consumed: neither the next window nor the
    // segment they belong to may count them again
    std::lock_guard<std::mutex> lock(processMutex_);
    stopWindow_.clear();
    windowHasSpeech_ = false;
    resetSegmentLocked();
    return true;
}

void RecognizerController::handleSegment(std::vector<float> segment, Clock::time_point now) {
    const double seconds = static_cast<double>(segment.size()) / std::max(1, sampleRate_.load());
    LOG_TRACE("Recognizer", "Segment ready (" + std::to_string(seconds) + " s)");

    std::string text;
    if (!transcribe(segment, text)) return;

    if (text.size() < options_.capture.minTranscriptionChars) {
        LOG_TRACE("Recognizer", "Segment dropped (too short)");
        return;
    }

    TranscriptCallback onTranscript;
    bool haveStop = false;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        onTranscript = onTranscript_;
        haveStop = static_cast<bool>(onStop_);
    }

    if (detector_.classify(text)) {
        // A segment that is nothing but a stop phrase never becomes a
        // transcript, even while its confirmation is pending
        const bool stopUtterance = detector_.isStopUtterance(text);
        auto match = detector_.observe(text, now);
        if (haveStop && match && (match->triggered || stopUtterance)) {
            if (!match->triggered) {
                LOG_TRACE("Recognizer", "Stop phrase \"" + match->text + "\" held for confirmation");
            }
            return;
        }
    }

    if (suppressed_.load() || paused_.load()) {
        LOG_TRACE("Recognizer", "Transcript dropped (suppressed): " + text);
        return;
    }

    LOG_DEBUG("Recognizer", "Heard \"" + text + "\"");
    if (onTranscript) onTranscript(text);
}

void RecognizerController::reportError(const VoiceResult& error) {
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = onError_;
    }
    if (cb) cb(error);
}

} // namespace Parley
