#include "voice/voice_manager.hpp"
#include "logger.hpp"
#include "voice/text_sanitize.hpp"

namespace Parley {

static RecognizerController::Options recognizerOptions(const VoiceManager::Options& o) {
    RecognizerController::Options r;
    r.capture = o.config.capture;
    r.stopPhrase = o.config.stopPhrase;
    r.captureThread = o.captureThread;
    return r;
}

static StreamingPlayer::Options playerOptions(const VoiceManager::Options& o) {
    StreamingPlayer::Options p;
    p.playback = o.config.playback;
    p.dispatchThread = o.dispatchThread;
    return p;
}

VoiceManager::VoiceManager(Options options, Engines engines)
    : options_(std::move(options)),
      engines_(std::move(engines)),
      recognizer_(recognizerOptions(options_), engines_.input, engines_.vad,
                  engines_.transcriber, engines_.echoCanceller),
      coordinator_(recognizer_, options_.config.mode),
      player_(playerOptions(options_), engines_.output) {
    // Coordinator first: recognizer state is updated before app callbacks run
    player_.addListener(&coordinator_);
    player_.addListener(this);

    // Barge-in (Full mode): user speech cuts playback
    recognizer_.setInterruptCallback([this]() {
        if (player_.isActive() && coordinator_.playbackMode() == VoiceMode::Full) {
            stopSpeaking();
        }
    });
    recognizer_.setErrorCallback([this](const VoiceResult& error) { reportError(error); });

    if (options_.config.aecEnabled) {
        VoiceResult aec = enableAec(true);
        if (!aec) {
            LOG_WARN("Voice", "AEC requested but unavailable; continuing without it");
        }
    } else {
        player_.setFarEndTap(options_.config.capture.echoGate);
    }
}

VoiceManager::~VoiceManager() {
    shutdown();
}

void VoiceManager::shutdown() {
    std::call_once(shutdownOnce_, [this]() {
        LOG_DEBUG("Voice", "Shutdown called");
        recognizer_.stop();
        player_.stop();
        {
            std::lock_guard<std::mutex> lock(speakMutex_);
            if (synthThread_.joinable()) synthThread_.join();
        }
        player_.closeStream();
        player_.removeListener(this);
        player_.removeListener(&coordinator_);
        LOG_PHASE("Voice shutdown", true);
    });
}

// ============================================================
// Speech output
// ============================================================
VoiceResult VoiceManager::speak(const std::string& text, PlaybackSession::CompletionCallback onComplete) {
    return speak(PlaybackSession::create(std::move(onComplete)), text);
}

VoiceResult VoiceManager::speak(const PlaybackSessionPtr& session, const std::string& text) {
    if (!engines_.synthesis) {
        return ErrorManager::report(Errors::NoSynthesisEngine);
    }
    if (!session) {
        return ErrorManager::quiet(Errors::SessionMismatch, "speak() without a session");
    }

    std::string spoken = options_.config.sanitizeMarkdown ? sanitizeMarkdownForSpeech(text) : text;

    std::lock_guard<std::mutex> lock(speakMutex_);

    // Cancels the previous session; its worker leaves at the next batch
    VoiceResult armed = player_.play(session);
    if (!armed) {
        return armed;
    }

    if (synthThread_.joinable()) {
        synthThread_.join();
    }
    synthThread_ = std::thread(&VoiceManager::synthesisWorker, this, session, std::move(spoken));

    LOG_DEBUG("Voice", "Speaking (session " + std::to_string(session->id()) + ")");
    return ErrorManager::ok();
}

void VoiceManager::synthesisWorker(PlaybackSessionPtr session, std::string text) {
    const uint64_t id = session->id();
    try {
        engines_.synthesis->synthesize(text, [&](std::vector<float> samples, int sampleRate) {
            if (session->isCancelled()) return false;
            VoiceResult queued = player_.enqueue(id, std::move(samples), sampleRate);
            return queued.success && !session->isCancelled();
        });
    } catch (const std::exception& e) {
        reportError(ErrorManager::report(Errors::SynthesisFailed, e.what()));
        // A failed utterance is cancelled, never completed
        session->cancel();
        player_.stop(id);
        return;
    }
    // Whatever was queued still plays out
    player_.finish(id);
}

bool VoiceManager::stopSpeaking() {
    return player_.stop();
}

bool VoiceManager::pauseSpeaking() {
    return player_.pause();
}

bool VoiceManager::resumeSpeaking() {
    return player_.resume();
}

bool VoiceManager::isSpeaking() const {
    return player_.isActive();
}

bool VoiceManager::isPaused() const {
    return player_.isPaused();
}

// ============================================================
// Speech input
// ============================================================
VoiceResult VoiceManager::listen(RecognizerController::TranscriptCallback onTranscript,
                                 RecognizerController::StopCallback onStop) {
    auto stopHandler = [this, onStop](const std::string& phrase) {
        // A stop phrase stops speaking, not listening
        stopSpeaking();
        if (onStop) onStop(phrase);
    };
    // Wait mode holds transcripts for the whole playback, including the
    // synthesis gap before the first sample
    auto transcriptHandler = [this, onTranscript](const std::string& text) {
        if (player_.isActive() && coordinator_.playbackMode() == VoiceMode::Wait) {
            LOG_TRACE("Voice", "Transcript dropped during playback: " + text);
            return;
        }
        if (onTranscript) onTranscript(text);
    };
    return recognizer_.start(transcriptHandler, stopHandler);
}

void VoiceManager::stopListening() {
    recognizer_.stop();
}

// ============================================================
// Coordination
// ============================================================
void VoiceManager::setVoiceMode(VoiceMode mode) {
    coordinator_.setMode(mode);
}

VoiceResult VoiceManager::setVoiceMode(const std::string& name) {
    return coordinator_.setMode(name);
}

VoiceMode VoiceManager::voiceMode() const {
    return coordinator_.mode();
}

VoiceResult VoiceManager::enableAec(bool enabled) {
    VoiceResult result = coordinator_.setAecEnabled(enabled);
    player_.setFarEndTap((enabled && result.success) || options_.config.capture.echoGate);
    return result;
}

void VoiceManager::pushToTalk(bool pressed) {
    coordinator_.setPushToTalkHeld(pressed);
}

VoiceResult VoiceManager::calibrateVad(int ambientMs) {
    recognizer_.beginCalibration(ambientMs);
    if (!recognizer_.isRunning()) {
        return ErrorManager::ok("Calibration will run when listening starts");
    }
    return ErrorManager::ok("Calibrating, stay quiet for " + std::to_string(ambientMs) + " ms");
}

// ============================================================
// Notifications
// ============================================================
void VoiceManager::setOnAudioStart(SessionCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onStart_ = std::move(cb);
}

void VoiceManager::setOnAudioEnd(EndCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onEnd_ = std::move(cb);
}

void VoiceManager::setOnAudioPause(SessionCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onPause_ = std::move(cb);
}

void VoiceManager::setOnAudioResume(SessionCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onResume_ = std::move(cb);
}

void VoiceManager::setOnError(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onError_ = std::move(cb);
}

void VoiceManager::onAudioStart(uint64_t sessionId) {
    SessionCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = onStart_;
    }
    if (cb) cb(sessionId);
}

void VoiceManager::onAudioEnd(uint64_t sessionId, bool drained) {
    EndCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = onEnd_;
    }
    if (cb) cb(sessionId, drained);
}

void VoiceManager::onAudioPause(uint64_t sessionId) {
    SessionCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = onPause_;
    }
    if (cb) cb(sessionId);
}

void VoiceManager::onAudioResume(uint64_t sessionId) {
    SessionCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = onResume_;
    }
    if (cb) cb(sessionId);
}

void VoiceManager::reportError(const VoiceResult& error) {
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb = onError_;
    }
    if (cb) cb(error);
}

} // namespace Parley
