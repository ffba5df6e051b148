#include "voice/voice_mode.hpp"
#include "logger.hpp"

namespace Parley {

VoiceModeCoordinator::VoiceModeCoordinator(RecognizerController& recognizer, VoiceMode mode)
    : recognizer_(recognizer), mode_(mode), appliedMode_(mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    applyIdleLocked(VoiceMode::Wait);
}

// ============================================================
// Mode selection
// ============================================================
void VoiceModeCoordinator::setMode(VoiceMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    const VoiceMode previous = mode_;
    mode_ = mode;

    if (activeSession_ != 0) {
        LOG_DEBUG("VoiceMode", std::string("Mode ") + toString(mode) + " applies from the next utterance");
        return;
    }
    applyIdleLocked(previous);
    LOG_DEBUG("VoiceMode", std::string("Mode set to ") + toString(mode));
}

VoiceResult VoiceModeCoordinator::setMode(const std::string& name) {
    VoiceMode parsed = VoiceMode::Stop;
    if (!voiceModeFromString(name, parsed)) {
        setMode(VoiceMode::Stop);
        return ErrorManager::report(Errors::InvalidModeTransition, "unknown mode \"" + name + "\"");
    }
    setMode(parsed);
    return ErrorManager::ok(std::string("Voice mode: ") + toString(parsed));
}

VoiceMode VoiceModeCoordinator::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

VoiceMode VoiceModeCoordinator::playbackMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeSession_ != 0 ? appliedMode_ : mode_;
}

bool VoiceModeCoordinator::isPlaybackActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeSession_ != 0;
}

// ============================================================
// Lifecycle events (dispatcher thread)
// ============================================================
void VoiceModeCoordinator::onPlaybackStart(uint64_t sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (activeSession_ == sessionId) return;

    if (activeSession_ != 0) {
        // Start without the previous end: undo and fall back to the safe mode
        ErrorManager::report(Errors::InvalidModeTransition,
                             "start of " + std::to_string(sessionId) + " while " +
                             std::to_string(activeSession_) + " is active");
        applyEndLocked(appliedMode_);
        mode_ = VoiceMode::Stop;
    }

    activeSession_ = sessionId;
    appliedMode_ = mode_;
    applyStartLocked(appliedMode_);
    LOG_TRACE("VoiceMode", std::string("Playback start (") + toString(appliedMode_) + ")");
}

void VoiceModeCoordinator::onPlaybackEnd(uint64_t sessionId, bool drained) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (activeSession_ == 0) {
        // Armed before this listener was attached: nothing was applied
        return;
    }
    if (activeSession_ != sessionId) {
        ErrorManager::quiet(Errors::SessionMismatch,
                            "end of " + std::to_string(sessionId) + " while " +
                            std::to_string(activeSession_) + " is active");
        return;
    }

    applyEndLocked(appliedMode_);
    activeSession_ = 0;
    recognizer_.clearEchoReference();

    // A mode change made during playback may also change idle behaviour
    if (mode_ != appliedMode_) applyIdleLocked(appliedMode_);

    LOG_TRACE("VoiceMode", std::string("Playback end (") + (drained ? "drained" : "cancelled") + ")");
}

void VoiceModeCoordinator::onAudioStart(uint64_t sessionId) {
    LOG_TRACE("VoiceMode", "First sample of session " + std::to_string(sessionId));
}

void VoiceModeCoordinator::onPlaybackPause(uint64_t sessionId) {
    LOG_TRACE("VoiceMode", "Playback paused: " + std::to_string(sessionId));
}

void VoiceModeCoordinator::onPlaybackResume(uint64_t sessionId) {
    LOG_TRACE("VoiceMode", "Playback resumed: " + std::to_string(sessionId));
}

// ============================================================
// Transitions (caller holds mutex_)
// ============================================================
void VoiceModeCoordinator::applyStartLocked(VoiceMode mode) {
    applyProfileLocked(mode);
    switch (mode) {
        case VoiceMode::Full:
            recognizer_.setInterruptEnabled(true);
            break;
        case VoiceMode::Wait:
            recognizer_.pauseProcessing();
            break;
        case VoiceMode::Stop:
            recognizer_.setSuppressed(true);
            recognizer_.setInterruptEnabled(false);
            break;
        case VoiceMode::PushToTalk:
            recognizer_.setSuppressed(true);
            recognizer_.setInterruptEnabled(false);
            // Stop phrases must be heard even with the key up
            recognizer_.resumeProcessing();
            break;
    }
}

void VoiceModeCoordinator::applyEndLocked(VoiceMode mode) {
    switch (mode) {
        case VoiceMode::Full:
            recognizer_.setInterruptEnabled(true);
            break;
        case VoiceMode::Wait:
            recognizer_.resumeProcessing();
            break;
        case VoiceMode::Stop:
            recognizer_.setSuppressed(false);
            recognizer_.setInterruptEnabled(true);
            break;
        case VoiceMode::PushToTalk:
            recognizer_.setSuppressed(false);
            recognizer_.setInterruptEnabled(true);
            if (!pushToTalkHeld_.load()) recognizer_.pauseProcessing();
            break;
    }
}

void VoiceModeCoordinator::applyProfileLocked(VoiceMode mode) {
    recognizer_.setProfile(mode == VoiceMode::PushToTalk ? RecognizerProfile::PushToTalk
                                                         : RecognizerProfile::Normal);
}

// Idle behaviour only differs for PushToTalk: capture is key driven
void VoiceModeCoordinator::applyIdleLocked(VoiceMode previous) {
    applyProfileLocked(mode_);
    if (mode_ == VoiceMode::PushToTalk) {
        if (pushToTalkHeld_.load()) {
            recognizer_.resumeProcessing();
        } else {
            recognizer_.pauseProcessing();
        }
    } else if (previous == VoiceMode::PushToTalk) {
        recognizer_.resumeProcessing();
    }
}

// ============================================================
// Push-to-talk / AEC
// ============================================================
void VoiceModeCoordinator::setPushToTalkHeld(bool held) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pushToTalkHeld_.exchange(held) == held) return;
        if (mode_ != VoiceMode::PushToTalk || activeSession_ != 0) return;

        if (held) {
            recognizer_.resumeProcessing();
            LOG_TRACE("VoiceMode", "Push-to-talk down");
            return;
        }
    }

    // Released: transcribe what was said, then stop listening. The flush
    // runs transcript callbacks, so it must not hold mutex_.
    recognizer_.flushSegment();

    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == VoiceMode::PushToTalk && activeSession_ == 0 && !pushToTalkHeld_.load()) {
        recognizer_.pauseProcessing();
    }
    LOG_TRACE("VoiceMode", "Push-to-talk up");
}

VoiceResult VoiceModeCoordinator::setAecEnabled(bool enabled) {
    VoiceResult result = recognizer_.setAecEnabled(enabled);
    aecEnabled_.store(enabled && result.success);
    return result;
}

void VoiceModeCoordinator::onFarEndAudio(const std::vector<float>& samples, int sampleRate) {
    recognizer_.feedFarEndAudio(samples, sampleRate);
}

} // namespace Parley
