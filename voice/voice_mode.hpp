#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "audio/streaming_player.hpp"
#include "error_manager.hpp"
#include "voice/recognizer_controller.hpp"
#include "voice/voice_types.hpp"

namespace Parley {

// ------------------------------------------------------------
// VoiceModeCoordinator
//
// Turns player lifecycle events into recognizer changes:
//
//   mode        playback start                 playback end
//   Full        interrupt stays enabled        interrupt enabled
//   Wait        pauseProcessing()              resumeProcessing()
//   Stop        suppressed, interrupt off      unsuppressed, interrupt on
//   PushToTalk  as Stop, processing resumed    as Stop, paused unless key held
//
// Playback starts when the player arms a session, not at its first
// sample, so synthesis latency is already covered. The mode is sampled
// then; setMode() during playback takes effect at the next start and
// the end event undoes whatever the start applied. PushToTalk also
// switches the recognizer to its push-to-talk profile.
// ------------------------------------------------------------
class VoiceModeCoordinator : public PlaybackListener {
public:
    explicit VoiceModeCoordinator(RecognizerController& recognizer, VoiceMode mode = VoiceMode::Wait);

    void setMode(VoiceMode mode);
    // Unknown names report ERR_INVALID_MODE_TRANSITION and select Stop
    VoiceResult setMode(const std::string& name);
    VoiceMode mode() const;
    // Mode in force for the active playback, else the selected mode
    VoiceMode playbackMode() const;

    void onPlaybackStart(uint64_t sessionId);
    void onPlaybackEnd(uint64_t sessionId, bool drained);
    void onPlaybackPause(uint64_t sessionId);
    void onPlaybackResume(uint64_t sessionId);

    void setPushToTalkHeld(bool held);
    bool isPushToTalkHeld() const { return pushToTalkHeld_.load(); }

    // Far-end audio always reaches the recognizer (echo gate); the
    // canceller only sees it while AEC is enabled
    VoiceResult setAecEnabled(bool enabled);
    bool isAecEnabled() const { return aecEnabled_.load(); }

    bool isPlaybackActive() const;

    // PlaybackListener
    void onSessionArmed(uint64_t sessionId) override { onPlaybackStart(sessionId); }
    void onAudioStart(uint64_t sessionId) override;
    void onAudioEnd(uint64_t sessionId, bool drained) override { onPlaybackEnd(sessionId, drained); }
    void onAudioPause(uint64_t sessionId) override { onPlaybackPause(sessionId); }
    void onAudioResume(uint64_t sessionId) override { onPlaybackResume(sessionId); }
    void onFarEndAudio(const std::vector<float>& samples, int sampleRate) override;

private:
    void applyStartLocked(VoiceMode mode);
    void applyEndLocked(VoiceMode mode);
    void applyIdleLocked(VoiceMode previous);
    void applyProfileLocked(VoiceMode mode);

    RecognizerController& recognizer_;

    mutable std::mutex mutex_;
    VoiceMode mode_;
    VoiceMode appliedMode_;        // mode in force for the active playback
    uint64_t activeSession_ = 0;   // 0 = no playback

    std::atomic<bool> pushToTalkHeld_{false};
    std::atomic<bool> aecEnabled_{false};
};

} // namespace Parley
