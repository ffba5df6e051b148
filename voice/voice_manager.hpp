#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "audio/streaming_player.hpp"
#include "error_manager.hpp"
#include "voice/engines.hpp"
#include "voice/recognizer_controller.hpp"
#include "voice/voice_mode.hpp"
#include "voice/voice_types.hpp"

namespace Parley {

// ------------------------------------------------------------
// VoiceManager: the application-facing voice API.
// Owns one player, one recognizer and the mode coordinator wiring
// them together. Instances are independent (no global state).
// ------------------------------------------------------------
class VoiceManager : private PlaybackListener {
public:
    using SessionCallback = std::function<void(uint64_t sessionId)>;
    using EndCallback = std::function<void(uint64_t sessionId, bool drained)>;
    using ErrorCallback = std::function<void(const VoiceResult& error)>;

    struct Engines {
        std::shared_ptr<AudioOutputDevice> output;
        std::shared_ptr<AudioInputDevice> input;
        std::shared_ptr<SynthesisEngine> synthesis;
        std::shared_ptr<Transcriber> transcriber;
        std::shared_ptr<VoiceActivityDetector> vad;
        std::shared_ptr<EchoCanceller> echoCanceller;   // optional
    };

    struct Options {
        VoiceConfig config;
        bool dispatchThread = true;
        bool captureThread = true;
    };

    VoiceManager(Options options, Engines engines);
    ~VoiceManager() override;

    VoiceManager(const VoiceManager&) = delete;
    VoiceManager& operator=(const VoiceManager&) = delete;

    // ---- Speech output ----
    // Cancels whatever is playing, then synthesizes on a worker thread.
    // Returns once playback is armed; audio starts with the first batch.
    VoiceResult speak(const std::string& text, PlaybackSession::CompletionCallback onComplete = {});
    VoiceResult speak(const PlaybackSessionPtr& session, const std::string& text);

    bool stopSpeaking();
    bool pauseSpeaking();
    bool resumeSpeaking();
    bool isSpeaking() const;
    bool isPaused() const;

    // ---- Speech input ----
    // on_stop fires after playback was stopped by a stop phrase
    VoiceResult listen(RecognizerController::TranscriptCallback onTranscript,
                       RecognizerController::StopCallback onStop = {});
    void stopListening();
    bool isListening() const { return recognizer_.isRunning(); }

    // ---- Coordination ----
    void setVoiceMode(VoiceMode mode);
    VoiceResult setVoiceMode(const std::string& name);
    VoiceMode voiceMode() const;

    VoiceResult enableAec(bool enabled);
    void pushToTalk(bool pressed);
    VoiceResult calibrateVad(int ambientMs = 1000);

    // ---- Notifications (player dispatcher thread) ----
    void setOnAudioStart(SessionCallback cb);
    void setOnAudioEnd(EndCallback cb);
    void setOnAudioPause(SessionCallback cb);
    void setOnAudioResume(SessionCallback cb);
    void setOnError(ErrorCallback cb);

    // Stops capture and playback, joins workers, closes devices
    void shutdown();

    StreamingPlayer& player() { return player_; }
    RecognizerController& recognizer() { return recognizer_; }
    VoiceModeCoordinator& coordinator() { return coordinator_; }
    const VoiceConfig& config() const { return options_.config; }

private:
    void onAudioStart(uint64_t sessionId) override;
    void onAudioEnd(uint64_t sessionId, bool drained) override;
    void onAudioPause(uint64_t sessionId) override;
    void onAudioResume(uint64_t sessionId) override;

    void synthesisWorker(PlaybackSessionPtr session, std::string text);
    void reportError(const VoiceResult& error);

    Options options_;
    Engines engines_;

    // Destroyed in reverse: the player (and its dispatcher) goes first
    RecognizerController recognizer_;
    VoiceModeCoordinator coordinator_;
    StreamingPlayer player_;

    std::mutex speakMutex_;
    std::thread synthThread_;

    std::mutex callbackMutex_;
    SessionCallback onStart_;
    EndCallback onEnd_;
    SessionCallback onPause_;
    SessionCallback onResume_;
    ErrorCallback onError_;

    std::once_flag shutdownOnce_;
};

} // namespace Parley
