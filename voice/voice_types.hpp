#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "audio/audio_types.hpp"

namespace Parley {

// ------------------------------------------------------------
// Voice mode: how capture behaves while the assistant speaks
// ------------------------------------------------------------
enum class VoiceMode : uint8_t {
    Full,        // barge-in: any speech may stop playback
    Wait,        // capture paused for the whole utterance
    Stop,        // transcripts suppressed, stop phrases still heard
    PushToTalk   // like Stop, capture otherwise driven by a key
};

const char* toString(VoiceMode mode);

// Accepts "full", "wait", "stop", "ptt" / "push_to_talk" (case-insensitive)
bool voiceModeFromString(const std::string& name, VoiceMode& out);

// ------------------------------------------------------------
// Recognizer state
// ------------------------------------------------------------
enum class RecognizerState : uint8_t {
    Idle,
    Listening,
    ListeningPausedForPlayback,
    Suppressed
};

const char* toString(RecognizerState state);

// ------------------------------------------------------------
// Config blocks (parley_config.json)
// ------------------------------------------------------------
struct CaptureConfig {
    int sampleRate = 16000;
    int frameMs = 30;
    int inputDeviceIndex = -1;
    int minSpeechMs = 600;
    int silenceTimeoutMs = 1500;
    size_t minTranscriptionChars = 2;
    int maxSegmentMs = 15000;

    // Push-to-talk: the key marks speech, so one frame starts a segment
    // and the silence timeout is capped at this value
    int pttSilenceTimeoutMs = 700;

    // Without AEC, speech that correlates with recent far-end audio
    // does not trigger barge-in
    bool echoGate = true;
    float echoGateThreshold = 0.6f;
    int echoHistoryMs = 500;

    int frameSamples() const { return sampleRate * frameMs / 1000; }
};

struct VadConfig {
    float silenceThreshold = 0.02f;
    float calibrationMultiplier = 2.5f;
};

struct StopPhraseConfig {
    std::vector<std::string> strong{"ok stop", "okay stop"};
    std::vector<std::string> ambiguous{"stop"};
    int confirmWindowMs = 1500;
    int confirmCount = 2;
    int checkIntervalMs = 500;
    int audioWindowMs = 2000;
    int textWindowMs = 3000;
};

struct WhisperConfig {
    std::string modelPath = "models/ggml-base.en.bin";
    std::string language = "en";
    int maxTokens = 64;
    int threads = 4;
};

struct PiperConfig {
    std::string executable = "piper";
    std::string modelPath = "models/en_US-amy-medium.onnx";
    int sampleRate = 22050;
};

struct VoiceConfig {
    PlaybackConfig playback;
    CaptureConfig capture;
    VadConfig vad;
    StopPhraseConfig stopPhrase;
    WhisperConfig whisper;
    PiperConfig piper;

    VoiceMode mode = VoiceMode::Wait;
    bool aecEnabled = false;
    bool sanitizeMarkdown = true;

    std::string logFile = "parley.log";
    std::string logLevel = "debug";
    std::string logConsoleLevel = "warn";
};

} // namespace Parley
