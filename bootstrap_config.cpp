#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace Parley {
namespace bootstrap_config {

// ----------------- helpers -----------------
static bool mergeDefaultsImpl(nlohmann::json& cfg,
                              const nlohmann::json& defs,
                              const std::string& prefix,
                              int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaultsImpl(cfg[key], defVal, path, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // 1 and 1.0 are both fine where a number is expected
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            LOG_WARN("Config", "Key '" + path + "' has the wrong type → default restored");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount) {
    if (!cfg.is_object()) {
        cfg = defs;
        if (patchedCount) (*patchedCount)++;
        return true;
    }
    return mergeDefaultsImpl(cfg, defs, "", patchedCount);
}

// ----------------- defaults -----------------
nlohmann::json defaultVoiceConfig() {
    return {
        {"playback", {
            {"sample_rate", 24000},
            {"frames_per_buffer", 480},
            {"queue_capacity", 64},
            {"output_device_index", -1}
        }},

        {"capture", {
            {"sample_rate", 16000},
            {"frame_ms", 30},
            {"input_device_index", -1},
            {"min_speech_ms", 600},
            {"silence_timeout_ms", 1500},
            {"min_transcription_chars", 2},
            {"max_segment_ms", 15000},
            {"ptt_silence_timeout_ms", 700},
            {"echo_gate", true},
            {"echo_gate_threshold", 0.6},
            {"echo_history_ms", 500}
        }},

        {"vad", {
            {"silence_threshold", 0.02},
            {"calibration_multiplier", 2.5}
        }},

        {"stop_phrase", {
            {"strong", nlohmann::json::array({"ok stop", "okay stop"})},
            {"ambiguous", nlohmann::json::array({"stop"})},
            {"confirm_window_ms", 1500},
            {"confirm_count", 2},
            {"check_interval_ms", 500},
            {"audio_window_ms", 2000},
            {"text_window_ms", 3000}
        }},

        {"voice", {
            {"mode", "wait"},
            {"aec_enabled", false},
            {"sanitize_markdown", true}
        }},

        {"whisper", {
            {"model_path", "models/ggml-base.en.bin"},
            {"language", "en"},
            {"max_tokens", 64},
            {"threads", 4}
        }},

        {"piper", {
            {"executable", "piper"},
            {"model_path", "models/en_US-amy-medium.onnx"},
            {"sample_rate", 22050}
        }},

        {"log", {
            {"file", "parley.log"},
            {"level", "debug"},
            {"console_level", "warn"}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_NONE", {
            {"user", ""},
            {"debug", "No error."}
        }},
        {"ERR_DEVICE_UNAVAILABLE", {
            {"user", "[Audio] Audio device unavailable."},
            {"debug", "PortAudio stream could not be opened or started."}
        }},
        {"ERR_SESSION_MISMATCH", {
            {"user", ""},
            {"debug", "Chunk for a session that is no longer active was dropped."}
        }},
        {"ERR_SESSION_CANCELLED", {
            {"user", ""},
            {"debug", "Session was cancelled while its producer was still running."}
        }},
        {"ERR_SEGMENT_TRANSCRIPTION_FAILED", {
            {"user", "[Voice] Could not transcribe that, please repeat."},
            {"debug", "VAD or transcriber threw for one speech segment; segment dropped."}
        }},
        {"ERR_UNDERRUN", {
            {"user", ""},
            {"debug", "Playback queue ran dry mid-session; silence substituted."}
        }},
        {"ERR_OVERRUN", {
            {"user", ""},
            {"debug", "Capture ring overflowed; microphone samples dropped."}
        }},
        {"ERR_INVALID_MODE_TRANSITION", {
            {"user", "[Voice] Invalid voice mode → using 'stop'."},
            {"debug", "Unexpected mode or lifecycle transition; fell back to Stop mode."}
        }},
        {"ERR_NO_SYNTHESIS_ENGINE", {
            {"user", "[Voice] No speech engine configured."},
            {"debug", "speak() called without a SynthesisEngine."}
        }},
        {"ERR_SYNTHESIS_FAILED", {
            {"user", "[Voice] Speech synthesis failed."},
            {"debug", "SynthesisEngine threw while producing audio."}
        }},
        {"ERR_AEC_UNAVAILABLE", {
            {"user", "[Voice] Echo cancellation is not available."},
            {"debug", "AEC enabled without an EchoCanceller."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "parley_config.json failed parsing or validation."}
        }},
        {"ERR_UNKNOWN_COMMAND", {
            {"user", "[Console] Unknown command. Type 'help'."},
            {"debug", "Command not found in commandMap."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- typed view -----------------
static std::vector<std::string> stringList(const nlohmann::json& arr, const std::vector<std::string>& fallback) {
    if (!arr.is_array()) return fallback;
    std::vector<std::string> out;
    for (const auto& v : arr) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

VoiceConfig parseVoiceConfig(const nlohmann::json& input) {
    nlohmann::json cfg = input;
    mergeDefaults(cfg, defaultVoiceConfig());

    VoiceConfig out;

    const auto& pb = cfg["playback"];
    out.playback.sampleRate        = pb.value("sample_rate", out.playback.sampleRate);
    out.playback.framesPerBuffer   = pb.value("frames_per_buffer", out.playback.framesPerBuffer);
    out.playback.queueCapacity     = static_cast<size_t>(std::max(1, pb.value("queue_capacity", 64)));
    out.playback.outputDeviceIndex = pb.value("output_device_index", out.playback.outputDeviceIndex);

    const auto& cap = cfg["capture"];
    out.capture.sampleRate            = cap.value("sample_rate", out.capture.sampleRate);
    out.capture.frameMs               = cap.value("frame_ms", out.capture.frameMs);
    out.capture.inputDeviceIndex      = cap.value("input_device_index", out.capture.inputDeviceIndex);
    out.capture.minSpeechMs           = cap.value("min_speech_ms", out.capture.minSpeechMs);
    out.capture.silenceTimeoutMs      = cap.value("silence_timeout_ms", out.capture.silenceTimeoutMs);
    out.capture.minTranscriptionChars = static_cast<size_t>(std::max(0, cap.value("min_transcription_chars", 2)));
    out.capture.maxSegmentMs          = cap.value("max_segment_ms", out.capture.maxSegmentMs);
    out.capture.pttSilenceTimeoutMs   = cap.value("ptt_silence_timeout_ms", out.capture.pttSilenceTimeoutMs);
    out.capture.echoGate              = cap.value("echo_gate", out.capture.echoGate);
    out.capture.echoGateThreshold     = cap.value("echo_gate_threshold", out.capture.echoGateThreshold);
    out.capture.echoHistoryMs         = cap.value("echo_history_ms", out.capture.echoHistoryMs);

    const auto& vad = cfg["vad"];
    out.vad.silenceThreshold      = vad.value("silence_threshold", out.vad.silenceThreshold);
    out.vad.calibrationMultiplier = vad.value("calibration_multiplier", out.vad.calibrationMultiplier);

    const auto& sp = cfg["stop_phrase"];
    out.stopPhrase.strong          = stringList(sp["strong"], out.stopPhrase.strong);
    out.stopPhrase.ambiguous       = stringList(sp["ambiguous"], out.stopPhrase.ambiguous);
    out.stopPhrase.confirmWindowMs = sp.value("confirm_window_ms", out.stopPhrase.confirmWindowMs);
    out.stopPhrase.confirmCount    = sp.value("confirm_count", out.stopPhrase.confirmCount);
    out.stopPhrase.checkIntervalMs = sp.value("check_interval_ms", out.stopPhrase.checkIntervalMs);
    out.stopPhrase.audioWindowMs   = sp.value("audio_window_ms", out.stopPhrase.audioWindowMs);
    out.stopPhrase.textWindowMs    = sp.value("text_window_ms", out.stopPhrase.textWindowMs);

    const auto& voice = cfg["voice"];
    const std::string modeName = voice.value("mode", std::string("wait"));
    if (!voiceModeFromString(modeName, out.mode)) {
        ErrorManager::report(Errors::InvalidModeTransition, "voice.mode \"" + modeName + "\"");
        out.mode = VoiceMode::Stop;
    }
    out.aecEnabled       = voice.value("aec_enabled", out.aecEnabled);
    out.sanitizeMarkdown = voice.value("sanitize_markdown", out.sanitizeMarkdown);

    const auto& wh = cfg["whisper"];
    out.whisper.modelPath = wh.value("model_path", out.whisper.modelPath);
    out.whisper.language  = wh.value("language", out.whisper.language);
    out.whisper.maxTokens = wh.value("max_tokens", out.whisper.maxTokens);
    out.whisper.threads   = wh.value("threads", out.whisper.threads);

    const auto& piper = cfg["piper"];
    out.piper.executable = piper.value("executable", out.piper.executable);
    out.piper.modelPath  = piper.value("model_path", out.piper.modelPath);
    out.piper.sampleRate = piper.value("sample_rate", out.piper.sampleRate);

    const auto& log = cfg["log"];
    out.logFile  = log.value("file", out.logFile);
    out.logLevel = log.value("level", out.logLevel);
    out.logConsoleLevel = log.value("console_level", out.logConsoleLevel);

    return out;
}

// ----------------- entry -----------------
VoiceConfig initAll(const fs::path& configPath) {
    nlohmann::json cfg;
    loadConfig(configPath, defaultVoiceConfig(), cfg, "Voice config", Errors::ConfigInvalid);

    // Optional user overrides of the error catalog
    fs::path errPath = configPath.parent_path() / "errors.json";
    if (fs::exists(errPath)) {
        LOG_PHASE("Errors config load", ErrorManager::load(errPath.string()));
    }

    VoiceConfig voice = parseVoiceConfig(cfg);
    setLogLevel(logLevelFromString(voice.logLevel));
    setConsoleLogLevel(logLevelFromString(voice.logConsoleLevel));
    return voice;
}

} // namespace bootstrap_config
} // namespace Parley
