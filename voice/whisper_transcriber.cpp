#include "voice/whisper_transcriber.hpp"
#include "audio/resample.hpp"
#include "logger.hpp"

#include <whisper.h>

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Parley {

static constexpr int kWhisperRate = WHISPER_SAMPLE_RATE;   // 16 kHz

WhisperTranscriber::WhisperTranscriber(WhisperConfig config)
    : config_(std::move(config)) {}

WhisperTranscriber::~WhisperTranscriber() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperTranscriber::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_ != nullptr;
}

void WhisperTranscriber::ensureLoadedLocked() {
    if (ctx_) return;

    const fs::path modelPath(config_.modelPath);
    LOG_DEBUG("Whisper", "Looking for Whisper model at: " + modelPath.string());

    if (!fs::exists(modelPath)) {
        LOG_PHASE("Whisper model load", false);
        throw std::runtime_error("Whisper model missing: " + modelPath.string());
    }

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath.string().c_str(), cparams);
    if (!ctx_) {
        LOG_PHASE("Whisper model load", false);
        throw std::runtime_error("Failed to load Whisper model: " + modelPath.string());
    }

    LOG_PHASE("Whisper model load", true);
}

std::string WhisperTranscriber::transcribe(const std::vector<float>& samples, int sampleRate) {
    if (samples.empty()) return "";

    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();

    std::vector<float> pcm = (sampleRate > 0 && sampleRate != kWhisperRate)
                                 ? linearResampleMono(samples, sampleRate, kWhisperRate)
                                 : samples;

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.no_timestamps    = true;
    wparams.print_progress   = false;
    wparams.print_realtime   = false;
    wparams.print_special    = false;
    wparams.single_segment   = true;
    wparams.language         = config_.language.c_str();
    wparams.max_tokens       = config_.maxTokens;
    wparams.n_threads        = config_.threads;

    if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        throw std::runtime_error("whisper_full failed");
    }

    std::string transcript;
    const int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; i++) {
        transcript += whisper_full_get_segment_text(ctx_, i);
        transcript += " ";
    }
    if (!transcript.empty() && transcript.back() == ' ')
        transcript.pop_back();

    return transcript;
}

} // namespace Parley
