#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "voice/engines.hpp"
#include "voice/voice_types.hpp"

struct whisper_context;

namespace Parley {

// ------------------------------------------------------------
// whisper.cpp transcriber. The model is loaded lazily on the first
// segment; load and inference failures throw std::runtime_error.
// ------------------------------------------------------------
class WhisperTranscriber : public Transcriber {
public:
    explicit WhisperTranscriber(WhisperConfig config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    std::string transcribe(const std::vector<float>& samples, int sampleRate) override;

    bool isLoaded() const;

private:
    void ensureLoadedLocked();

    WhisperConfig config_;
    mutable std::mutex mutex_;
    whisper_context* ctx_ = nullptr;
};

} // namespace Parley
