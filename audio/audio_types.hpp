#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace Parley {

// ------------------------------------------------------------
// AudioChunk: one immutable block of mono float samples
// ------------------------------------------------------------
class AudioChunk {
public:
    AudioChunk(std::vector<float> samples, int sampleRate, uint64_t sessionId)
        : samples_(std::move(samples)), sampleRate_(sampleRate), sessionId_(sessionId) {}

    const std::vector<float>& samples() const { return samples_; }
    const float* data() const { return samples_.data(); }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    int sampleRate() const { return sampleRate_; }
    uint64_t sessionId() const { return sessionId_; }

    double durationSeconds() const {
        return sampleRate_ > 0 ? static_cast<double>(samples_.size()) / sampleRate_ : 0.0;
    }

private:
    const std::vector<float> samples_;
    const int sampleRate_;
    const uint64_t sessionId_;
};

using AudioChunkPtr = std::shared_ptr<const AudioChunk>;

// ------------------------------------------------------------
// Player state (read by the render callback every period)
// ------------------------------------------------------------
enum class PlayerState : uint8_t {
    Idle,
    Playing,
    Paused
};

inline const char* toString(PlayerState s) {
    switch (s) {
        case PlayerState::Idle:    return "idle";
        case PlayerState::Playing: return "playing";
        case PlayerState::Paused:  return "paused";
    }
    return "unknown";
}

// ------------------------------------------------------------
// Playback configuration ("playback" block of parley_config.json)
// ------------------------------------------------------------
struct PlaybackConfig {
    int sampleRate = 24000;
    int framesPerBuffer = 480;        // ~20ms at 24kHz
    size_t queueCapacity = 64;        // chunks
    int outputDeviceIndex = -1;       // -1 = PortAudio default
    size_t farEndCapacity = 48000;    // samples kept for the AEC tap
};

} // namespace Parley
