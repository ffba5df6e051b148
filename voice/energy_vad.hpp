#pragma once
#include <atomic>
#include <vector>

#include "voice/engines.hpp"
#include "voice/voice_types.hpp"

namespace Parley {

// ------------------------------------------------------------
// EnergyVad: RMS threshold voice activity detector
// ------------------------------------------------------------
class EnergyVad : public VoiceActivityDetector {
public:
    explicit EnergyVad(VadConfig config = {});

    bool isSpeech(const float* frame, size_t count) override;

    // Threshold = 90th percentile of ambient frame RMS * multiplier,
    // never below the configured floor
    void calibrate(const std::vector<float>& ambient) override;

    float threshold() const { return threshold_.load(); }

    static float rms(const float* samples, size_t count);

private:
    VadConfig config_;
    std::atomic<float> threshold_;
};

} // namespace Parley
