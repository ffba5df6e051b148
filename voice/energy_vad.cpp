#include "voice/energy_vad.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>

namespace Parley {

static constexpr size_t kCalibrationFrame = 480;   // 30ms at 16kHz
static constexpr float kMaxThreshold = 0.3f;

EnergyVad::EnergyVad(VadConfig config)
    : config_(config), threshold_(config.silenceThreshold) {}

float EnergyVad::rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;
    double energy = 0.0;
    for (size_t i = 0; i < count; ++i) energy += static_cast<double>(samples[i]) * samples[i];
    energy /= static_cast<double>(count);
    return static_cast<float>(std::sqrt(energy));
}

bool EnergyVad::isSpeech(const float* frame, size_t count) {
    return rms(frame, count) >= threshold_.load();
}

void EnergyVad::calibrate(const std::vector<float>& ambient) {
    if (ambient.size() < kCalibrationFrame) {
        LOG_WARN("VAD", "Calibration skipped: not enough ambient audio");
        return;
    }

    std::vector<float> levels;
    for (size_t pos = 0; pos + kCalibrationFrame <= ambient.size(); pos += kCalibrationFrame) {
        levels.push_back(rms(ambient.data() + pos, kCalibrationFrame));
    }
    std::sort(levels.begin(), levels.end());
    const float ambientLevel = levels[std::min(levels.size() - 1, levels.size() * 9 / 10)];

    float next = std::max(ambientLevel * config_.calibrationMultiplier, config_.silenceThreshold);
    if (next > kMaxThreshold) {
        LOG_WARN("VAD", "High ambient noise, capping threshold");
        next = kMaxThreshold;
    }
    threshold_.store(next);

    LOG_DEBUG("VAD", "Calibrated: ambient=" + std::to_string(ambientLevel) +
                     " threshold=" + std::to_string(next));
}

} // namespace Parley
