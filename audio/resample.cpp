#include "audio/resample.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Parley {

std::vector<float> linearResampleMono(const std::vector<float>& audio, int srcRate, int dstRate) {
    if (srcRate <= 0 || dstRate <= 0 || srcRate == dstRate || audio.size() < 2) {
        return audio;
    }

    const double ratio = static_cast<double>(dstRate) / static_cast<double>(srcRate);
    const size_t newLen = std::max<size_t>(1, static_cast<size_t>(std::llround(audio.size() * ratio)));

    std::vector<float> out(newLen);
    if (newLen == 1) {
        out[0] = audio.front();
        return out;
    }

    // Both grids span [0, 1] end-to-end so first and last samples are kept
    const double step = static_cast<double>(audio.size() - 1) / static_cast<double>(newLen - 1);
    for (size_t i = 0; i < newLen; ++i) {
        const double pos = i * step;
        const size_t idx = static_cast<size_t>(pos);
        if (idx + 1 >= audio.size()) {
            out[i] = audio.back();
            continue;
        }
        const double frac = pos - static_cast<double>(idx);
        out[i] = static_cast<float>(audio[idx] + (audio[idx + 1] - audio[idx]) * frac);
    }
    return out;
}

bool normalizePeak(std::vector<float>& audio) {
    float peak = 0.0f;
    for (float s : audio) peak = std::max(peak, std::fabs(s));
    if (peak <= 1.0f) return false;

    for (float& s : audio) s /= peak;
    return true;
}

std::vector<float> pcm16ToFloat(const short* pcm, size_t count) {
    std::vector<float> out(count);
    for (size_t i = 0; i < count; ++i) {
        out[i] = static_cast<float>(pcm[i]) / 32768.0f;
    }
    return out;
}

} // namespace Parley
