#pragma once
#include <cstddef>
#include <vector>

namespace Parley {

// Linear-interpolation mono resampler. Returns the input unchanged when
// either rate is invalid, the rates match, or there are fewer than 2 samples.
std::vector<float> linearResampleMono(const std::vector<float>& audio, int srcRate, int dstRate);

// Scales the buffer down so its peak is 1.0 when it exceeds full scale.
// Returns true if the buffer was modified.
bool normalizePeak(std::vector<float>& audio);

// PCM16 little-endian to float [-1, 1)
std::vector<float> pcm16ToFloat(const short* pcm, size_t count);

} // namespace Parley
