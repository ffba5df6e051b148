#pragma once
#include <functional>
#include <string>
#include <vector>

namespace Parley {

// ------------------------------------------------------------
// External engines. Implementations signal failure by throwing
// (std::runtime_error); callers catch at the segment / batch boundary.
// ------------------------------------------------------------

// Text -> PCM batches, invoked off the real-time thread
class SynthesisEngine {
public:
    // Return false to stop synthesis (session cancelled)
    using BatchCallback = std::function<bool(std::vector<float> samples, int sampleRate)>;

    virtual ~SynthesisEngine() = default;
    virtual void synthesize(const std::string& text, const BatchCallback& onBatch) = 0;
};

// Speech segment -> text
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::string transcribe(const std::vector<float>& samples, int sampleRate) = 0;
};

// One fixed-size frame -> speech / silence
class VoiceActivityDetector {
public:
    virtual ~VoiceActivityDetector() = default;
    virtual bool isSpeech(const float* frame, size_t count) = 0;

    // Measure ambient noise; engines without calibration ignore it
    virtual void calibrate(const std::vector<float>& /*ambient*/) {}
};

// Near-end mic audio + far-end reference -> echo-cancelled mic audio
class EchoCanceller {
public:
    virtual ~EchoCanceller() = default;
    virtual void feedFarEnd(const std::vector<float>& samples, int sampleRate) = 0;
    virtual void process(float* nearEnd, size_t count) = 0;
};

} // namespace Parley
