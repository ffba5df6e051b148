#pragma once
#include <string>

#include "voice/engines.hpp"
#include "voice/voice_types.hpp"

namespace Parley {

// ------------------------------------------------------------
// PiperSynthesizer: runs the piper executable per utterance
// (`piper --model <m> --output_raw`), writes the text to its stdin
// and streams 16-bit mono PCM from its stdout in batches.
// ------------------------------------------------------------
class PiperSynthesizer : public SynthesisEngine {
public:
    explicit PiperSynthesizer(PiperConfig config);

    // Throws std::runtime_error when the process cannot be started or
    // exits with an error before producing audio
    void synthesize(const std::string& text, const BatchCallback& onBatch) override;

private:
    PiperConfig config_;
};

} // namespace Parley
