#pragma once
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voice/voice_types.hpp"

namespace Parley {

enum class StopMatchClass : uint8_t {
    Strong,                      // triggers immediately
    AmbiguousNeedsConfirmation   // needs a repeat or confirm()
};

const char* toString(StopMatchClass c);

struct StopPhraseMatch {
    std::string text;            // normalized text that matched
    StopMatchClass matchClass = StopMatchClass::Strong;
    bool triggered = false;      // the stop handler was invoked for this match
};

// ------------------------------------------------------------
// StopPhraseDetector
//
// Keeps a rolling window of normalized partial transcripts and
// matches it against the configured phrases. Strong phrases fire
// the stop handler at once; ambiguous ones need confirmCount hits
// inside confirmWindowMs, or an explicit confirm().
//
// Thread-safe: observe() runs on the capture thread, confirm() and
// reset() may come from anywhere. The handler is called without the
// internal lock held.
// ------------------------------------------------------------
class StopPhraseDetector {
public:
    using Clock = std::chrono::steady_clock;
    using StopHandler = std::function<void(const StopPhraseMatch&)>;

    explicit StopPhraseDetector(StopPhraseConfig config = {});

    // Lowercase, punctuation to spaces, whitespace collapsed
    static std::string normalize(const std::string& text);

    // Stateless match of one text against the phrase sets
    std::optional<StopPhraseMatch> classify(const std::string& text) const;

    // The whole text is a stop phrase: a strong match, or an ambiguous
    // phrase said alone or repeated ("stop", "stop stop")
    bool isStopUtterance(const std::string& text) const;

    // Feed a partial transcript. Returns the match (triggered or pending)
    // or nullopt when nothing matched.
    std::optional<StopPhraseMatch> observe(const std::string& text, Clock::time_point now = Clock::now());

    // Secondary signal for a pending ambiguous match
    bool confirm(Clock::time_point now = Clock::now());

    // Per-session reset
    void reset();

    void setStopHandler(StopHandler handler);

    bool hasPendingConfirmation() const;
    std::string windowText() const;

    const StopPhraseConfig& config() const { return config_; }

private:
    struct TextEntry {
        Clock::time_point at;
        std::string text;
    };

    static bool matchesPhrase(const std::string& normalized, const std::string& phrase);
    static bool isOkLikeStop(const std::vector<std::string>& tokens);
    static int repeatCount(const std::string& normalized, const std::string& phrase);

    void pruneLocked(Clock::time_point now);
    void clearLocked();
    void fire(StopPhraseMatch match);

    StopPhraseConfig config_;
    std::vector<std::string> strong_;
    std::vector<std::string> ambiguous_;

    mutable std::mutex mutex_;
    std::deque<TextEntry> window_;
    std::deque<Clock::time_point> ambiguousHits_;
    std::string pendingText_;

    std::mutex handlerMutex_;
    StopHandler handler_;
};

} // namespace Parley
