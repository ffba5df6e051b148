#include "voice/stop_phrase.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace Parley {

const char* toString(StopMatchClass c) {
    switch (c) {
        case StopMatchClass::Strong:                     return "strong";
        case StopMatchClass::AmbiguousNeedsConfirmation: return "ambiguous";
    }
    return "unknown";
}

// ============================================================
// Helpers
// ============================================================
static std::vector<std::string> splitTokens(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

static int levenshteinDistance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    std::vector<int> prev(n + 1), curr(n + 1);

    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; j++) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        prev.swap(curr);
    }
    return prev[n];
}

static bool isOkLike(const std::string& token) {
    return levenshteinDistance(token, "ok") <= 1 || levenshteinDistance(token, "okay") <= 1;
}

static bool isOkStopPhrase(const std::string& phrase) {
    return phrase == "ok stop" || phrase == "okay stop";
}

// ============================================================
// StopPhraseDetector
// ============================================================
StopPhraseDetector::StopPhraseDetector(StopPhraseConfig config)
    : config_(std::move(config)) {
    for (const auto& p : config_.strong) {
        std::string n = normalize(p);
        if (!n.empty()) strong_.push_back(n);
    }
    for (const auto& p : config_.ambiguous) {
        std::string n = normalize(p);
        if (!n.empty()) ambiguous_.push_back(n);
    }
    if (config_.confirmCount < 1) config_.confirmCount = 1;
}

std::string StopPhraseDetector::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;

    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            if (pendingSpace && !out.empty()) out.push_back(' ');
            pendingSpace = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            // punctuation and whitespace both separate words
            pendingSpace = true;
        }
    }
    return out;
}

// Exact, prefix ("stop please") or suffix ("please stop"), never infix
bool StopPhraseDetector::matchesPhrase(const std::string& normalized, const std::string& phrase) {
    if (normalized == phrase) return true;
    if (normalized.size() > phrase.size()) {
        if (normalized.compare(0, phrase.size() + 1, phrase + " ") == 0) return true;
        const std::string suffix = " " + phrase;
        if (normalized.compare(normalized.size() - suffix.size(), suffix.size(), suffix) == 0) return true;
    }
    return false;
}

// "okey stop", "oh stop", "okay please stop"
bool StopPhraseDetector::isOkLikeStop(const std::vector<std::string>& tokens) {
    if (tokens.size() != 2 && tokens.size() != 3) return false;
    if (tokens.back() != "stop") return false;

    if (isOkLike(tokens[tokens.size() - 2])) return true;
    return tokens.size() == 3 && isOkLike(tokens[0]);
}

int StopPhraseDetector::repeatCount(const std::string& normalized, const std::string& phrase) {
    const auto toks = splitTokens(normalized);
    const auto ptoks = splitTokens(phrase);
    if (ptoks.empty() || toks.size() % ptoks.size() != 0) return 1;

    for (size_t i = 0; i < toks.size(); ++i) {
        if (toks[i] != ptoks[i % ptoks.size()]) return 1;
    }
    return static_cast<int>(toks.size() / ptoks.size());
}

std::optional<StopPhraseMatch> StopPhraseDetector::classify(const std::string& text) const {
    const std::string n = normalize(text);
    if (n.empty()) return std::nullopt;

    const auto tokens = splitTokens(n);
    for (const auto& phrase : strong_) {
        if ((isOkStopPhrase(phrase) && isOkLikeStop(tokens)) || matchesPhrase(n, phrase)) {
            return StopPhraseMatch{n, StopMatchClass::Strong, false};
        }
    }
    for (const auto& phrase : ambiguous_) {
        if (matchesPhrase(n, phrase)) {
            return StopPhraseMatch{n, StopMatchClass::AmbiguousNeedsConfirmation, false};
        }
    }
    return std::nullopt;
}

bool StopPhraseDetector::isStopUtterance(const std::string& text) const {
    auto match = classify(text);
    if (!match) return false;
    if (match->matchClass == StopMatchClass::Strong) return true;

    for (const auto& phrase : ambiguous_) {
        if (match->text == phrase || repeatCount(match->text, phrase) > 1) return true;
    }
    return false;
}

void StopPhraseDetector::pruneLocked(Clock::time_point now) {
    const auto textWindow = std::chrono::milliseconds(config_.textWindowMs);
    while (!window_.empty() && now - window_.front().at > textWindow) {
        window_.pop_front();
    }

    const auto confirmWindow = std::chrono::milliseconds(config_.confirmWindowMs);
    while (!ambiguousHits_.empty() && now - ambiguousHits_.front() > confirmWindow) {
        ambiguousHits_.pop_front();
    }
    if (ambiguousHits_.empty()) pendingText_.clear();
}

void StopPhraseDetector::clearLocked() {
    window_.clear();
    ambiguousHits_.clear();
    pendingText_.clear();
}

std::optional<StopPhraseMatch> StopPhraseDetector::observe(const std::string& text, Clock::time_point now) {
    std::optional<StopPhraseMatch> match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneLocked(now);

        const std::string n = normalize(text);
        if (n.empty()) return std::nullopt;
        window_.push_back({now, n});

        match = classify(n);
        if ((!match || match->matchClass != StopMatchClass::Strong) && window_.size() > 1) {
            // Phrase split across partials ("ok" ... "stop")
            std::string joined;
            for (const auto& e : window_) {
                if (!joined.empty()) joined.push_back(' ');
                joined += e.text;
            }
            auto whole = classify(joined);
            if (whole && (!match || whole->matchClass == StopMatchClass::Strong)) {
                match = whole;
            }
        }
        if (!match) return std::nullopt;

        if (match->matchClass == StopMatchClass::Strong) {
            clearLocked();
            match->triggered = true;
        } else {
            int hits = 1;
            for (const auto& phrase : ambiguous_) {
                if (matchesPhrase(match->text, phrase)) {
                    hits = std::max(hits, repeatCount(match->text, phrase));
                }
            }
            for (int i = 0; i < hits; ++i) ambiguousHits_.push_back(now);

            // Consumed: the same words must not count again on the next partial
            window_.clear();
            pendingText_ = match->text;

            if (static_cast<int>(ambiguousHits_.size()) >= config_.confirmCount) {
                clearLocked();
                match->triggered = true;
            } else {
                LOG_DEBUG("StopPhrase", "Ambiguous \"" + match->text + "\" awaiting confirmation");
            }
        }
    }

    if (match->triggered) fire(*match);
    return match;
}

bool StopPhraseDetector::confirm(Clock::time_point now) {
    StopPhraseMatch match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneLocked(now);
        if (ambiguousHits_.empty()) return false;

        match.text = pendingText_;
        match.matchClass = StopMatchClass::AmbiguousNeedsConfirmation;
        match.triggered = true;
        clearLocked();
    }
    fire(match);
    return true;
}

void StopPhraseDetector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    clearLocked();
}

void StopPhraseDetector::setStopHandler(StopHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handler_ = std::move(handler);
}

bool StopPhraseDetector::hasPendingConfirmation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !ambiguousHits_.empty();
}

std::string StopPhraseDetector::windowText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string joined;
    for (const auto& e : window_) {
        if (!joined.empty()) joined.push_back(' ');
        joined += e.text;
    }
    return joined;
}

void StopPhraseDetector::fire(StopPhraseMatch match) {
    StopHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = handler_;
    }
    LOG_DEBUG("StopPhrase", std::string("Stop phrase (") + toString(match.matchClass) + "): \"" + match.text + "\"");
    if (handler) handler(match);
}

} // namespace Parley
