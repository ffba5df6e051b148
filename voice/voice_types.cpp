#include "voice/voice_types.hpp"

#include <algorithm>
#include <cctype>

namespace Parley {

const char* toString(VoiceMode mode) {
    switch (mode) {
        case VoiceMode::Full:       return "full";
        case VoiceMode::Wait:       return "wait";
        case VoiceMode::Stop:       return "stop";
        case VoiceMode::PushToTalk: return "ptt";
    }
    return "unknown";
}

bool voiceModeFromString(const std::string& name, VoiceMode& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "full")                                    { out = VoiceMode::Full; return true; }
    if (s == "wait")                                    { out = VoiceMode::Wait; return true; }
    if (s == "stop")                                    { out = VoiceMode::Stop; return true; }
    if (s == "ptt" || s == "push_to_talk" || s == "pushtotalk") {
        out = VoiceMode::PushToTalk;
        return true;
    }
    return false;
}

const char* toString(RecognizerState state) {
    switch (state) {
        case RecognizerState::Idle:                       return "idle";
        case RecognizerState::Listening:                  return "listening";
        case RecognizerState::ListeningPausedForPlayback: return "paused_for_playback";
        case RecognizerState::Suppressed:                 return "suppressed";
    }
    return "unknown";
}

} // namespace Parley
