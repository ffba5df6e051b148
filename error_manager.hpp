#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

namespace Parley {

// ------------------------------------------------------------
// VoiceResult: unified return type for fallible operations
// ------------------------------------------------------------
struct VoiceResult {
    bool success = true;     // true if the operation went through
    std::string message;     // user-facing text
    std::string errorCode;   // "ERR_NONE" or an ErrorManager code

    explicit operator bool() const { return success; }
    bool is(const std::string& code) const { return errorCode == code; }
};

// ------------------------------------------------------------
// Error codes (keys of the errors catalog)
// ------------------------------------------------------------
namespace Errors {
    inline constexpr const char* None                       = "ERR_NONE";
    inline constexpr const char* DeviceUnavailable          = "ERR_DEVICE_UNAVAILABLE";
    inline constexpr const char* SessionMismatch            = "ERR_SESSION_MISMATCH";
    inline constexpr const char* SessionCancelled           = "ERR_SESSION_CANCELLED";
    inline constexpr const char* SegmentTranscriptionFailed = "ERR_SEGMENT_TRANSCRIPTION_FAILED";
    inline constexpr const char* Underrun                   = "ERR_UNDERRUN";
    inline constexpr const char* Overrun                    = "ERR_OVERRUN";
    inline constexpr const char* InvalidModeTransition      = "ERR_INVALID_MODE_TRANSITION";
    inline constexpr const char* NoSynthesisEngine          = "ERR_NO_SYNTHESIS_ENGINE";
    inline constexpr const char* SynthesisFailed            = "ERR_SYNTHESIS_FAILED";
    inline constexpr const char* AecUnavailable             = "ERR_AEC_UNAVAILABLE";
    inline constexpr const char* ConfigInvalid              = "ERR_CONFIG_INVALID";
    inline constexpr const char* UnknownCommand             = "ERR_UNKNOWN_COMMAND";
}

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json); the built-in catalog stays
    // active when the file is missing or invalid
    bool load(const std::string& path);

    // Replace the active catalog
    void setCatalog(const nlohmann::json& catalog);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error: logs the debug text, returns a failed VoiceResult
    VoiceResult report(const std::string& code, const std::string& detail = "");

    // Same as report() but logged at trace level (expected races)
    VoiceResult quiet(const std::string& code, const std::string& detail = "");

    VoiceResult ok(const std::string& message = "");
}

} // namespace Parley
