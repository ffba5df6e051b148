#include "commands/commands_voice.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "voice/voice_manager.hpp"

#include <iostream>

namespace Parley {

static CommandResult fromVoiceResult(const VoiceResult& r, const std::string& okMessage) {
    if (!r) {
        return { r.message, false, r.errorCode };
    }
    return { r.message.empty() ? okMessage : r.message, true, Errors::None };
}

static CommandResult usage(const std::string& text) {
    return { "[Usage] " + text, false, Errors::UnknownCommand };
}

std::string helpText() {
    return
        "[Help] Available commands:\n"
        "- say <text>\n"
        "- stop\n"
        "- pause\n"
        "- resume\n"
        "- listen\n"
        "- unlisten\n"
        "- mode <full|wait|stop|ptt>\n"
        "- ptt <down|up>\n"
        "- aec <on|off>\n"
        "- calibrate [ms]\n"
        "- status\n"
        "- devices\n"
        "- help\n"
        "- quit";
}

CommandMap makeVoiceCommands(VoiceManager& voice, DeviceLister listDevices) {
    CommandMap commands;

    // --- Output ---
    commands["say"] = [&voice](const std::string& arg) -> CommandResult {
        if (arg.empty()) return usage("say <text>");
        return fromVoiceResult(voice.speak(arg), "[Voice] Speaking.");
    };
    commands["stop"] = [&voice](const std::string&) -> CommandResult {
        if (!voice.stopSpeaking()) return { "[Voice] Nothing is playing.", true, Errors::None };
        return { "[Voice] Stopped.", true, Errors::None };
    };
    commands["pause"] = [&voice](const std::string&) -> CommandResult {
        if (!voice.pauseSpeaking()) return { "[Voice] Nothing to pause.", true, Errors::None };
        return { "[Voice] Paused.", true, Errors::None };
    };
    commands["resume"] = [&voice](const std::string&) -> CommandResult {
        if (!voice.resumeSpeaking()) return { "[Voice] Nothing to resume.", true, Errors::None };
        return { "[Voice] Resumed.", true, Errors::None };
    };

    // --- Input ---
    commands["listen"] = [&voice](const std::string&) -> CommandResult {
        VoiceResult r = voice.listen(
            [](const std::string& text) { std::cout << "\n[Heard] " << text << "\n> " << std::flush; },
            [](const std::string& phrase) { std::cout << "\n[Stop] \"" << phrase << "\"\n> " << std::flush; });
        return fromVoiceResult(r, "[Voice] Listening.");
    };
    commands["unlisten"] = [&voice](const std::string&) -> CommandResult {
        voice.stopListening();
        return { "[Voice] Not listening.", true, Errors::None };
    };

    // --- Coordination ---
    commands["mode"] = [&voice](const std::string& arg) -> CommandResult {
        if (arg.empty()) {
            return { std::string("[Voice] Mode: ") + toString(voice.voiceMode()), true, Errors::None };
        }
        return fromVoiceResult(voice.setVoiceMode(arg), "");
    };
    commands["ptt"] = [&voice](const std::string& arg) -> CommandResult {
        if (arg == "down") {
            voice.pushToTalk(true);
            return { "[Voice] Push-to-talk: talking.", true, Errors::None };
        }
        if (arg == "up") {
            voice.pushToTalk(false);
            return { "[Voice] Push-to-talk: released.", true, Errors::None };
        }
        return usage("ptt <down|up>");
    };
    commands["aec"] = [&voice](const std::string& arg) -> CommandResult {
        if (arg != "on" && arg != "off") return usage("aec <on|off>");
        return fromVoiceResult(voice.enableAec(arg == "on"), "[Voice] AEC " + arg + ".");
    };
    commands["calibrate"] = [&voice](const std::string& arg) -> CommandResult {
        int ms = 1000;
        if (!arg.empty()) {
            try {
                ms = std::stoi(arg);
            } catch (const std::exception&) {
                return usage("calibrate [ms]");
            }
        }
        return fromVoiceResult(voice.calibrateVad(ms), "");
    };

    // --- Interface ---
    commands["status"] = [&voice](const std::string&) -> CommandResult {
        std::string s = "[Status]\n";
        s += std::string("- player: ") + toString(voice.player().state()) + "\n";
        s += std::string("- recognizer: ") + toString(voice.recognizer().state()) + "\n";
        s += std::string("- mode: ") + toString(voice.voiceMode()) + "\n";
        s += std::string("- aec: ") + (voice.coordinator().isAecEnabled() ? "on" : "off") + "\n";
        s += "- output rate: " + std::to_string(voice.player().outputSampleRate()) + " Hz\n";
        s += "- underruns: " + std::to_string(voice.player().underrunCount());
        return { s, true, Errors::None };
    };
    commands["devices"] = [listDevices](const std::string&) -> CommandResult {
        if (!listDevices) return { "[Audio] Device listing unavailable.", false, Errors::DeviceUnavailable };
        return { listDevices(), true, Errors::None };
    };
    commands["help"] = [](const std::string&) -> CommandResult {
        return { helpText(), true, Errors::None };
    };

    return commands;
}

} // namespace Parley
