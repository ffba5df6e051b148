#include "audio/portaudio_device.hpp"
#include "bootstrap_config.hpp"
#include "commands/commands_core.hpp"
#include "commands/commands_voice.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "voice/energy_vad.hpp"
#include "voice/piper_synthesizer.hpp"
#include "voice/voice_manager.hpp"
#include "voice/whisper_transcriber.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace Parley;

// ============================================================
// Device listing for the `devices` command
// ============================================================
static std::string formatDevices() {
    auto devices = listAudioDevices();
    if (devices.empty()) {
        return "[Audio] No PortAudio devices found.";
    }

    std::ostringstream out;
    out << "=== PortAudio Device List ===\n";
    out << "Found " << devices.size() << " devices total\n\n";
    for (const auto& d : devices) {
        out << "Device #" << d.index << ": " << d.name << "  (Host API: " << d.hostApi << ")\n";
        out << "  Max input channels : " << d.maxInputChannels << "\n";
        out << "  Max output channels: " << d.maxOutputChannels << "\n";
        out << "  Default sample rate: " << d.defaultSampleRate << "\n";
        if (d.isDefaultInput)  out << "  *** Default INPUT device ***\n";
        if (d.isDefaultOutput) out << "  *** Default OUTPUT device ***\n";
    }
    return out.str();
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    // Piper exiting early must not kill us on the next write
    std::signal(SIGPIPE, SIG_IGN);

    initLogger("parley.log");
    beginPhaseGroup();
    LOG_PHASE("Startup begin", true);

    const fs::path configPath = (argc > 1) ? fs::path(argv[1]) : fs::path("parley_config.json");
    VoiceConfig config = bootstrap_config::initAll(configPath);
    LOG_PHASE("Bootstrap checks complete", true);

    if (config.logFile != "parley.log") {
        shutdownLogger();
        initLogger(config.logFile);
        setLogLevel(logLevelFromString(config.logLevel));
    }
    if (!logFilePath().empty()) {
        std::cout << "Logging to " << logFilePath() << "\n";
    }

    VoiceManager::Engines engines;
    engines.output      = std::make_shared<PortAudioOutput>();
    engines.input       = std::make_shared<PortAudioInput>();
    engines.synthesis   = std::make_shared<PiperSynthesizer>(config.piper);
    engines.transcriber = std::make_shared<WhisperTranscriber>(config.whisper);
    engines.vad         = std::make_shared<EnergyVad>(config.vad);

    VoiceManager::Options options;
    options.config = config;

    VoiceManager voice(options, engines);
    voice.setOnError([](const VoiceResult& err) {
        if (!err.message.empty()) std::cerr << "\n" << err.message << "\n> " << std::flush;
    });

    CommandMap commands = makeVoiceCommands(voice, formatDevices);
    LOG_PHASE("Startup complete, entering main loop", true);
    endPhaseGroup();

    std::cout << "Parley voice console. Type 'help' for commands.\n";

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "> " << std::flush; // REPL prompt
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.empty()) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        handleCommand(commands, line);
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    voice.shutdown();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
