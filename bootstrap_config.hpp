#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "voice/voice_types.hpp"

// Centralized config bootstrap for Parley
namespace Parley {
namespace bootstrap_config {

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Fills missing / mistyped keys of cfg from defs; true if anything changed
    bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultVoiceConfig();
    nlohmann::json defaultErrors();

    // Typed view of parley_config.json (input already merged with defaults)
    VoiceConfig parseVoiceConfig(const nlohmann::json& cfg);

    // Loads parley_config.json, applies the log level and returns the settings
    VoiceConfig initAll(const std::filesystem::path& configPath);
}
} // namespace Parley
