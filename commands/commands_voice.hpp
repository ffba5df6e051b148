#pragma once
#include <functional>
#include <string>

#include "commands/commands_core.hpp"

namespace Parley {

class VoiceManager;

// Produces the text printed by `devices`
using DeviceLister = std::function<std::string()>;

// say, stop, pause, resume, listen, unlisten, mode, ptt, aec,
// calibrate, status, devices, help
CommandMap makeVoiceCommands(VoiceManager& voice, DeviceLister listDevices);

std::string helpText();

} // namespace Parley
