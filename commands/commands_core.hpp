#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace Parley {

// ------------------------------------------------------------
// CommandResult: unified return type for all console commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = true;    // true if command succeeded
    std::string errorCode;  // "ERR_NONE" or an ErrorManager code
};

// ------------------------------------------------------------
// Command handler type
// ------------------------------------------------------------
using CommandFunc = std::function<CommandResult(const std::string& arg)>;
using CommandMap = std::unordered_map<std::string, CommandFunc>;

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);

// Lowercases and corrects typos within edit distance 1 of a known command
std::string normalizeCommand(const CommandMap& commands, const std::string& input);

CommandResult dispatchCommand(const CommandMap& commands, const std::string& cmd, const std::string& arg);

// Parses, dispatches and prints the result
CommandResult handleCommand(const CommandMap& commands, const std::string& line);

} // namespace Parley
