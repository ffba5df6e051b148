#include "commands/commands_core.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace Parley {

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
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

static std::string fuzzyMatch(const CommandMap& commands, const std::string& input) {
    if (commands.count(input)) return input;

    std::string best = input;
    int bestDist = 2; // only allow corrections within distance ≤ 1

    for (const auto& [key, _] : commands) {
        // Short commands would match almost anything
        if (key.size() < 3) continue;
        int dist = levenshteinDistance(input, key);
        if (dist < bestDist) {
            bestDist = dist;
            best = key;
        }
    }
    return best;
}

std::string normalizeCommand(const CommandMap& commands, const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    // 🔹 Fuzzy match
    return fuzzyMatch(commands, out);
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    size_t start = input.find_first_not_of(" \t");
    if (start == std::string::npos) return {"", ""};
    std::string trimmed = input.substr(start);
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);

    auto pos = trimmed.find(' ');
    if (pos == std::string::npos) {
        return {trimmed, ""};
    }
    std::string arg = trimmed.substr(pos + 1);
    arg.erase(0, arg.find_first_not_of(' '));
    return {trimmed.substr(0, pos), arg};
}

CommandResult dispatchCommand(const CommandMap& commands, const std::string& cmd, const std::string& arg) {
    auto it = commands.find(cmd);
    if (it != commands.end()) {
        LOG_TRACE("Console", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
        try {
            return it->second(arg);
        } catch (const std::exception& e) {
            LOG_ERROR("Console", "Exception in command \"" + cmd + "\": " + e.what());
            return {
                "[Error] Exception while running command: " + cmd,
                false,
                Errors::UnknownCommand
            };
        }
    }

    VoiceResult err = ErrorManager::report(Errors::UnknownCommand, cmd);
    return { err.message + ": " + cmd, false, err.errorCode };
}

CommandResult handleCommand(const CommandMap& commands, const std::string& line) {
    auto [cmdRaw, arg] = parseInput(line);
    if (cmdRaw.empty()) {
        return {"", true, Errors::None};
    }

    const std::string cmd = normalizeCommand(commands, cmdRaw);
    if (cmd != cmdRaw) {
        LOG_DEBUG("Console", "Corrected \"" + cmdRaw + "\" → \"" + cmd + "\"");
    }

    CommandResult result = dispatchCommand(commands, cmd, arg);
    if (!result.message.empty()) {
        (result.success ? std::cout : std::cerr) << result.message << "\n";
    }
    return result;
}

} // namespace Parley
