#pragma once
#include <chrono>
#include <string>

namespace Parley {

enum class LogLevel {
    Trace,
    Debug,
    Warn,
    Error
};

struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp;
    std::string fileName;
    std::string phaseName;
    bool success = false;
};

// Most recent LOG_PHASE entry
PhaseInfo lastPhase();

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();
std::string logFilePath();   // empty when no file is open

// Thresholds for the file and for stderr. Phase lines always pass.
void setLogLevel(LogLevel level);
void setConsoleLogLevel(LogLevel level);
LogLevel logLevelFromString(const std::string& name);

// =====================================================
// Logging
// =====================================================
void logPhaseInternal(const std::string& file, const std::string& phase, bool success);

void logTrace(const std::string& tag, const std::string& msg);
void logDebug(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// Phase lines between these are held back and written together
void beginPhaseGroup();
void endPhaseGroup();

} // namespace Parley

#define LOG_PHASE(phase, success) ::Parley::logPhaseInternal(__FILE__, phase, success)
#define LOG_TRACE(tag, msg) ::Parley::logTrace(tag, msg)
#define LOG_DEBUG(tag, msg) ::Parley::logDebug(tag, msg)
#define LOG_WARN(tag, msg) ::Parley::logWarn(tag, msg)
#define LOG_ERROR(tag, msg) ::Parley::logError(tag, msg)
