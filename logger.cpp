#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace Parley {

namespace {

// All sink state lives behind one mutex
struct LogSink {
    std::mutex mutex;
    std::ofstream file;
    std::string filePath;

    LogLevel fileLevel    = LogLevel::Debug;
    LogLevel consoleLevel = LogLevel::Debug;

    PhaseInfo lastPhase{};
    bool grouping = false;
    std::vector<std::string> grouped;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::string stamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// Caller holds the sink mutex. Phase lines use `level` Error so they always pass.
void emit(LogSink& s, LogLevel level, const std::string& line) {
    if (s.file.is_open() && level >= s.fileLevel) {
        s.file << line << '\n';
        if (level >= LogLevel::Warn) s.file.flush();
    }
    if (level >= s.consoleLevel) {
        std::cerr << line << std::endl;
    }
}

void write(LogLevel level, const std::string& tag, const std::string& msg) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    emit(s, level, "[" + stamp(std::chrono::system_clock::now()) + "][" +
                   levelName(level) + "][" + tag + "] " + msg);
}

} // namespace

// ------------------------------------------------------------
// Levels
// ------------------------------------------------------------
void setLogLevel(LogLevel level) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.fileLevel = level;
}

void setConsoleLogLevel(LogLevel level) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.consoleLevel = level;
}

LogLevel logLevelFromString(const std::string& name) {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Debug;
}

// ------------------------------------------------------------
// Phases
// ------------------------------------------------------------
PhaseInfo lastPhase() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.lastPhase;
}

void beginPhaseGroup() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.grouping = true;
    s.grouped.clear();
}

void endPhaseGroup() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto& line : s.grouped) emit(s, LogLevel::Error, line);
    s.grouped.clear();
    s.grouping = false;
}

void logPhaseInternal(const std::string& file, const std::string& phase, bool success) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.lastPhase.timestamp = std::chrono::system_clock::now();
    s.lastPhase.fileName  = std::filesystem::path(file).filename().string();
    s.lastPhase.phaseName = phase;
    s.lastPhase.success   = success;

    std::string line = "| " + stamp(s.lastPhase.timestamp) + " | " + s.lastPhase.fileName +
                       " | " + phase + " | " + (success ? "true" : "false") + " |";
    if (s.grouping) {
        s.grouped.push_back(std::move(line));
    } else {
        emit(s, LogLevel::Error, line);
    }
}

void logTrace(const std::string& tag, const std::string& msg) { write(LogLevel::Trace, tag, msg); }
void logDebug(const std::string& tag, const std::string& msg) { write(LogLevel::Debug, tag, msg); }
void logWarn(const std::string& tag, const std::string& msg)  { write(LogLevel::Warn, tag, msg); }
void logError(const std::string& tag, const std::string& msg) { write(LogLevel::Error, tag, msg); }

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------
void initLogger(const std::string& filename) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.file.is_open()) s.file.close();

    s.filePath = std::filesystem::absolute(filename).string();
    s.file.open(s.filePath, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        std::cerr << "[Logger] Could not open log file: " << s.filePath << std::endl;
        s.filePath.clear();
        return;
    }
    s.file << "==== Parley session " << stamp(std::chrono::system_clock::now()) << " ====" << std::endl;
}

std::string logFilePath() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.filePath;
}

void shutdownLogger() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) {
        s.file << "==== end ====" << std::endl;
        s.file.close();
    }
}

} // namespace Parley
