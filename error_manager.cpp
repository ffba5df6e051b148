#include "error_manager.hpp"
#include "bootstrap_config.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

namespace Parley {

// ------------------------------------------------------------
// Catalog storage
// ------------------------------------------------------------
static std::mutex g_catalogMutex;
static nlohmann::json g_root;
static bool g_loaded = false;

// Caller holds g_catalogMutex
static const nlohmann::json& catalog() {
    if (!g_loaded) {
        g_root = bootstrap_config::defaultErrors();
        g_loaded = true;
    }
    return g_root;
}

static std::string lookup(const std::string& code, const char* field) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    const auto& root = catalog();
    auto it = root.find(code);
    if (it != root.end() && it->is_object()) {
        auto f = it->find(field);
        if (f != it->end() && f->is_string()) {
            return f->get<std::string>();
        }
    }
    return {};
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json errors;
        in >> errors;

        const nlohmann::json& root =
            (errors.contains("errors") && errors["errors"].is_object()) ? errors["errors"] : errors;
        setCatalog(root);

        LOG_DEBUG("ErrorManager", "Loaded " + std::to_string(root.size()) +
                                  " error codes from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

void ErrorManager::setCatalog(const nlohmann::json& root) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    // Built-in codes stay resolvable even if the file omits them
    g_root = bootstrap_config::defaultErrors();
    g_root.update(root);
    g_loaded = true;
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::string msg = lookup(code, "user");
    if (msg.empty()) {
        return "[Error] Unknown error code: " + code;
    }
    return msg;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::string msg = lookup(code, "debug");
    if (msg.empty()) {
        return "[Debug] No debug message for code: " + code;
    }
    return msg;
}

static VoiceResult makeFailure(const std::string& code) {
    VoiceResult result;
    result.success   = false;
    result.message   = ErrorManager::getUserMessage(code);
    result.errorCode = code;
    return result;
}

VoiceResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) debugMsg += " (" + detail + ")";

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg);
    return makeFailure(code);
}

VoiceResult ErrorManager::quiet(const std::string& code, const std::string& detail) {
    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) debugMsg += " (" + detail + ")";

    LOG_TRACE("ErrorManager", code + " -> " + debugMsg);
    return makeFailure(code);
}

VoiceResult ErrorManager::ok(const std::string& message) {
    VoiceResult result;
    result.success   = true;
    result.message   = message;
    result.errorCode = Errors::None;
    return result;
}

} // namespace Parley
