#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

using namespace Parley;
namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("parley_config_test_" + std::to_string(stamp));
        fs::create_directories(dir);
        path = dir / "parley_config.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const std::string& text) {
        std::ofstream(path) << text;
    }

    nlohmann::json readBack() {
        std::ifstream in(path);
        nlohmann::json j;
        in >> j;
        return j;
    }

    fs::path dir;
    fs::path path;
};

TEST(MergeDefaults, FillsMissingKeysRecursively) {
    nlohmann::json cfg = {{"capture", {{"frame_ms", 20}}}};
    int patched = 0;
    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoiceConfig(), &patched));
    EXPECT_GT(patched, 0);
    EXPECT_EQ(cfg["capture"]["frame_ms"], 20);
    EXPECT_EQ(cfg["capture"]["sample_rate"], 16000);
    EXPECT_EQ(cfg["voice"]["mode"], "wait");
}

TEST(MergeDefaults, RestoresMistypedValues) {
    nlohmann::json cfg = bootstrap_config::defaultVoiceConfig();
    cfg["playback"]["sample_rate"] = "fast";
    cfg["stop_phrase"]["strong"] = "ok stop";

    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoiceConfig()));
    EXPECT_EQ(cfg["playback"]["sample_rate"], 24000);
    EXPECT_TRUE(cfg["stop_phrase"]["strong"].is_array());
}

TEST(MergeDefaults, AcceptsEitherNumberKind) {
    nlohmann::json cfg = bootstrap_config::defaultVoiceConfig();
    cfg["vad"]["silence_threshold"] = 1;
    cfg["capture"]["frame_ms"] = 20.0;

    EXPECT_FALSE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoiceConfig()));
    EXPECT_EQ(cfg["vad"]["silence_threshold"], 1);
}

TEST(MergeDefaults, ReplacesNonObjectRoot) {
    nlohmann::json cfg = nlohmann::json::array({1, 2});
    EXPECT_TRUE(bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultVoiceConfig()));
    EXPECT_TRUE(cfg.is_object());
    EXPECT_TRUE(cfg.contains("playback"));
}

TEST(ParseVoiceConfig, ReadsTypedValues) {
    nlohmann::json cfg = {
        {"playback", {{"sample_rate", 48000}, {"queue_capacity", 8}}},
        {"capture", {{"silence_timeout_ms", 900}}},
        {"stop_phrase", {{"strong", nlohmann::json::array({"halt now"})}, {"confirm_count", 3}}},
        {"voice", {{"mode", "PTT"}, {"sanitize_markdown", false}}},
        {"log", {{"level", "warn"}}}
    };

    VoiceConfig v = bootstrap_config::parseVoiceConfig(cfg);
    EXPECT_EQ(v.playback.sampleRate, 48000);
    EXPECT_EQ(v.playback.queueCapacity, 8u);
    EXPECT_EQ(v.playback.framesPerBuffer, 480);
    EXPECT_EQ(v.capture.silenceTimeoutMs, 900);
    ASSERT_EQ(v.stopPhrase.strong.size(), 1u);
    EXPECT_EQ(v.stopPhrase.strong[0], "halt now");
    EXPECT_EQ(v.stopPhrase.ambiguous.size(), 1u);
    EXPECT_EQ(v.stopPhrase.confirmCount, 3);
    EXPECT_EQ(v.mode, VoiceMode::PushToTalk);
    EXPECT_FALSE(v.sanitizeMarkdown);
    EXPECT_EQ(v.logLevel, "warn");
}

TEST(ParseVoiceConfig, UnknownModeFallsBackToStop) {
    nlohmann::json cfg = {{"voice", {{"mode", "shout"}}}};
    VoiceConfig v = bootstrap_config::parseVoiceConfig(cfg);
    EXPECT_EQ(v.mode, VoiceMode::Stop);
}

TEST(ParseVoiceConfig, ClampsQueueCapacity) {
    nlohmann::json cfg = {{"playback", {{"queue_capacity", 0}}}};
    VoiceConfig v = bootstrap_config::parseVoiceConfig(cfg);
    EXPECT_EQ(v.playback.queueCapacity, 1u);
}

TEST_F(ConfigFileTest, CreatesMissingFileWithDefaults) {
    nlohmann::json cfg;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultVoiceConfig(), cfg, "Voice config"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(readBack(), bootstrap_config::defaultVoiceConfig());
}

TEST_F(ConfigFileTest, PatchesPartialFileAndKeepsUserValues) {
    write(R"({"capture": {"min_speech_ms": 300}})");

    nlohmann::json cfg;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultVoiceConfig(), cfg, "Voice config"));
    EXPECT_EQ(cfg["capture"]["min_speech_ms"], 300);

    auto saved = readBack();
    EXPECT_EQ(saved["capture"]["min_speech_ms"], 300);
    EXPECT_EQ(saved["whisper"]["threads"], 4);
}

TEST_F(ConfigFileTest, InvalidFileIsResetToDefaults) {
    write("{ not json");

    nlohmann::json cfg;
    EXPECT_FALSE(bootstrap_config::loadConfig(path, bootstrap_config::defaultVoiceConfig(), cfg,
                                              "Voice config", Errors::ConfigInvalid));
    EXPECT_EQ(cfg, bootstrap_config::defaultVoiceConfig());
    EXPECT_EQ(readBack(), bootstrap_config::defaultVoiceConfig());
}

TEST_F(ConfigFileTest, InitAllLoadsErrorOverrides) {
    write(R"({"voice": {"mode": "full"}, "log": {"level": "error"}})");
    std::ofstream(dir / "errors.json") << R"({"ERR_UNDERRUN": {"user": "[Audio] Glitch.", "debug": "custom"}})";

    VoiceConfig v = bootstrap_config::initAll(path);
    EXPECT_EQ(v.mode, VoiceMode::Full);
    EXPECT_EQ(ErrorManager::getUserMessage(Errors::Underrun), "[Audio] Glitch.");
    // Codes missing from the file still resolve
    EXPECT_EQ(ErrorManager::getUserMessage(Errors::NoSynthesisEngine), "[Voice] No speech engine configured.");

    ErrorManager::setCatalog(nlohmann::json::object());
    setLogLevel(LogLevel::Debug);
}

TEST(ErrorManagerTest, ReportBuildsFailedResult) {
    VoiceResult r = ErrorManager::report(Errors::DeviceUnavailable, "unit test");
    EXPECT_FALSE(r);
    EXPECT_EQ(r.errorCode, Errors::DeviceUnavailable);
    EXPECT_EQ(r.message, "[Audio] Audio device unavailable.");

    VoiceResult unknown = ErrorManager::quiet("ERR_DOES_NOT_EXIST");
    EXPECT_FALSE(unknown);
    EXPECT_EQ(unknown.message, "[Error] Unknown error code: ERR_DOES_NOT_EXIST");

    VoiceResult ok = ErrorManager::ok("done");
    EXPECT_TRUE(ok);
    EXPECT_EQ(ok.errorCode, Errors::None);
}

TEST_F(ConfigFileTest, LoggerFiltersByLevelAndGroupsPhases) {
    const fs::path logPath = dir / "test.log";
    initLogger(logPath.string());
    EXPECT_EQ(logFilePath(), fs::absolute(logPath).string());

    setConsoleLogLevel(LogLevel::Error);
    setLogLevel(LogLevel::Warn);
    LOG_DEBUG("Test", "hidden debug line");
    LOG_WARN("Test", "visible warning");

    beginPhaseGroup();
    LOG_PHASE("Grouped phase", true);
    EXPECT_EQ(lastPhase().phaseName, "Grouped phase");
    EXPECT_EQ(lastPhase().fileName, "test_config.cpp");
    endPhaseGroup();
    shutdownLogger();

    setLogLevel(LogLevel::Debug);
    setConsoleLogLevel(LogLevel::Debug);

    std::ifstream in(logPath);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_EQ(text.str().find("hidden debug line"), std::string::npos);
    EXPECT_NE(text.str().find("[WARN][Test] visible warning"), std::string::npos);
    EXPECT_NE(text.str().find("| Grouped phase | true |"), std::string::npos);
}
