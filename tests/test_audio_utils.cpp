#include <gtest/gtest.h>

#include "audio/resample.hpp"
#include "voice/energy_vad.hpp"
#include "voice/text_sanitize.hpp"
#include "voice/voice_types.hpp"

using namespace Parley;

TEST(Resample, UpsamplesAndKeepsEndpoints) {
    std::vector<float> in{0.0f, 1.0f};
    auto out = linearResampleMono(in, 1000, 2000);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_FLOAT_EQ(out.front(), 0.0f);
    EXPECT_FLOAT_EQ(out.back(), 1.0f);
    EXPECT_NEAR(out[1], 1.0f / 3.0f, 1e-6);
}

TEST(Resample, DownsamplesLength) {
    std::vector<float> in(22050, 0.5f);
    auto out = linearResampleMono(in, 22050, 16000);
    EXPECT_EQ(out.size(), 16000u);
    EXPECT_FLOAT_EQ(out[8000], 0.5f);
}

TEST(Resample, PassesThroughDegenerateInput) {
    std::vector<float> one{0.3f};
    EXPECT_EQ(linearResampleMono(one, 1000, 2000), one);

    std::vector<float> two{0.1f, 0.2f};
    EXPECT_EQ(linearResampleMono(two, 1000, 1000), two);
    EXPECT_EQ(linearResampleMono(two, 0, 1000), two);
}

TEST(NormalizePeak, OnlyScalesClippingAudio) {
    std::vector<float> quiet{0.2f, -0.9f};
    EXPECT_FALSE(normalizePeak(quiet));
    EXPECT_FLOAT_EQ(quiet[1], -0.9f);

    std::vector<float> loud{0.5f, -4.0f, 2.0f};
    EXPECT_TRUE(normalizePeak(loud));
    EXPECT_FLOAT_EQ(loud[0], 0.125f);
    EXPECT_FLOAT_EQ(loud[1], -1.0f);
    EXPECT_FLOAT_EQ(loud[2], 0.5f);
}

TEST(Pcm16ToFloat, ScalesToUnitRange) {
    short pcm[] = {0, 16384, -32768};
    auto out = pcm16ToFloat(pcm, 3);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_FLOAT_EQ(out[1], 0.5f);
    EXPECT_FLOAT_EQ(out[2], -1.0f);
}

TEST(SanitizeMarkdown, StripsHeadersAndEmphasis) {
    EXPECT_EQ(sanitizeMarkdownForSpeech("# Title\nSome **bold** and *italic* text"),
              "Title\nSome bold and italic text");
    EXPECT_EQ(sanitizeMarkdownForSpeech("  ### Steps"), "Steps");
    EXPECT_EQ(sanitizeMarkdownForSpeech("*start* of line"), "start of line");
}

TEST(SanitizeMarkdown, LeavesOtherTextAlone) {
    EXPECT_EQ(sanitizeMarkdownForSpeech(""), "");
    EXPECT_EQ(sanitizeMarkdownForSpeech("###### six hashes"), "###### six hashes");
    EXPECT_EQ(sanitizeMarkdownForSpeech("Issue #42 is fixed"), "Issue #42 is fixed");
    EXPECT_EQ(sanitizeMarkdownForSpeech("- item one\n- item two\n"), "- item one\n- item two\n");
}

TEST(EnergyVad, ThresholdOnRms) {
    VadConfig cfg;
    cfg.silenceThreshold = 0.1f;
    EnergyVad vad(cfg);

    std::vector<float> quiet(480, 0.05f);
    std::vector<float> loud(480, 0.2f);
    EXPECT_FALSE(vad.isSpeech(quiet.data(), quiet.size()));
    EXPECT_TRUE(vad.isSpeech(loud.data(), loud.size()));
    EXPECT_FLOAT_EQ(EnergyVad::rms(loud.data(), loud.size()), 0.2f);
}

TEST(EnergyVad, CalibrationRaisesThresholdAboveAmbient) {
    VadConfig cfg;
    cfg.silenceThreshold = 0.01f;
    cfg.calibrationMultiplier = 2.0f;
    EnergyVad vad(cfg);

    vad.calibrate(std::vector<float>(4800, 0.05f));
    EXPECT_NEAR(vad.threshold(), 0.1f, 1e-5);

    // Noisy rooms are capped
    vad.calibrate(std::vector<float>(4800, 0.4f));
    EXPECT_FLOAT_EQ(vad.threshold(), 0.3f);

    // Too little audio: unchanged
    vad.calibrate(std::vector<float>(100, 0.0f));
    EXPECT_FLOAT_EQ(vad.threshold(), 0.3f);
}

TEST(VoiceModeNames, ParseAndPrint) {
    VoiceMode m = VoiceMode::Wait;
    EXPECT_TRUE(voiceModeFromString("Push_To_Talk", m));
    EXPECT_EQ(m, VoiceMode::PushToTalk);
    EXPECT_STREQ(toString(m), "ptt");

    EXPECT_TRUE(voiceModeFromString("FULL", m));
    EXPECT_EQ(m, VoiceMode::Full);

    EXPECT_FALSE(voiceModeFromString("barge", m));
    EXPECT_EQ(m, VoiceMode::Full);
}
