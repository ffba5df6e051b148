#include <gtest/gtest.h>

#include "fakes.hpp"
#include "voice/voice_mode.hpp"

using namespace Parley;
using namespace Parley::fakes;

class VoiceModeCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        RecognizerController::Options options;
        options.capture.sampleRate = 1000;
        options.capture.frameMs = 10;
        options.captureThread = false;
        transcriber = std::make_shared<ScriptedTranscriber>();
        recognizer = std::make_unique<RecognizerController>(
            options, std::make_shared<FakeInputDevice>(), std::make_shared<AmplitudeVad>(), transcriber);
    }

    std::shared_ptr<ScriptedTranscriber> transcriber;
    std::unique_ptr<RecognizerController> recognizer;
};

TEST_F(VoiceModeCoordinatorTest, WaitPausesCaptureDuringPlayback) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);

    coord.onSessionArmed(1);
    EXPECT_TRUE(coord.isPlaybackActive());
    EXPECT_TRUE(recognizer->isProcessingPaused());
    EXPECT_FALSE(recognizer->isSuppressed());

    coord.onAudioEnd(1, true);
    EXPECT_FALSE(coord.isPlaybackActive());
    EXPECT_FALSE(recognizer->isProcessingPaused());
}

TEST_F(VoiceModeCoordinatorTest, StopSuppressesAndDisablesInterrupt) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Stop);

    coord.onSessionArmed(1);
    EXPECT_TRUE(recognizer->isSuppressed());
    EXPECT_FALSE(recognizer->isInterruptEnabled());
    EXPECT_FALSE(recognizer->isProcessingPaused());

    coord.onAudioEnd(1, false);
    EXPECT_FALSE(recognizer->isSuppressed());
    EXPECT_TRUE(recognizer->isInterruptEnabled());
}

TEST_F(VoiceModeCoordinatorTest, FullKeepsBargeInEnabled) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Full);

    coord.onSessionArmed(1);
    EXPECT_TRUE(recognizer->isInterruptEnabled());
    EXPECT_FALSE(recognizer->isSuppressed());
    EXPECT_FALSE(recognizer->isProcessingPaused());
    coord.onAudioEnd(1, true);
    EXPECT_TRUE(recognizer->isInterruptEnabled());
}

TEST_F(VoiceModeCoordinatorTest, PushToTalkFollowsTheKeyWhenIdle) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);
    coord.setMode(VoiceMode::PushToTalk);
    EXPECT_TRUE(recognizer->isProcessingPaused());

    coord.setPushToTalkHeld(true);
    EXPECT_FALSE(recognizer->isProcessingPaused());

    coord.setPushToTalkHeld(false);
    EXPECT_TRUE(recognizer->isProcessingPaused());

    // Playback: stop phrases are heard with the key up
    coord.onSessionArmed(7);
    EXPECT_FALSE(recognizer->isProcessingPaused());
    EXPECT_TRUE(recognizer->isSuppressed());
    EXPECT_FALSE(recognizer->isInterruptEnabled());

    coord.onAudioEnd(7, true);
    EXPECT_TRUE(recognizer->isProcessingPaused());
    EXPECT_FALSE(recognizer->isSuppressed());

    // Leaving push-to-talk restores open capture
    coord.setMode(VoiceMode::Full);
    EXPECT_FALSE(recognizer->isProcessingPaused());
}

TEST_F(VoiceModeCoordinatorTest, PushToTalkHeldThroughPlaybackKeepsCapture) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::PushToTalk);
    coord.setPushToTalkHeld(true);

    coord.onSessionArmed(3);
    coord.onAudioEnd(3, true);
    EXPECT_FALSE(recognizer->isProcessingPaused());
}

TEST_F(VoiceModeCoordinatorTest, ModeChangeDuringPlaybackAppliesNextTime) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);

    coord.onSessionArmed(1);
    coord.setMode(VoiceMode::Stop);
    EXPECT_EQ(coord.mode(), VoiceMode::Stop);
    EXPECT_TRUE(recognizer->isProcessingPaused());
    EXPECT_FALSE(recognizer->isSuppressed());

    coord.onAudioEnd(1, true);
    EXPECT_FALSE(recognizer->isProcessingPaused());
    EXPECT_FALSE(recognizer->isSuppressed());

    coord.onSessionArmed(2);
    EXPECT_TRUE(recognizer->isSuppressed());
    EXPECT_FALSE(recognizer->isProcessingPaused());
}

TEST_F(VoiceModeCoordinatorTest, UnknownModeNameFallsBackToStop) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Full);

    VoiceResult r = coord.setMode("whisper-only");
    EXPECT_FALSE(r);
    EXPECT_TRUE(r.is(Errors::InvalidModeTransition));
    EXPECT_EQ(coord.mode(), VoiceMode::Stop);

    EXPECT_TRUE(coord.setMode("PTT"));
    EXPECT_EQ(coord.mode(), VoiceMode::PushToTalk);
}

TEST_F(VoiceModeCoordinatorTest, StartWithoutEndFallsBackToStop) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);

    coord.onSessionArmed(1);
    coord.onSessionArmed(2);
    EXPECT_EQ(coord.mode(), VoiceMode::Stop);
    EXPECT_TRUE(recognizer->isSuppressed());
    EXPECT_FALSE(recognizer->isProcessingPaused());

    // The stale end is ignored, the live one restores capture
    coord.onAudioEnd(1, false);
    EXPECT_TRUE(recognizer->isSuppressed());
    coord.onAudioEnd(2, true);
    EXPECT_FALSE(recognizer->isSuppressed());
    EXPECT_FALSE(coord.isPlaybackActive());
}

TEST_F(VoiceModeCoordinatorTest, EndWithoutStartIsIgnored) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);
    recognizer->pauseProcessing();

    coord.onAudioEnd(9, false);
    EXPECT_TRUE(recognizer->isProcessingPaused());
}

TEST_F(VoiceModeCoordinatorTest, FarEndAudioReachesCancellerOnlyWithAec) {
    auto canceller = std::make_shared<CountingEchoCanceller>();
    RecognizerController::Options options;
    options.captureThread = false;
    RecognizerController rc(options, std::make_shared<FakeInputDevice>(),
                            std::make_shared<AmplitudeVad>(), transcriber, canceller);
    VoiceModeCoordinator coord(rc, VoiceMode::Full);

    // The echo gate keeps a reference either way
    coord.onFarEndAudio(std::vector<float>(16, 0.2f), 24000);
    EXPECT_EQ(canceller->farEndSamples, 0u);
    EXPECT_GT(rc.echoReferenceSamples(), 0u);

    ASSERT_TRUE(coord.setAecEnabled(true));
    coord.onFarEndAudio(std::vector<float>(16, 0.2f), 24000);
    EXPECT_EQ(canceller->farEndSamples, 16u);

    VoiceModeCoordinator plain(*recognizer, VoiceMode::Full);
    EXPECT_TRUE(plain.setAecEnabled(true).is(Errors::AecUnavailable));
    EXPECT_FALSE(plain.isAecEnabled());
}

TEST_F(VoiceModeCoordinatorTest, FirstSampleAloneChangesNothing) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);

    coord.onAudioStart(4);
    EXPECT_FALSE(coord.isPlaybackActive());
    EXPECT_FALSE(recognizer->isProcessingPaused());
}

TEST_F(VoiceModeCoordinatorTest, ArmedSessionCancelledBeforeAudioIsUndone) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Stop);

    coord.onSessionArmed(5);
    EXPECT_TRUE(recognizer->isSuppressed());
    EXPECT_EQ(coord.playbackMode(), VoiceMode::Stop);

    coord.onAudioEnd(5, false);
    EXPECT_FALSE(recognizer->isSuppressed());
    EXPECT_TRUE(recognizer->isInterruptEnabled());
    EXPECT_FALSE(coord.isPlaybackActive());
}

TEST_F(VoiceModeCoordinatorTest, PushToTalkSelectsShortSegmentProfile) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Wait);
    EXPECT_EQ(recognizer->profile(), RecognizerProfile::Normal);
    const int normalSilence = recognizer->silenceTimeoutFrames();

    coord.setMode(VoiceMode::PushToTalk);
    EXPECT_EQ(recognizer->profile(), RecognizerProfile::PushToTalk);
    EXPECT_EQ(recognizer->minSpeechFrames(), 1);
    EXPECT_LE(recognizer->silenceTimeoutFrames(), 1500 / 10);
    EXPECT_LT(recognizer->silenceTimeoutFrames(), normalSilence);

    coord.setMode(VoiceMode::Full);
    EXPECT_EQ(recognizer->profile(), RecognizerProfile::Normal);

    // Chosen during playback: applies once it ends
    coord.onSessionArmed(8);
    coord.setMode(VoiceMode::PushToTalk);
    EXPECT_EQ(recognizer->profile(), RecognizerProfile::Normal);
    coord.onAudioEnd(8, true);
    EXPECT_EQ(recognizer->profile(), RecognizerProfile::PushToTalk);
}

TEST_F(VoiceModeCoordinatorTest, PlaybackEndClearsEchoReference) {
    VoiceModeCoordinator coord(*recognizer, VoiceMode::Full);

    coord.onSessionArmed(2);
    coord.onFarEndAudio(std::vector<float>(100, 0.3f), 1000);
    EXPECT_EQ(recognizer->echoReferenceSamples(), 100u);

    coord.onAudioEnd(2, true);
    EXPECT_EQ(recognizer->echoReferenceSamples(), 0u);
}
