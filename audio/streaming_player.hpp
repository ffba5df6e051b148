#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "audio/audio_device.hpp"
#include "audio/audio_types.hpp"
#include "audio/chunk_queue.hpp"
#include "audio/event_dispatcher.hpp"
#include "audio/playback_session.hpp"
#include "audio/spsc_ring.hpp"
#include "error_manager.hpp"

namespace Parley {

// ------------------------------------------------------------
// PlaybackListener: lifecycle notifications, delivered on the
// player's dispatcher thread (never on the render thread)
// ------------------------------------------------------------
class PlaybackListener {
public:
    virtual ~PlaybackListener() = default;

    // play() accepted the session; the first sample may still be far off
    virtual void onSessionArmed(uint64_t /*sessionId*/) {}
    virtual void onAudioStart(uint64_t /*sessionId*/) {}
    // drained: true when the session played to the end, false when cancelled
    virtual void onAudioEnd(uint64_t /*sessionId*/, bool /*drained*/) {}
    virtual void onAudioPause(uint64_t /*sessionId*/) {}
    virtual void onAudioResume(uint64_t /*sessionId*/) {}

    // Samples actually written to the device (far-end tap enabled only)
    virtual void onFarEndAudio(const std::vector<float>& /*samples*/, int /*sampleRate*/) {}
};

// ------------------------------------------------------------
// StreamingPlayer: non-blocking playback with sample-accurate
// pause/resume/stop.
//
// Threading:
//  - render() runs on the device's real-time thread. It never locks,
//    allocates or logs; it reads the session id and PlayerState as one
//    atomic word every period.
//  - play/enqueue/pause/resume/stop run on any other thread.
//  - Lifecycle events are delivered by an internal EventDispatcher.
// ------------------------------------------------------------
class StreamingPlayer {
public:
    struct Options {
        PlaybackConfig playback;
        bool dispatchThread = true;   // false: caller drives dispatchPendingEvents()
    };

    StreamingPlayer(Options options, std::shared_ptr<AudioOutputDevice> device);
    ~StreamingPlayer();

    StreamingPlayer(const StreamingPlayer&) = delete;
    StreamingPlayer& operator=(const StreamingPlayer&) = delete;

    // Begins a new session, cancelling the active one (its queued chunks
    // are discarded and its end event precedes the new armed event).
    // Opens the output stream on first use; ERR_DEVICE_UNAVAILABLE leaves
    // every piece of player state untouched. Session ids must increase.
    VoiceResult play(const PlaybackSessionPtr& session);

    // Appends samples to the active session. Blocks while the queue is full.
    // Stale producers get ERR_SESSION_MISMATCH / ERR_SESSION_CANCELLED and
    // their samples are dropped.
    VoiceResult enqueue(uint64_t sessionId, std::vector<float> samples, int sampleRate);
    VoiceResult enqueue(const AudioChunkPtr& chunk);

    // Producer is done; the session ends once the queue drains
    void finish(uint64_t sessionId);

    bool pause();
    bool resume();
    bool stop();
    // Stops only if sessionId is still the current session
    bool stop(uint64_t sessionId);

    PlayerState state() const { return stateOf(control_.load(std::memory_order_acquire)); }
    bool isActive() const { return state() != PlayerState::Idle; }
    bool isPaused() const { return state() == PlayerState::Paused; }
    uint64_t activeSessionId() const;
    int outputSampleRate() const { return outputRate_.load(); }

    // Stops playback and releases the device
    void closeStream();
    bool isStreamOpen() const;

    void addListener(PlaybackListener* listener);
    void removeListener(PlaybackListener* listener);

    // Copy rendered samples to listeners' onFarEndAudio (AEC reference)
    void setFarEndTap(bool enabled) { farEndTap_.store(enabled); }

    size_t dispatchPendingEvents() { return dispatcher_.dispatchPending(); }

    uint64_t underrunCount() const { return underruns_.load(); }
    size_t queuedChunks() const { return queue_.size(); }

    // Real-time render entry point (wired into the output device)
    void render(float* out, unsigned long frames, int channels, bool underflow) noexcept;

private:
    // control_ packs (sessionId << 2) | PlayerState
    static uint64_t pack(uint64_t sessionId, PlayerState state) noexcept {
        return (sessionId << 2) | static_cast<uint64_t>(state);
    }
    static uint64_t sessionOf(uint64_t word) noexcept { return word >> 2; }
    static PlayerState stateOf(uint64_t word) noexcept {
        return static_cast<PlayerState>(word & 0x3u);
    }

    VoiceResult ensureStreamLocked();
    VoiceResult pushChunk(uint64_t sessionId, AudioChunkPtr chunk);
    void endSessionLocked(uint64_t sessionId, bool drained);
    bool stopLocked();

    // Render-thread helpers
    bool popNext(uint64_t activeId) noexcept;
    void retireCurrent() noexcept;
    void retire(AudioChunkPtr& chunk) noexcept;

    // Dispatcher-thread helpers
    void handleEvent(const PlayerEvent& ev);
    void housekeeping();

    Options options_;
    std::shared_ptr<AudioOutputDevice> device_;

    ChunkQueue queue_;
    SpscRing<AudioChunkPtr> retired_;   // render -> dispatcher, freed off the RT thread
    SpscRing<float> farEnd_;            // render -> dispatcher, AEC reference
    EventDispatcher dispatcher_;

    // Control-side state (guarded by mutex_)
    mutable std::mutex mutex_;
    PlaybackSessionPtr current_;
    std::vector<PlaybackSessionPtr> ended_;   // replaced after draining, end event still in flight
    uint64_t lastArmedId_ = 0;

    // Shared with the render thread
    std::atomic<uint64_t> control_{0};
    std::atomic<uint64_t> completeSessionId_{0};
    std::atomic<uint64_t> lastEndedSessionId_{0};
    std::atomic<int> outputRate_;
    std::atomic<bool> farEndTap_{false};
    std::atomic<uint64_t> underruns_{0};

    // Render-thread only
    AudioChunkPtr rtChunk_;
    size_t rtPosition_ = 0;
    uint64_t rtSession_ = 0;
    bool rtStarted_ = false;
    bool rtInUnderrun_ = false;

    std::mutex listenerMutex_;
    std::vector<PlaybackListener*> listeners_;
};

} // namespace Parley
