#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "audio/spsc_ring.hpp"

namespace Parley {

enum class PlayerEventType : uint8_t {
    SessionArmed,   // play() accepted the session, before any audio
    AudioStart,
    AudioEnd,
    AudioPause,
    AudioResume,
    Underrun
};

const char* toString(PlayerEventType type);

struct PlayerEvent {
    PlayerEventType type = PlayerEventType::AudioEnd;
    uint64_t sessionId = 0;
    uint64_t seq = 0;       // global posting order
    bool drained = false;   // AudioEnd only: queue ran dry naturally
};

// ------------------------------------------------------------
// EventDispatcher: moves player lifecycle events off the render
// thread. Real-time posts go through a lock-free ring; control
// threads post through a short mutex. Both are merged by posting
// order before delivery. A render post that has taken its sequence
// number but not yet reached the ring holds back every later control
// event until it lands.
// ------------------------------------------------------------
class EventDispatcher {
public:
    using Handler = std::function<void(const PlayerEvent&)>;
    using Housekeeping = std::function<void()>;

    EventDispatcher(size_t realtimeCapacity, Handler handler, Housekeeping housekeeping = {});
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Render thread only. Never blocks; false if the ring is full.
    bool postFromRealtime(PlayerEventType type, uint64_t sessionId, bool drained = false) noexcept;

    // Any non-real-time thread
    void post(PlayerEventType type, uint64_t sessionId, bool drained = false);

    // Delivers everything posted so far. Called by the dispatcher thread;
    // callers may also invoke it directly (not from inside a handler).
    size_t dispatchPending();

    uint64_t droppedRealtimeEvents() const { return dropped_.load(); }
    size_t heldEvents();

private:
    void run();

    SpscRing<PlayerEvent> realtime_;
    std::atomic<uint64_t> seq_{1};
    std::atomic<uint64_t> dropped_{0};

    // Render posts begun / finished; unequal while one is in flight
    std::atomic<uint64_t> rtClaimed_{0};
    std::atomic<uint64_t> rtPublished_{0};

    std::mutex controlMutex_;
    std::vector<PlayerEvent> control_;

    std::mutex dispatchMutex_;
    std::vector<PlayerEvent> held_;     // control events waiting on a render post
    uint64_t lastRealtimeSeq_ = 0;      // highest render seq delivered
    Handler handler_;
    Housekeeping housekeeping_;

    std::mutex wakeMutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace Parley
