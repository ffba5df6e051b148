#pragma once
#include <chrono>
#include <functional>
#include <mutex>

#include "audio/audio_types.hpp"
#include "audio/spsc_ring.hpp"

namespace Parley {

// ------------------------------------------------------------
// ChunkQueue: bounded chunk transport between synthesis workers
// (producers) and the render callback (single consumer).
//
// Producers are serialised by a mutex so the underlying ring stays
// single-producer. The consumer side never locks or allocates.
// ------------------------------------------------------------
class ChunkQueue {
public:
    enum class PushStatus {
        Accepted,
        Aborted,    // abort predicate fired while waiting for space
        TimedOut
    };

    explicit ChunkQueue(size_t capacity);

    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    // Blocks while the queue is full (backpressure). `shouldAbort` is
    // polled between attempts; timeout <= 0 waits without limit.
    PushStatus push(AudioChunkPtr chunk,
                    const std::function<bool()>& shouldAbort,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Non-blocking producer variant
    bool tryPush(AudioChunkPtr chunk);

    // Render-thread side
    bool tryPop(AudioChunkPtr& out) { return ring_.tryPop(out); }

    size_t size() const { return ring_.size(); }
    size_t capacity() const { return ring_.capacity(); }
    bool empty() const { return ring_.empty(); }

private:
    SpscRing<AudioChunkPtr> ring_;
    std::mutex producerMutex_;
};

} // namespace Parley
