#include "audio/chunk_queue.hpp"

#include <thread>

namespace Parley {

// Poll period while a producer waits for space. Well under one render
// period so backpressure releases as soon as the renderer pops.
static constexpr std::chrono::milliseconds kPushPoll{2};

ChunkQueue::ChunkQueue(size_t capacity)
    : ring_(capacity == 0 ? 1 : capacity) {}

ChunkQueue::PushStatus ChunkQueue::push(AudioChunkPtr chunk,
                                        const std::function<bool()>& shouldAbort,
                                        std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(producerMutex_);

    const auto start = std::chrono::steady_clock::now();
    while (true) {
        if (shouldAbort && shouldAbort()) {
            return PushStatus::Aborted;
        }
        if (ring_.tryPush(std::move(chunk))) {
            return PushStatus::Accepted;
        }
        if (timeout.count() > 0 &&
            std::chrono::steady_clock::now() - start >= timeout) {
            return PushStatus::TimedOut;
        }
        std::this_thread::sleep_for(kPushPoll);
    }
}

bool ChunkQueue::tryPush(AudioChunkPtr chunk) {
    std::lock_guard<std::mutex> lock(producerMutex_);
    return ring_.tryPush(std::move(chunk));
}

} // namespace Parley
