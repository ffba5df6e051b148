#include "audio/playback_session.hpp"

namespace Parley {

static std::atomic<uint64_t> g_nextSessionId{1};

std::shared_ptr<PlaybackSession> PlaybackSession::create(CompletionCallback onComplete) {
    // Constructor is private, so no make_shared
    return std::shared_ptr<PlaybackSession>(
        new PlaybackSession(g_nextSessionId.fetch_add(1), std::move(onComplete)));
}

void PlaybackSession::complete() {
    CompletionCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        cb.swap(onComplete_);
    }
    if (cb) cb();
}

} // namespace Parley
