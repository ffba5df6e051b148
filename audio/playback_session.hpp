#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace Parley {

// ------------------------------------------------------------
// PlaybackSession: one speak() request. Carries the cancellation
// token checked by the synthesis worker between batches and an
// optional completion callback that fires only when the session
// drains naturally.
// ------------------------------------------------------------
class PlaybackSession {
public:
    using CompletionCallback = std::function<void()>;

    static std::shared_ptr<PlaybackSession> create(CompletionCallback onComplete = {});

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    uint64_t id() const { return id_; }

    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

    // Runs the completion callback at most once
    void complete();

private:
    PlaybackSession(uint64_t id, CompletionCallback onComplete)
        : id_(id), onComplete_(std::move(onComplete)) {}

    const uint64_t id_;
    std::atomic<bool> cancelled_{false};

    std::mutex callbackMutex_;
    CompletionCallback onComplete_;
};

using PlaybackSessionPtr = std::shared_ptr<PlaybackSession>;

} // namespace Parley
