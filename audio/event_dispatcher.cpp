#include "audio/event_dispatcher.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>

namespace Parley {

// The render thread cannot signal a condition variable, so the
// dispatcher also wakes on this period to pick up real-time posts.
static constexpr std::chrono::milliseconds kPollPeriod{5};

const char* toString(PlayerEventType type) {
    switch (type) {
        case PlayerEventType::SessionArmed: return "session_armed";
        case PlayerEventType::AudioStart:  return "audio_start";
        case PlayerEventType::AudioEnd:    return "audio_end";
        case PlayerEventType::AudioPause:  return "audio_pause";
        case PlayerEventType::AudioResume: return "audio_resume";
        case PlayerEventType::Underrun:    return "underrun";
    }
    return "unknown";
}

EventDispatcher::EventDispatcher(size_t realtimeCapacity, Handler handler, Housekeeping housekeeping)
    : realtime_(realtimeCapacity),
      handler_(std::move(handler)),
      housekeeping_(std::move(housekeeping)) {
    control_.reserve(16);
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        stopping_ = false;
    }
    thread_ = std::thread([this]() { run(); });
}

void EventDispatcher::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    // Deliver anything that raced with shutdown; a render post still in
    // flight lands within microseconds
    dispatchPending();
    for (int i = 0; i < 100 && heldEvents() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        dispatchPending();
    }
}

size_t EventDispatcher::heldEvents() {
    std::lock_guard<std::mutex> lock(dispatchMutex_);
    return held_.size();
}

bool EventDispatcher::postFromRealtime(PlayerEventType type, uint64_t sessionId, bool drained) noexcept {
    PlayerEvent ev;
    ev.type = type;
    ev.sessionId = sessionId;
    ev.drained = drained;

    // Claim before taking the sequence number, publish after the push
    rtClaimed_.fetch_add(1);
    ev.seq = seq_.fetch_add(1);
    const bool pushed = realtime_.tryPush(std::move(ev));
    rtPublished_.fetch_add(1);

    if (!pushed) {
        dropped_.fetch_add(1);
        return false;
    }
    return true;
}

void EventDispatcher::post(PlayerEventType type, uint64_t sessionId, bool drained) {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        PlayerEvent ev;
        ev.type = type;
        ev.sessionId = sessionId;
        ev.drained = drained;
        ev.seq = seq_.fetch_add(1);
        control_.push_back(ev);
    }
    wake_.notify_one();
}

size_t EventDispatcher::dispatchPending() {
    std::lock_guard<std::mutex> dispatchLock(dispatchMutex_);

    // Control events first: every render post with a lower sequence
    // number was claimed before they were taken
    std::vector<PlayerEvent> control;
    control.swap(held_);
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        control.insert(control.end(), control_.begin(), control_.end());
        control_.clear();
    }

    const uint64_t claimed = rtClaimed_.load();
    const uint64_t published = rtPublished_.load();

    std::vector<PlayerEvent> batch;
    PlayerEvent ev;
    while (realtime_.tryPop(ev)) {
        lastRealtimeSeq_ = std::max(lastRealtimeSeq_, ev.seq);
        batch.push_back(ev);
    }

    if (published >= claimed) {
        batch.insert(batch.end(), control.begin(), control.end());
    } else {
        // The in-flight render event is newer than anything popped so far;
        // control events after it wait for the next pass
        for (const auto& c : control) {
            if (c.seq < lastRealtimeSeq_) {
                batch.push_back(c);
            } else {
                held_.push_back(c);
            }
        }
    }

    std::sort(batch.begin(), batch.end(),
              [](const PlayerEvent& a, const PlayerEvent& b) { return a.seq < b.seq; });

    for (const auto& e : batch) {
        try {
            if (handler_) handler_(e);
        } catch (const std::exception& ex) {
            LOG_ERROR("Dispatcher", std::string("Handler threw on ") + toString(e.type) + ": " + ex.what());
        }
    }

    if (housekeeping_) {
        try {
            housekeeping_();
        } catch (const std::exception& ex) {
            LOG_ERROR("Dispatcher", std::string("Housekeeping threw: ") + ex.what());
        }
    }

    return batch.size();
}

void EventDispatcher::run() {
    LOG_DEBUG("Dispatcher", "Event thread started");
    while (true) {
        dispatchPending();

        std::unique_lock<std::mutex> lock(wakeMutex_);
        if (stopping_) break;
        wake_.wait_for(lock, kPollPeriod);
        if (stopping_) break;
    }
    LOG_DEBUG("Dispatcher", "Event thread stopped");
}

} // namespace Parley
