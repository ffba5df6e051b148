#include "audio/streaming_player.hpp"
#include "audio/resample.hpp"
#include "logger.hpp"

#include <algorithm>

namespace Parley {

// Lifecycle events per render period are at most start + end + underrun;
// this leaves room for a stalled dispatcher.
static constexpr size_t kRealtimeEventCapacity = 256;

StreamingPlayer::StreamingPlayer(Options options, std::shared_ptr<AudioOutputDevice> device)
    : options_(std::move(options)),
      device_(std::move(device)),
      queue_(options_.playback.queueCapacity),
      retired_(options_.playback.queueCapacity * 2 + 4),
      farEnd_(options_.playback.farEndCapacity),
      dispatcher_(kRealtimeEventCapacity,
                  [this](const PlayerEvent& ev) { handleEvent(ev); },
                  [this]() { housekeeping(); }),
      outputRate_(options_.playback.sampleRate) {
    if (options_.dispatchThread) {
        dispatcher_.start();
    }
}

StreamingPlayer::~StreamingPlayer() {
    closeStream();
    dispatcher_.stop();
}

// ============================================================
// Stream management
// ============================================================
VoiceResult StreamingPlayer::ensureStreamLocked() {
    if (!device_) {
        return ErrorManager::report(Errors::DeviceUnavailable, "no output device configured");
    }
    if (device_->isOpen()) {
        return ErrorManager::ok();
    }

    OutputStreamParams params;
    params.sampleRate      = options_.playback.sampleRate;
    params.framesPerBuffer = options_.playback.framesPerBuffer;
    params.channels        = 1;
    params.deviceIndex     = options_.playback.outputDeviceIndex;

    VoiceResult opened = device_->open(params,
        [this](float* out, unsigned long frames, int channels, bool underflow) {
            render(out, frames, channels, underflow);
        });
    if (!opened) {
        return opened;
    }

    outputRate_.store(device_->sampleRate());
    LOG_DEBUG("Player", "Output stream open at " + std::to_string(device_->sampleRate()) + " Hz");
    return ErrorManager::ok();
}

void StreamingPlayer::closeStream() {
    stop();
    std::lock_guard<std::mutex> lock(mutex_);
    if (device_ && device_->isOpen()) {
        device_->close();
        LOG_DEBUG("Player", "Output stream closed");
    }
}

bool StreamingPlayer::isStreamOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_ && device_->isOpen();
}

// ============================================================
// Session control
// ============================================================

// Caller holds mutex_. Posts the end event exactly once per session
// (the render thread races here through lastEndedSessionId_).
void StreamingPlayer::endSessionLocked(uint64_t sessionId, bool drained) {
    if (lastEndedSessionId_.exchange(sessionId) != sessionId) {
        dispatcher_.post(PlayerEventType::AudioEnd, sessionId, drained);
    }
}

VoiceResult StreamingPlayer::play(const PlaybackSessionPtr& session) {
    if (!session) {
        return ErrorManager::quiet(Errors::SessionMismatch, "play() without a session");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // The renderer tells stale chunks apart by id order
    if (session->id() <= lastArmedId_) {
        return ErrorManager::quiet(Errors::SessionMismatch,
                                   "session " + std::to_string(session->id()) + " already played");
    }

    VoiceResult opened = ensureStreamLocked();
    if (!opened) {
        return opened;
    }

    if (current_) {
        const uint64_t prior = current_->id();
        current_->cancel();
        if (lastEndedSessionId_.load() == prior) {
            // Already drained; its end event may still be in flight
            ended_.push_back(current_);
        } else {
            endSessionLocked(prior, false);
            LOG_DEBUG("Player", "Session " + std::to_string(prior) + " cancelled by a new session");
        }
    }

    current_ = session;
    lastArmedId_ = session->id();
    completeSessionId_.store(0);
    // Publishing the id is what makes the renderer drop the old chunks
    control_.store(pack(session->id(), PlayerState::Playing), std::memory_order_release);
    dispatcher_.post(PlayerEventType::SessionArmed, session->id());

    LOG_TRACE("Player", "Session " + std::to_string(session->id()) + " playing");
    return ErrorManager::ok();
}

VoiceResult StreamingPlayer::enqueue(uint64_t sessionId, std::vector<float> samples, int sampleRate) {
    if (samples.empty()) {
        return ErrorManager::ok();
    }

    const int outRate = outputRate_.load();
    if (sampleRate > 0 && sampleRate != outRate) {
        samples = linearResampleMono(samples, sampleRate, outRate);
    }
    normalizePeak(samples);

    return pushChunk(sessionId, std::make_shared<const AudioChunk>(std::move(samples), outRate, sessionId));
}

VoiceResult StreamingPlayer::enqueue(const AudioChunkPtr& chunk) {
    if (!chunk || chunk->empty()) {
        return ErrorManager::ok();
    }
    if (chunk->sampleRate() != outputRate_.load()) {
        return enqueue(chunk->sessionId(), chunk->samples(), chunk->sampleRate());
    }
    return pushChunk(chunk->sessionId(), chunk);
}

VoiceResult StreamingPlayer::pushChunk(uint64_t sessionId, AudioChunkPtr chunk) {
    PlaybackSessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && current_->id() == sessionId) {
            session = current_;
        }
    }

    // Stale producer after cancellation: expected race, not an error
    if (!session || activeSessionId() != sessionId ||
        completeSessionId_.load() == sessionId) {
        return ErrorManager::quiet(Errors::SessionMismatch,
                                   "session " + std::to_string(sessionId));
    }
    if (session->isCancelled()) {
        return ErrorManager::quiet(Errors::SessionCancelled,
                                   "session " + std::to_string(sessionId));
    }

    auto status = queue_.push(std::move(chunk), [&]() {
        return session->isCancelled() || activeSessionId() != sessionId;
    });

    if (status != ChunkQueue::PushStatus::Accepted) {
        return ErrorManager::quiet(Errors::SessionCancelled,
                                   "session " + std::to_string(sessionId) + " cancelled while enqueueing");
    }
    return ErrorManager::ok();
}

void StreamingPlayer::finish(uint64_t sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ && current_->id() == sessionId) {
        completeSessionId_.store(sessionId, std::memory_order_release);
    }
}

uint64_t StreamingPlayer::activeSessionId() const {
    const uint64_t word = control_.load(std::memory_order_acquire);
    return stateOf(word) == PlayerState::Idle ? 0 : sessionOf(word);
}

bool StreamingPlayer::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    // Only the renderer races here (Playing -> Idle on a natural end)
    uint64_t word = control_.load(std::memory_order_acquire);
    while (stateOf(word) == PlayerState::Playing) {
        if (control_.compare_exchange_weak(word, pack(sessionOf(word), PlayerState::Paused))) {
            dispatcher_.post(PlayerEventType::AudioPause, sessionOf(word));
            return true;
        }
    }
    return false;
}

bool StreamingPlayer::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t word = control_.load(std::memory_order_acquire);
    if (stateOf(word) != PlayerState::Paused ||
        !control_.compare_exchange_strong(word, pack(sessionOf(word), PlayerState::Playing))) {
        return false;
    }
    dispatcher_.post(PlayerEventType::AudioResume, sessionOf(word));
    return true;
}

bool StreamingPlayer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopLocked();
}

bool StreamingPlayer::stop(uint64_t sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_ || current_->id() != sessionId) {
        return false;
    }
    return stopLocked();
}

bool StreamingPlayer::stopLocked() {
    if (!current_) {
        control_.store(pack(lastArmedId_, PlayerState::Idle), std::memory_order_release);
        return false;
    }

    const uint64_t id = current_->id();
    current_->cancel();

    // Keeping the id lets the renderer retire this session's chunks
    control_.store(pack(id, PlayerState::Idle), std::memory_order_release);

    const bool wasLive = lastEndedSessionId_.load() != id;
    if (wasLive) {
        endSessionLocked(id, false);
        LOG_DEBUG("Player", "Session " + std::to_string(id) + " stopped");
    } else {
        ended_.push_back(current_);
    }
    current_.reset();
    return wasLive;
}

// ============================================================
// Listeners
// ============================================================
void StreamingPlayer::addListener(PlaybackListener* listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(listenerMutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void StreamingPlayer::removeListener(PlaybackListener* listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

// ============================================================
// Dispatcher thread
// ============================================================
void StreamingPlayer::handleEvent(const PlayerEvent& ev) {
    PlaybackSessionPtr finished;

    if (ev.type == PlayerEventType::AudioEnd) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && current_->id() == ev.sessionId) {
            finished = current_;
            current_.reset();
        } else {
            auto it = std::find_if(ended_.begin(), ended_.end(),
                                   [&](const PlaybackSessionPtr& s) { return s->id() == ev.sessionId; });
            if (it != ended_.end()) {
                finished = *it;
                ended_.erase(it);
            }
        }
    }

    if (ev.type == PlayerEventType::Underrun) {
        LOG_WARN("Player", std::string(Errors::Underrun) + " -> " +
                           ErrorManager::getDebugMessage(Errors::Underrun) +
                           " (session " + std::to_string(ev.sessionId) + ")");
    } else {
        LOG_TRACE("Player", std::string(toString(ev.type)) + " session=" + std::to_string(ev.sessionId));
    }

    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (auto* l : listeners_) {
            switch (ev.type) {
                case PlayerEventType::SessionArmed: l->onSessionArmed(ev.sessionId); break;
                case PlayerEventType::AudioStart:  l->onAudioStart(ev.sessionId); break;
                case PlayerEventType::AudioEnd:    l->onAudioEnd(ev.sessionId, ev.drained); break;
                case PlayerEventType::AudioPause:  l->onAudioPause(ev.sessionId); break;
                case PlayerEventType::AudioResume: l->onAudioResume(ev.sessionId); break;
                case PlayerEventType::Underrun:    break;
            }
        }
    }

    // Completion callbacks only for sessions that played to the end
    if (finished && ev.drained) {
        finished->complete();
    }
}

void StreamingPlayer::housekeeping() {
    // Release chunks the renderer is done with
    AudioChunkPtr chunk;
    while (retired_.tryPop(chunk)) {
        chunk.reset();
    }

    if (farEnd_.empty()) return;

    std::vector<float> far;
    far.reserve(farEnd_.size());
    float s = 0.0f;
    while (farEnd_.tryPop(s)) {
        far.push_back(s);
    }

    std::lock_guard<std::mutex> lock(listenerMutex_);
    for (auto* l : listeners_) {
        l->onFarEndAudio(far, outputRate_.load());
    }
}

// ============================================================
// Render thread
// ============================================================
void StreamingPlayer::retire(AudioChunkPtr& chunk) noexcept {
    if (!retired_.tryPush(std::move(chunk))) {
        // Dispatcher stalled; freeing here is the lesser evil
        chunk.reset();
    }
}

void StreamingPlayer::retireCurrent() noexcept {
    if (rtChunk_) retire(rtChunk_);
    rtPosition_ = 0;
}

// Retires chunks older than activeId. A chunk of a newer session is
// kept in rtChunk_ without playing it; the renderer is behind play().
bool StreamingPlayer::popNext(uint64_t activeId) noexcept {
    AudioChunkPtr next;
    while (queue_.tryPop(next)) {
        if (next->sessionId() >= activeId) {
            rtChunk_ = std::move(next);
            rtPosition_ = 0;
            return true;
        }
        retire(next); // stale session
    }
    return false;
}

void StreamingPlayer::render(float* out, unsigned long frames, int channels, bool underflow) noexcept {
    const unsigned long ch = channels > 0 ? static_cast<unsigned long>(channels) : 1;

    // One snapshot per period: id and state always agree
    const uint64_t word = control_.load(std::memory_order_acquire);
    const uint64_t active = sessionOf(word);
    const PlayerState st = stateOf(word);
    // Read before popping: once finish() is seen, every chunk is queued
    const bool producerDone = completeSessionId_.load(std::memory_order_acquire) == active;

    if (active != rtSession_) {
        rtSession_ = active;
        rtStarted_ = false;
        rtInUnderrun_ = false;
    }
    if (rtChunk_) {
        const uint64_t id = rtChunk_->sessionId();
        if (id < active || (id == active && st == PlayerState::Idle)) {
            retireCurrent();
        }
    }

    if (underflow && st != PlayerState::Idle) {
        underruns_.fetch_add(1);
        dispatcher_.postFromRealtime(PlayerEventType::Underrun, active);
    }

    if (st != PlayerState::Playing) {
        std::fill(out, out + frames * ch, 0.0f);
        if (st == PlayerState::Idle && !rtChunk_) {
            // Up to and including the ended session everything is stale
            AudioChunkPtr next;
            while (queue_.tryPop(next)) {
                if (next->sessionId() > active) {
                    rtChunk_ = std::move(next);
                    rtPosition_ = 0;
                    break;
                }
                retire(next);
            }
        }
        return;
    }

    const bool tap = farEndTap_.load(std::memory_order_relaxed);
    unsigned long written = 0;

    while (written < frames) {
        if (!rtChunk_ && !popNext(active)) {
            break;
        }
        if (rtChunk_->sessionId() != active) {
            break;
        }

        const size_t remaining = rtChunk_->size() - rtPosition_;
        const unsigned long n = static_cast<unsigned long>(
            std::min<size_t>(frames - written, remaining));
        const float* src = rtChunk_->data() + rtPosition_;

        for (unsigned long i = 0; i < n; ++i) {
            float* frame = out + (written + i) * ch;
            for (unsigned long c = 0; c < ch; ++c) frame[c] = src[i];
        }
        if (tap) {
            for (unsigned long i = 0; i < n; ++i) farEnd_.tryPush(src[i]);
        }

        written += n;
        rtPosition_ += n;
        if (rtPosition_ >= rtChunk_->size()) {
            retireCurrent();
        }
    }

    std::fill(out + written * ch, out + frames * ch, 0.0f);

    if (written > 0) {
        if (!rtStarted_) {
            rtStarted_ = true;
            dispatcher_.postFromRealtime(PlayerEventType::AudioStart, active);
        }
        rtInUnderrun_ = false;
    }

    if (written < frames) {
        if (producerDone) {
            // Fails if play() or stop() moved on since the snapshot
            uint64_t expected = pack(active, PlayerState::Playing);
            if (control_.compare_exchange_strong(expected, pack(active, PlayerState::Idle)) &&
                lastEndedSessionId_.exchange(active) != active) {
                dispatcher_.postFromRealtime(PlayerEventType::AudioEnd, active, true);
            }
        } else if (rtStarted_ && !rtInUnderrun_) {
            // Producer fell behind: silence substituted, session continues
            rtInUnderrun_ = true;
            underruns_.fetch_add(1);
            dispatcher_.postFromRealtime(PlayerEventType::Underrun, active);
        }
    }
}

} // namespace Parley
