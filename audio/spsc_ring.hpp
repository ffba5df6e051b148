#pragma once
#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

namespace Parley {

// ------------------------------------------------------------
// SpscRing: fixed-capacity single-producer / single-consumer ring.
// Storage is allocated once in the constructor; push/pop never
// allocate or block, so either side may be a real-time thread.
// ------------------------------------------------------------
template <typename T>
class SpscRing {
public:
    explicit SpscRing(size_t capacity)
        : slots_(capacity + 1) {}

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    size_t capacity() const { return slots_.size() - 1; }

    // Producer side; `value` is left untouched when the ring is full
    bool tryPush(T&& value) {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = increment(head);
        if (next == tail_.load(std::memory_order_acquire)) {
            return false; // full
        }
        slots_[head] = std::move(value);
        head_.store(next, std::memory_order_release);
        return true;
    }

    bool tryPush(const T& value) {
        T copy = value;
        return tryPush(std::move(copy));
    }

    // Consumer side
    bool tryPop(T& out) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // empty
        }
        out = std::move(slots_[tail]);
        slots_[tail] = T{};
        tail_.store(increment(tail), std::memory_order_release);
        return true;
    }

    // Approximate from any thread; exact from either endpoint
    size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return head >= tail ? head - tail : head + slots_.size() - tail;
    }

    bool empty() const { return size() == 0; }
    bool full() const { return size() == capacity(); }

private:
    size_t increment(size_t i) const {
        return (i + 1 == slots_.size()) ? 0 : i + 1;
    }

    std::vector<T> slots_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace Parley
