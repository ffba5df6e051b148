#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "audio/event_dispatcher.hpp"

using namespace Parley;

TEST(EventDispatcher, MergesBothSourcesByPostingOrder) {
    std::vector<PlayerEventType> seen;
    EventDispatcher dispatcher(8, [&](const PlayerEvent& ev) { seen.push_back(ev.type); });

    dispatcher.post(PlayerEventType::SessionArmed, 1);
    EXPECT_TRUE(dispatcher.postFromRealtime(PlayerEventType::AudioStart, 1));
    dispatcher.post(PlayerEventType::AudioPause, 1);
    EXPECT_TRUE(dispatcher.postFromRealtime(PlayerEventType::AudioEnd, 1, true));

    EXPECT_EQ(dispatcher.dispatchPending(), 4u);
    std::vector<PlayerEventType> expected{PlayerEventType::SessionArmed, PlayerEventType::AudioStart,
                                          PlayerEventType::AudioPause, PlayerEventType::AudioEnd};
    EXPECT_EQ(seen, expected);
    EXPECT_EQ(dispatcher.heldEvents(), 0u);
}

TEST(EventDispatcher, HandlerExceptionDoesNotStopDelivery) {
    int delivered = 0;
    EventDispatcher dispatcher(4, [&](const PlayerEvent& ev) {
        ++delivered;
        if (ev.sessionId == 1) throw std::runtime_error("listener failure");
    });
    dispatcher.post(PlayerEventType::AudioStart, 1);
    dispatcher.post(PlayerEventType::AudioStart, 2);
    EXPECT_EQ(dispatcher.dispatchPending(), 2u);
    EXPECT_EQ(delivered, 2);
}

// A render-side poster and a control poster run flat out while the
// dispatcher thread delivers. Delivery order must follow posting order.
TEST(EventDispatcher, InterleavedPostersDeliverInSequence) {
    std::mutex mutex;
    std::vector<uint64_t> seqs;
    EventDispatcher dispatcher(4096, [&](const PlayerEvent& ev) {
        std::lock_guard<std::mutex> lock(mutex);
        seqs.push_back(ev.seq);
    });
    dispatcher.start();

    constexpr int kEach = 20000;
    std::atomic<int> realtimePosted{0};
    std::thread realtime([&]() {
        for (int i = 0; i < kEach; ++i) {
            if (dispatcher.postFromRealtime(PlayerEventType::AudioStart, 1)) realtimePosted.fetch_add(1);
        }
    });
    for (int i = 0; i < kEach; ++i) {
        dispatcher.post(PlayerEventType::AudioPause, 1);
    }
    realtime.join();
    dispatcher.stop();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seqs.size(), static_cast<size_t>(kEach + realtimePosted.load()));
    EXPECT_EQ(realtimePosted.load() + static_cast<int>(dispatcher.droppedRealtimeEvents()), kEach);

    size_t outOfOrder = 0;
    for (size_t i = 1; i < seqs.size(); ++i) {
        if (seqs[i] <= seqs[i - 1]) ++outOfOrder;
    }
    EXPECT_EQ(outOfOrder, 0u);
    EXPECT_EQ(dispatcher.heldEvents(), 0u);
}
