#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "audio/chunk_queue.hpp"
#include "audio/spsc_ring.hpp"

using namespace Parley;
using namespace std::chrono_literals;

static AudioChunkPtr chunk(size_t n, uint64_t session = 1) {
    return std::make_shared<const AudioChunk>(std::vector<float>(n, 0.1f), 1000, session);
}

TEST(SpscRing, KeepsValueWhenFull) {
    SpscRing<AudioChunkPtr> ring(1);
    EXPECT_TRUE(ring.tryPush(chunk(4)));

    AudioChunkPtr extra = chunk(8);
    EXPECT_FALSE(ring.tryPush(std::move(extra)));
    ASSERT_TRUE(extra);
    EXPECT_EQ(extra->size(), 8u);
}

TEST(SpscRing, PopsInOrder) {
    SpscRing<int> ring(3);
    EXPECT_TRUE(ring.tryPush(1));
    EXPECT_TRUE(ring.tryPush(2));
    EXPECT_TRUE(ring.tryPush(3));
    EXPECT_TRUE(ring.full());

    int v = 0;
    ASSERT_TRUE(ring.tryPop(v));
    EXPECT_EQ(v, 1);
    EXPECT_TRUE(ring.tryPush(4));
    ASSERT_TRUE(ring.tryPop(v));
    EXPECT_EQ(v, 2);
    ASSERT_TRUE(ring.tryPop(v));
    EXPECT_EQ(v, 3);
    ASSERT_TRUE(ring.tryPop(v));
    EXPECT_EQ(v, 4);
    EXPECT_FALSE(ring.tryPop(v));
    EXPECT_TRUE(ring.empty());
}

TEST(ChunkQueue, TryPushRespectsCapacity) {
    ChunkQueue q(2);
    EXPECT_TRUE(q.tryPush(chunk(1)));
    EXPECT_TRUE(q.tryPush(chunk(1)));
    EXPECT_FALSE(q.tryPush(chunk(1)));
    EXPECT_EQ(q.size(), 2u);
}

TEST(ChunkQueue, PushAbortsWhileFull) {
    ChunkQueue q(1);
    ASSERT_TRUE(q.tryPush(chunk(1)));

    std::atomic<int> polls{0};
    auto status = q.push(chunk(1), [&]() { return ++polls > 3; });
    EXPECT_EQ(status, ChunkQueue::PushStatus::Aborted);
    EXPECT_EQ(q.size(), 1u);
}

TEST(ChunkQueue, PushTimesOut) {
    ChunkQueue q(1);
    ASSERT_TRUE(q.tryPush(chunk(1)));

    auto status = q.push(chunk(1), {}, 20ms);
    EXPECT_EQ(status, ChunkQueue::PushStatus::TimedOut);
}

TEST(ChunkQueue, BlockedProducerReleasedByConsumer) {
    ChunkQueue q(1);
    ASSERT_TRUE(q.tryPush(chunk(1, 1)));

    std::atomic<bool> done{false};
    std::thread producer([&]() {
        auto status = q.push(chunk(1, 2), {});
        EXPECT_EQ(status, ChunkQueue::PushStatus::Accepted);
        done.store(true);
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(done.load());

    AudioChunkPtr out;
    ASSERT_TRUE(q.tryPop(out));
    EXPECT_EQ(out->sessionId(), 1u);

    producer.join();
    EXPECT_TRUE(done.load());
    ASSERT_TRUE(q.tryPop(out));
    EXPECT_EQ(out->sessionId(), 2u);
}
