#include <gtest/gtest.h>
#include "AudioBlock.hpp"
#include "CaptureQueue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace omega;
using namespace std::chrono_literals;

namespace {

// Records the queue size from its destructor, which needs the queue lock
struct SizeOnDestroy {
    CaptureQueue<SizeOnDestroy>* queue = nullptr;
    std::vector<size_t>* seen = nullptr;

    SizeOnDestroy() = default;
    SizeOnDestroy(CaptureQueue<SizeOnDestroy>* q, std::vector<size_t>* s) : queue(q), seen(s) {}
    SizeOnDestroy(SizeOnDestroy&& other) noexcept
        : queue(std::exchange(other.queue, nullptr))
        , seen(std::exchange(other.seen, nullptr))
    {}
    SizeOnDestroy& operator=(SizeOnDestroy&& other) noexcept {
        release();
        queue = std::exchange(other.queue, nullptr);
        seen = std::exchange(other.seen, nullptr);
        return *this;
    }
    ~SizeOnDestroy() { release(); }

    void release() {
        if (queue && seen) seen->push_back(queue->size());
        queue = nullptr;
        seen = nullptr;
    }
};

} // namespace

TEST(CaptureQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(CaptureQueue<int>(0), std::invalid_argument);
}

TEST(CaptureQueueTest, FifoWhileBelowCapacity) {
    CaptureQueue<int> queue(4);
    EXPECT_FALSE(queue.push(1));
    EXPECT_FALSE(queue.push(2));
    EXPECT_FALSE(queue.push(3));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.try_pop().value_or(-1), 1);
    EXPECT_EQ(queue.try_pop().value_or(-1), 2);
    EXPECT_EQ(queue.try_pop().value_or(-1), 3);
    EXPECT_FALSE(queue.try_pop().has_value());
    EXPECT_EQ(queue.dropped(), 0u);
}

TEST(CaptureQueueTest, OverflowKeepsMostRecentInOrder) {
    CaptureQueue<int> queue(100);
    for (int i = 1; i <= 150; ++i) {
        queue.push(i);
        EXPECT_LE(queue.size(), queue.capacity());
    }

    EXPECT_EQ(queue.size(), 100u);
    EXPECT_EQ(queue.dropped(), 50u);
    for (int expected = 51; expected <= 150; ++expected) {
        auto item = queue.try_pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, expected);
    }
    EXPECT_TRUE(queue.empty());
}

TEST(CaptureQueueTest, PushIntoFullQueueEvictsExactlyOne) {
    CaptureQueue<int> queue(2);
    EXPECT_FALSE(queue.push(1));
    EXPECT_FALSE(queue.push(2));
    EXPECT_TRUE(queue.push(3));
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.try_pop().value_or(-1), 2);
    EXPECT_EQ(queue.try_pop().value_or(-1), 3);
}

TEST(CaptureQueueTest, PopTimesOutWhenEmpty) {
    CaptureQueue<int> queue(8);
    const auto start = std::chrono::steady_clock::now();
    auto item = queue.pop(20ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(item.has_value());
    EXPECT_GE(elapsed, 15ms);
}

TEST(CaptureQueueTest, PopWakesOnPush) {
    CaptureQueue<int> queue(8);
    std::thread producer([&]() {
        std::this_thread::sleep_for(10ms);
        queue.push(42);
    });

    auto item = queue.pop(2s);
    producer.join();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 42);
}

TEST(CaptureQueueTest, LatestPeeksWithoutRemoving) {
    CaptureQueue<int> queue(3);
    EXPECT_FALSE(queue.latest().has_value());

    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.latest().value_or(-1), 2);
    EXPECT_EQ(queue.size(), 2u);

    queue.push(3);
    queue.push(4);   // Evicts 1
    EXPECT_EQ(queue.latest().value_or(-1), 4);
    EXPECT_EQ(queue.try_pop().value_or(-1), 2);
}

TEST(CaptureQueueTest, ClearReportsDiscardedCount) {
    CaptureQueue<AudioBlock> queue(10);
    const std::vector<float> samples(512 * 2, 0.25f);
    for (int i = 0; i < 7; ++i) {
        queue.push(AudioBlock(samples, 2, 48000));
    }

    EXPECT_EQ(queue.clear(), 7u);
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.latest().has_value());
}

TEST(CaptureQueueTest, ProducerNeverBlocksOnSlowConsumer) {
    CaptureQueue<int> queue(16);
    std::atomic<bool> done{false};
    std::vector<int> received;

    std::thread consumer([&]() {
        while (!done || !queue.empty()) {
            if (auto item = queue.pop(5ms)) {
                received.push_back(*item);
                std::this_thread::sleep_for(100us);
            }
        }
    });

    for (int i = 0; i < 2000; ++i) {
        queue.push(i);
    }
    done = true;
    consumer.join();

    EXPECT_EQ(received.size() + queue.dropped(), 2000u);
    for (size_t i = 1; i < received.size(); ++i) {
        EXPECT_LT(received[i - 1], received[i]);
    }
}

TEST(CaptureQueueTest, EvictedAndClearedItemsDieOutsideTheLock) {
    std::vector<size_t> seen;
    CaptureQueue<SizeOnDestroy> queue(2);
    EXPECT_FALSE(queue.push(SizeOnDestroy(&queue, &seen)));
    EXPECT_FALSE(queue.push(SizeOnDestroy(&queue, &seen)));
    EXPECT_TRUE(queue.push(SizeOnDestroy(&queue, &seen)));
    EXPECT_EQ(seen, std::vector<size_t>({2}));

    EXPECT_EQ(queue.clear(), 2u);
    EXPECT_EQ(seen, std::vector<size_t>({2, 0, 0}));
}

TEST(CaptureQueueTest, LatestSharesQueuedBlock) {
    CaptureQueue<std::shared_ptr<const AudioBlock>> queue(4);
    const std::vector<float> samples(8, 0.25f);
    auto block = std::make_shared<const AudioBlock>(samples, 2, 48000);
    queue.push(block);

    const auto newest = queue.latest();
    ASSERT_TRUE(newest.has_value());
    EXPECT_EQ(newest->get(), block.get());
    EXPECT_EQ(queue.size(), 1u);
}
