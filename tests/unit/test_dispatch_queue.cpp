/**
 * @file test_dispatch_queue.cpp
 * @brief Unit tests for the byte-budgeted dispatch queue.
 * @author log_courier contributors
 */

#include "pipeline/dispatch_queue.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace log_courier;

namespace {

/// Packet of exactly @p size frame bytes; the first byte tags it.
EncodedPacket make_packet(size_t size, uint8_t tag, Level level = Level::Message) {
    EncodedPacket p;
    p.level = level;
    p.type = PacketType::LogEntry;
    p.frame.assign(size, 0);
    p.frame[0] = tag;
    return p;
}

}  // namespace

// ═══════════════════════════════════════════════
// Drop policy
// ═══════════════════════════════════════════════

TEST(DispatchQueueTest, FifoOrder) {
    DispatchQueue queue(1024, OverflowPolicy::Drop);
    for (uint8_t i = 1; i <= 3; ++i) {
        ASSERT_TRUE(queue.push(make_packet(10, i)).has_value());
    }
    for (uint8_t i = 1; i <= 3; ++i) {
        auto p = queue.try_pop();
        ASSERT_TRUE(p.has_value());
        EXPECT_EQ(p->frame[0], i);
    }
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(DispatchQueueTest, EvictionKeepsResidentBytesWithinCapacity) {
    DispatchQueue queue(2048, OverflowPolicy::Drop);

    // 10 x 300 bytes = 3000 bytes offered; at most 6 fit.
    for (uint8_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(queue.push(make_packet(300, i)).has_value());
        EXPECT_LE(queue.stats().bytes, 2048u);
    }

    auto stats = queue.stats();
    EXPECT_EQ(stats.count, 6u);
    EXPECT_EQ(stats.bytes, 1800u);
    EXPECT_EQ(stats.dropped, 4u);

    // Oldest were evicted: the survivors are 4..9 in order.
    for (uint8_t expected = 4; expected < 10; ++expected) {
        auto p = queue.try_pop();
        ASSERT_TRUE(p.has_value());
        EXPECT_EQ(p->frame[0], expected);
    }
}

TEST(DispatchQueueTest, MixedSizesEvictOnlyWhatIsNeeded) {
    DispatchQueue queue(2048, OverflowPolicy::Drop);
    ASSERT_TRUE(queue.push(make_packet(1000, 1)).has_value());
    ASSERT_TRUE(queue.push(make_packet(100, 2)).has_value());
    ASSERT_TRUE(queue.push(make_packet(900, 3)).has_value());
    ASSERT_TRUE(queue.push(make_packet(500, 4)).has_value());

    auto stats = queue.stats();
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.bytes, 1500u);
    EXPECT_EQ(queue.try_pop()->frame[0], 2);
}

TEST(DispatchQueueTest, PacketLargerThanCapacityRejected) {
    DispatchQueue queue(100, OverflowPolicy::Drop);
    ASSERT_TRUE(queue.push(make_packet(50, 1)).has_value());

    auto result = queue.push(make_packet(101, 2));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::QueueOverflow);
    // Resident packets are untouched.
    EXPECT_EQ(queue.stats().count, 1u);
}

TEST(DispatchQueueTest, ClearCountsAsDropped) {
    DispatchQueue queue(1024, OverflowPolicy::Drop);
    queue.push(make_packet(10, 1));
    queue.push(make_packet(10, 2));
    EXPECT_EQ(queue.clear(), 2u);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.stats().dropped, 2u);
    EXPECT_EQ(queue.stats().bytes, 0u);
}

// ═══════════════════════════════════════════════
// Throttle policy
// ═══════════════════════════════════════════════

TEST(DispatchQueueTest, TryPushOnFullThrottledQueueFails) {
    DispatchQueue queue(100, OverflowPolicy::Throttle);
    ASSERT_TRUE(queue.try_push(make_packet(60, 1)).has_value());

    auto result = queue.try_push(make_packet(60, 2));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::QueueOverflow);
    EXPECT_EQ(queue.stats().count, 1u);
    EXPECT_EQ(queue.stats().dropped, 0u);
}

TEST(DispatchQueueTest, ThrottledPushBlocksUntilSpaceFrees) {
    DispatchQueue queue(100, OverflowPolicy::Throttle);
    ASSERT_TRUE(queue.push(make_packet(60, 1)).has_value());

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        auto result = queue.push(make_packet(60, 2));
        EXPECT_TRUE(result.has_value());
        pushed.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    auto first = queue.pop(std::chrono::milliseconds(100));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->frame[0], 1);

    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.try_pop()->frame[0], 2);
}

TEST(DispatchQueueTest, CloseReleasesBlockedProducer) {
    DispatchQueue queue(100, OverflowPolicy::Throttle);
    ASSERT_TRUE(queue.push(make_packet(100, 1)).has_value());

    std::thread producer([&] {
        auto result = queue.push(make_packet(10, 2));
        EXPECT_FALSE(result.has_value());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(make_packet(1, 3)).has_value());
    // Residents stay poppable after close.
    EXPECT_TRUE(queue.try_pop().has_value());
}

// ═══════════════════════════════════════════════
// Consumer side
// ═══════════════════════════════════════════════

TEST(DispatchQueueTest, PopTimesOutWhenEmpty) {
    DispatchQueue queue(100, OverflowPolicy::Drop);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(DispatchQueueTest, PopReturnsEarlyOnStop) {
    DispatchQueue queue(100, OverflowPolicy::Drop);
    std::stop_source source;
    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.request_stop();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(source.get_token(), std::chrono::seconds(10)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    stopper.join();
}

TEST(DispatchQueueTest, ConcurrentProducersKeepBudget) {
    DispatchQueue queue(2048, OverflowPolicy::Drop);
    std::atomic<bool> violated{false};

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                queue.push(make_packet(64 + static_cast<size_t>((i * 7 + t) % 200), 0));
                if (queue.stats().bytes > 2048) violated.store(true);
            }
        });
    }
    for (auto& p : producers) p.join();

    EXPECT_FALSE(violated.load());
    auto stats = queue.stats();
    EXPECT_LE(stats.bytes, 2048u);
    EXPECT_GT(stats.dropped, 0u);
}
