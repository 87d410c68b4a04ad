/**
 * @file dispatch_queue.hpp
 * @brief Byte-budgeted FIFO between producers and the sender.
 * @author log_courier contributors
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

#include "core/result.hpp"
#include "protocol/packet.hpp"

namespace log_courier {

enum class OverflowPolicy : uint8_t {
    Drop,       ///< evict oldest until the new packet fits
    Throttle    ///< block the producer until space is freed
};

struct QueueStats {
    size_t count = 0;
    size_t bytes = 0;
    uint64_t dropped = 0;
};

/**
 * @brief Multi-producer, single-consumer queue bounded by total frame bytes.
 *
 * Arrival order is preserved; the resident byte total never exceeds the
 * capacity. close() wakes every waiter and makes further pushes fail.
 */
class DispatchQueue {
public:
    DispatchQueue(size_t capacity_bytes, OverflowPolicy policy);

    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    /**
     * @brief Enqueue, applying the overflow policy.
     *
     * Under Throttle this blocks while the queue is full. Fails only when
     * the packet exceeds the whole capacity or the queue is closed.
     */
    Result<void> push(EncodedPacket packet);

    /**
     * @brief Non-blocking enqueue; a full throttled queue is QueueOverflow.
     */
    Result<void> try_push(EncodedPacket packet);

    /// Wait up to @p timeout for the next packet.
    std::optional<EncodedPacket> pop(std::chrono::milliseconds timeout);

    /// Wait up to @p timeout, returning early when @p stop is requested.
    std::optional<EncodedPacket> pop(std::stop_token stop, std::chrono::milliseconds timeout);

    /// Non-blocking pop.
    std::optional<EncodedPacket> try_pop();

    /// Discard everything resident (counted as dropped); returns how many.
    size_t clear();

    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] QueueStats stats() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] OverflowPolicy policy() const noexcept { return policy_; }

private:
    Result<void> check_fits(const EncodedPacket& packet);
    void append_locked(EncodedPacket packet);
    EncodedPacket take_front_locked();

    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::deque<EncodedPacket> items_;
    size_t bytes_{0};
    uint64_t dropped_{0};
    bool closed_{false};
};

}  // namespace log_courier
