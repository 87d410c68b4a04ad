/**
 * @file backlog_buffer.hpp
 * @brief Fixed-capacity ring arena holding frames while disconnected.
 * @author log_courier contributors
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "core/result.hpp"
#include "protocol/packet.hpp"

namespace log_courier {

struct BacklogStats {
    size_t count = 0;
    size_t bytes = 0;
    uint64_t dropped = 0;
    bool flush_requested = false;
};

/**
 * @brief Ring arena of encoded packets with oldest-first eviction.
 *
 * Each record is a 7-byte header ([4B frame length][1B level][2B type])
 * followed by the frame; records may wrap around the end of the arena.
 * Resident bytes (headers included) never exceed the capacity.
 *
 * Sending uses peek() then commit_pop(), so a record leaves the arena only
 * once it has been written to the transport.
 */
class BacklogBuffer {
public:
    static constexpr size_t kRecordHeaderSize = 7;

    BacklogBuffer(size_t capacity_bytes, Level flush_on = Level::Error);

    BacklogBuffer(const BacklogBuffer&) = delete;
    BacklogBuffer& operator=(const BacklogBuffer&) = delete;

    /**
     * @brief Append a packet, evicting the oldest records if needed.
     * @return Number of records evicted to make room. A record that cannot
     *         fit even in an empty arena is a QueueOverflow error.
     */
    Result<size_t> append(const EncodedPacket& packet);

    /// Oldest record, left in place.
    [[nodiscard]] std::optional<EncodedPacket> peek() const;

    /// Remove the oldest record after it was sent.
    void commit_pop();

    /// Discard everything; returns how many records were removed.
    size_t clear();

    /// True once a packet at or above the flush-on level was appended;
    /// reset when the arena becomes empty.
    [[nodiscard]] bool flush_requested() const;

    void set_flush_on(Level level);

    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t count() const;
    [[nodiscard]] size_t bytes() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] BacklogStats stats() const;

private:
    void write_wrapped(size_t pos, const uint8_t* src, size_t len);
    void read_wrapped(size_t pos, uint8_t* dst, size_t len) const;
    [[nodiscard]] size_t front_record_size() const;
    void drop_front_locked();

    std::unique_ptr<uint8_t[]> buffer_;
    const size_t capacity_;
    Level flush_on_;

    mutable std::mutex mutex_;
    size_t head_{0};        ///< offset of the oldest record
    size_t tail_{0};        ///< offset where the next record is written
    size_t used_{0};
    size_t count_{0};
    uint64_t dropped_{0};
    bool flush_requested_{false};
};

}  // namespace log_courier
