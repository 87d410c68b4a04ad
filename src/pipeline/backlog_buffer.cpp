/**
 * @file backlog_buffer.cpp
 * @brief BacklogBuffer implementation.
 * @author log_courier contributors
 */

#include "pipeline/backlog_buffer.hpp"

#include "protocol/packet_codec.hpp"

#include <algorithm>
#include <cstring>

namespace log_courier {

BacklogBuffer::BacklogBuffer(size_t capacity_bytes, Level flush_on)
    : buffer_(std::make_unique<uint8_t[]>(capacity_bytes > 0 ? capacity_bytes : 1))
    , capacity_(capacity_bytes)
    , flush_on_(flush_on) {}

// ── Ring access ──────────────────────────────

void BacklogBuffer::write_wrapped(size_t pos, const uint8_t* src, size_t len) {
    const size_t first = std::min(len, capacity_ - pos);
    std::memcpy(buffer_.get() + pos, src, first);
    if (first < len) {
        std::memcpy(buffer_.get(), src + first, len - first);
    }
}

void BacklogBuffer::read_wrapped(size_t pos, uint8_t* dst, size_t len) const {
    const size_t first = std::min(len, capacity_ - pos);
    std::memcpy(dst, buffer_.get() + pos, first);
    if (first < len) {
        std::memcpy(dst + first, buffer_.get(), len - first);
    }
}

size_t BacklogBuffer::front_record_size() const {
    uint8_t len_bytes[4];
    read_wrapped(head_, len_bytes, 4);
    return kRecordHeaderSize + PacketCodec::get_u32(len_bytes);
}

void BacklogBuffer::drop_front_locked() {
    const size_t record = front_record_size();
    head_ = (head_ + record) % capacity_;
    used_ -= record;
    --count_;
    if (count_ == 0) {
        head_ = tail_ = 0;
        flush_requested_ = false;
    }
}

// ── Public API ───────────────────────────────

Result<size_t> BacklogBuffer::append(const EncodedPacket& packet) {
    const size_t record = kRecordHeaderSize + packet.size();

    std::lock_guard lock(mutex_);
    if (record > capacity_) {
        ++dropped_;
        return queue_overflow_error("packet of " + std::to_string(packet.size()) +
                                    " bytes exceeds backlog capacity " + std::to_string(capacity_));
    }

    size_t evicted = 0;
    while (used_ + record > capacity_) {
        drop_front_locked();
        ++evicted;
    }
    dropped_ += evicted;

    std::vector<uint8_t> header;
    header.reserve(kRecordHeaderSize);
    PacketCodec::put_u32(header, static_cast<uint32_t>(packet.size()));
    header.push_back(static_cast<uint8_t>(packet.level));
    PacketCodec::put_i16(header, static_cast<int16_t>(packet.type));

    write_wrapped(tail_, header.data(), header.size());
    write_wrapped((tail_ + kRecordHeaderSize) % capacity_, packet.frame.data(), packet.size());
    tail_ = (tail_ + record) % capacity_;
    used_ += record;
    ++count_;

    if (packet.level >= flush_on_) {
        flush_requested_ = true;
    }
    return evicted;
}

std::optional<EncodedPacket> BacklogBuffer::peek() const {
    std::lock_guard lock(mutex_);
    if (count_ == 0) return std::nullopt;

    uint8_t header[kRecordHeaderSize];
    read_wrapped(head_, header, kRecordHeaderSize);

    EncodedPacket out;
    const uint32_t len = PacketCodec::get_u32(header);
    out.level = static_cast<Level>(header[4]);
    out.type = static_cast<PacketType>(PacketCodec::get_i16(header + 5));
    out.frame.resize(len);
    read_wrapped((head_ + kRecordHeaderSize) % capacity_, out.frame.data(), len);
    return out;
}

void BacklogBuffer::commit_pop() {
    std::lock_guard lock(mutex_);
    if (count_ > 0) drop_front_locked();
}

size_t BacklogBuffer::clear() {
    std::lock_guard lock(mutex_);
    const size_t removed = count_;
    head_ = tail_ = used_ = count_ = 0;
    flush_requested_ = false;
    return removed;
}

bool BacklogBuffer::flush_requested() const {
    std::lock_guard lock(mutex_);
    return flush_requested_;
}

void BacklogBuffer::set_flush_on(Level level) {
    std::lock_guard lock(mutex_);
    flush_on_ = level;
}

bool BacklogBuffer::empty() const {
    std::lock_guard lock(mutex_);
    return count_ == 0;
}

size_t BacklogBuffer::count() const {
    std::lock_guard lock(mutex_);
    return count_;
}

size_t BacklogBuffer::bytes() const {
    std::lock_guard lock(mutex_);
    return used_;
}

BacklogStats BacklogBuffer::stats() const {
    std::lock_guard lock(mutex_);
    return BacklogStats{count_, used_, dropped_, flush_requested_};
}

}  // namespace log_courier
