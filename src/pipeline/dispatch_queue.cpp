/**
 * @file dispatch_queue.cpp
 * @brief DispatchQueue implementation.
 * @author log_courier contributors
 */

#include "pipeline/dispatch_queue.hpp"

namespace log_courier {

DispatchQueue::DispatchQueue(size_t capacity_bytes, OverflowPolicy policy)
    : capacity_(capacity_bytes), policy_(policy) {}

Result<void> DispatchQueue::check_fits(const EncodedPacket& packet) {
    if (closed_) {
        ++dropped_;
        return queue_overflow_error("queue closed");
    }
    if (packet.size() > capacity_) {
        ++dropped_;
        return queue_overflow_error("packet of " + std::to_string(packet.size()) +
                                    " bytes exceeds queue capacity " + std::to_string(capacity_));
    }
    return {};
}

void DispatchQueue::append_locked(EncodedPacket packet) {
    bytes_ += packet.size();
    items_.push_back(std::move(packet));
}

EncodedPacket DispatchQueue::take_front_locked() {
    EncodedPacket front = std::move(items_.front());
    items_.pop_front();
    bytes_ -= front.size();
    return front;
}

Result<void> DispatchQueue::push(EncodedPacket packet) {
    {
        std::unique_lock lock(mutex_);
        if (auto fits = check_fits(packet); !fits) return fits;

        if (policy_ == OverflowPolicy::Throttle) {
            not_full_.wait(lock, [&] {
                return closed_ || bytes_ + packet.size() <= capacity_;
            });
            if (closed_) {
                ++dropped_;
                return queue_overflow_error("queue closed");
            }
        } else {
            while (bytes_ + packet.size() > capacity_) {
                take_front_locked();
                ++dropped_;
            }
        }
        append_locked(std::move(packet));
    }
    not_empty_.notify_one();
    return {};
}

Result<void> DispatchQueue::try_push(EncodedPacket packet) {
    {
        std::lock_guard lock(mutex_);
        if (auto fits = check_fits(packet); !fits) return fits;

        if (bytes_ + packet.size() > capacity_) {
            if (policy_ == OverflowPolicy::Throttle) {
                return queue_overflow_error("queue full (" + std::to_string(bytes_) + " of " +
                                            std::to_string(capacity_) + " bytes)");
            }
            while (bytes_ + packet.size() > capacity_) {
                take_front_locked();
                ++dropped_;
            }
        }
        append_locked(std::move(packet));
    }
    not_empty_.notify_one();
    return {};
}

std::optional<EncodedPacket> DispatchQueue::pop(std::chrono::milliseconds timeout) {
    std::stop_source never;
    return pop(never.get_token(), timeout);
}

std::optional<EncodedPacket> DispatchQueue::pop(std::stop_token stop, std::chrono::milliseconds timeout) {
    std::optional<EncodedPacket> out;
    {
        std::unique_lock lock(mutex_);
        not_empty_.wait_for(lock, stop, timeout, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        out = take_front_locked();
    }
    not_full_.notify_all();
    return out;
}

std::optional<EncodedPacket> DispatchQueue::try_pop() {
    std::optional<EncodedPacket> out;
    {
        std::lock_guard lock(mutex_);
        if (items_.empty()) return std::nullopt;
        out = take_front_locked();
    }
    not_full_.notify_all();
    return out;
}

size_t DispatchQueue::clear() {
    size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        removed = items_.size();
        items_.clear();
        bytes_ = 0;
        dropped_ += removed;
    }
    not_full_.notify_all();
    return removed;
}

void DispatchQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool DispatchQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool DispatchQueue::empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
}

QueueStats DispatchQueue::stats() const {
    std::lock_guard lock(mutex_);
    return QueueStats{items_.size(), bytes_, dropped_};
}

}  // namespace log_courier
