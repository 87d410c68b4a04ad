/**
 * @file fake_transport.hpp
 * @brief Scriptable in-memory ITransport for connection and sender tests.
 * @author log_courier contributors
 */

#pragma once

#include "network/transport.hpp"
#include "protocol/packet_codec.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace log_courier::test_support {

/**
 * @brief State shared between a FakeTransport and the test that created it.
 *
 * The transport is moved into a ConnectionManager, so the test keeps this
 * handle to script failures and inspect what was written.
 */
class FakeTransportState {
public:
    void set_accept_connections(bool accept) {
        std::lock_guard lock(mutex_);
        accept_ = accept;
    }

    /// Every send fails until cleared.
    void set_fail_sends(bool fail) {
        std::lock_guard lock(mutex_);
        fail_sends_ = fail;
    }

    /// Fail the send that would become frame number @p count (header included).
    void fail_after_frames(size_t count) {
        std::lock_guard lock(mutex_);
        fail_after_ = count;
    }

    [[nodiscard]] std::vector<std::vector<uint8_t>> frames() const {
        std::lock_guard lock(mutex_);
        return frames_;
    }

    /// Frames other than LogHeader, decoded.
    [[nodiscard]] std::vector<Packet> packets() const {
        std::vector<Packet> out;
        for (const auto& frame : frames()) {
            auto decoded = PacketCodec::decode_frame(frame);
            if (decoded && decoded->type() != PacketType::LogHeader) {
                out.push_back(std::move(*decoded));
            }
        }
        return out;
    }

    /// Titles of every LogEntry written, in order.
    [[nodiscard]] std::vector<std::string> titles() const {
        std::vector<std::string> out;
        for (const auto& packet : packets()) {
            if (const auto* entry = std::get_if<LogEntry>(&packet.body)) {
                out.push_back(entry->title);
            }
        }
        return out;
    }

    [[nodiscard]] size_t header_count() const {
        size_t n = 0;
        for (const auto& frame : frames()) {
            if (frame.size() >= 2 && PacketCodec::get_i16(frame.data()) ==
                                         static_cast<int16_t>(PacketType::LogHeader)) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] int connect_calls() const {
        std::lock_guard lock(mutex_);
        return connect_calls_;
    }

    [[nodiscard]] int interrupts() const {
        std::lock_guard lock(mutex_);
        return interrupts_;
    }

    [[nodiscard]] std::optional<std::string> last_address() const {
        std::lock_guard lock(mutex_);
        return last_address_;
    }

    [[nodiscard]] bool is_open() const {
        std::lock_guard lock(mutex_);
        return open_;
    }

private:
    friend class FakeTransport;

    mutable std::mutex mutex_;
    bool accept_ = true;
    bool fail_sends_ = false;
    std::optional<size_t> fail_after_;
    bool open_ = false;
    int connect_calls_ = 0;
    int interrupts_ = 0;
    std::optional<std::string> last_address_;
    std::vector<std::vector<uint8_t>> frames_;
};

class FakeTransport : public ITransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeTransportState> state)
        : state_(std::move(state)) {}

    Result<std::string> connect(const std::string& address, uint16_t port,
                                Milliseconds /*timeout*/) override {
        std::lock_guard lock(state_->mutex_);
        ++state_->connect_calls_;
        state_->last_address_ = address + ":" + std::to_string(port);
        if (!state_->accept_) {
            return connection_error("connection refused");
        }
        state_->open_ = true;
        return std::string{"Fake Console v1.0"};
    }

    Result<void> send_frame(const std::vector<uint8_t>& frame) override {
        std::lock_guard lock(state_->mutex_);
        if (!state_->open_) return connection_error("not open");
        if (state_->fail_sends_ ||
            (state_->fail_after_ && state_->frames_.size() >= *state_->fail_after_)) {
            state_->open_ = false;
            return connection_error("connection reset by peer");
        }
        state_->frames_.push_back(frame);
        return Result<void>{};
    }

    void close() override {
        std::lock_guard lock(state_->mutex_);
        state_->open_ = false;
    }

    void interrupt() override {
        std::lock_guard lock(state_->mutex_);
        ++state_->interrupts_;
    }

    [[nodiscard]] bool is_open() const override {
        std::lock_guard lock(state_->mutex_);
        return state_->open_;
    }

private:
    std::shared_ptr<FakeTransportState> state_;
};

}  // namespace log_courier::test_support
