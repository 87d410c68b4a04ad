/**
 * @file connection_manager.cpp
 * @brief ConnectionManager implementation.
 * @author log_courier contributors
 */

#include "network/connection_manager.hpp"

#include "protocol/packet_codec.hpp"

#include <utility>

namespace log_courier {

namespace {
constexpr std::string_view kComponent = "connection";
}  // namespace

ConnectionManager::ConnectionManager(ConnectionOptions options,
                                     LogHeader header,
                                     std::unique_ptr<ITransport> transport,
                                     std::shared_ptr<ConnectionListener> listener,
                                     std::shared_ptr<Logger> logger,
                                     SteadyClock clock,
                                     HostResolver resolver)
    : options_(std::move(options))
    , header_(std::move(header))
    , transport_(std::move(transport))
    , listener_(listener ? std::move(listener) : std::make_shared<ConnectionListener>())
    , logger_(std::move(logger))
    , clock_(clock ? std::move(clock) : SteadyClock{[] { return std::chrono::steady_clock::now(); }})
    , resolver_(std::move(resolver)) {}

// ─────────────────────────────────────────────
// State
// ─────────────────────────────────────────────

void ConnectionManager::set_state_observer(StateObserver observer) {
    std::lock_guard lock(mutex_);
    observer_ = std::move(observer);
}

std::shared_ptr<ConnectionListener> ConnectionManager::exchange_listener(
    std::shared_ptr<ConnectionListener> listener) {
    std::lock_guard lock(mutex_);
    std::swap(listener_, listener);
    return listener;
}

void ConnectionManager::transition(ConnectionState next) {
    StateObserver observer;
    {
        std::lock_guard lock(mutex_);
        if (state_ == next) return;
        state_ = next;
        observer = observer_;
    }
    if (observer) observer(next);
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool ConnectionManager::is_shut_down() const {
    std::lock_guard lock(mutex_);
    return shut_down_;
}

uint64_t ConnectionManager::attempts() const {
    std::lock_guard lock(mutex_);
    return attempts_;
}

uint64_t ConnectionManager::reconnects() const {
    std::lock_guard lock(mutex_);
    return successes_ > 0 ? successes_ - 1 : 0;
}

bool ConnectionManager::attempt_permitted() const {
    const SteadyTime now = clock_();
    std::lock_guard lock(mutex_);
    if (shut_down_ || state_ != ConnectionState::Disconnected) return false;
    if (!last_attempt_) return true;
    if (!options_.reconnect) return false;
    return now - *last_attempt_ >= options_.reconnect_interval;
}

// ─────────────────────────────────────────────
// Connect
// ─────────────────────────────────────────────

Result<void> ConnectionManager::connect() {
    if (connected()) return Result<void>{};
    if (!attempt_permitted()) {
        return connection_error(is_shut_down() ? "connection is shut down"
                                               : "reconnect interval has not elapsed");
    }

    {
        std::lock_guard lock(mutex_);
        last_attempt_ = clock_();
        ++attempts_;
    }
    transition(ConnectionState::Connecting);

    auto fail = [this](Error error) -> Result<void> {
        transport_->close();
        transition(ConnectionState::Disconnected);
        if (logger_) logger_->warn(kComponent, error.message);
        listener_->on_error(error);
        return error;
    };

    auto address = resolver_.resolve(options_.host);
    if (!address) return fail(address.error());

    auto banner = transport_->connect(*address, options_.port, options_.timeout);
    if (!banner) return fail(banner.error());

    auto header = PacketCodec::encode(Packet{Level::Control, header_});
    if (!header) return fail(header.error());
    if (auto sent = transport_->send_frame(header->frame); !sent) {
        return fail(sent.error());
    }

    bool reconnect = false;
    {
        std::lock_guard lock(mutex_);
        reconnect = successes_ > 0;
        ++successes_;
    }
    transition(ConnectionState::Connected);

    if (logger_) {
        logger_->info(kComponent, "connected to " + *address + ":" + std::to_string(options_.port) +
                                  " (" + *banner + ")");
    }
    listener_->on_connect(reconnect);
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Send / Close
// ─────────────────────────────────────────────

Result<void> ConnectionManager::send(const std::vector<uint8_t>& frame) {
    if (!connected()) {
        return connection_error("not connected");
    }

    auto sent = transport_->send_frame(frame);
    if (!sent) {
        close_transport(true);
        if (logger_) logger_->warn(kComponent, "connection lost: " + sent.error().message);
        listener_->on_error(sent.error());
    }
    return sent;
}

void ConnectionManager::close_transport(bool notify) {
    transport_->close();
    transition(ConnectionState::Disconnected);
    if (notify) listener_->on_disconnect();
}

void ConnectionManager::disconnect() {
    const bool was_connected = connected();
    close_transport(was_connected);
    if (was_connected && logger_) logger_->info(kComponent, "disconnected");
}

void ConnectionManager::shutdown() {
    {
        std::lock_guard lock(mutex_);
        shut_down_ = true;
    }
    disconnect();
}

void ConnectionManager::interrupt() {
    transport_->interrupt();
}

}  // namespace log_courier
