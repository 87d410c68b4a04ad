/**
 * @file sender.cpp
 * @brief Sender implementation.
 * @author log_courier contributors
 */

#include "pipeline/sender.hpp"

#include <utility>

namespace log_courier {

namespace {

constexpr std::string_view kComponent = "sender";

/// The Sender whose listener events this thread is firing, if any.
thread_local const Sender* t_dispatching = nullptr;

/// Installed in the ConnectionManager in place of the caller's listener.
class DeferringListener final : public ConnectionListener {
public:
    explicit DeferringListener(Sender& sender) : sender_(sender) {}

    void on_connect(bool reconnect) override {
        sender_.post_event([reconnect](ConnectionListener& l) { l.on_connect(reconnect); });
    }
    void on_disconnect() override {
        sender_.post_event([](ConnectionListener& l) { l.on_disconnect(); });
    }
    void on_error(const Error& error) override {
        sender_.post_event([error](ConnectionListener& l) { l.on_error(error); });
    }

private:
    Sender& sender_;
};

class DispatchScope {
public:
    explicit DispatchScope(const Sender* sender) : previous_(t_dispatching) { t_dispatching = sender; }
    ~DispatchScope() { t_dispatching = previous_; }
    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    const Sender* previous_;
};

}  // namespace

Sender::Sender(const ConnectionOptions& options,
               std::unique_ptr<ConnectionManager> connection,
               std::shared_ptr<Logger> logger)
    : keep_open_(options.backlog_keep_open || !options.backlog_enabled)
    , flush_on_shutdown_(options.flush_on_shutdown)
    , clear_on_disconnect_(options.async_enabled && options.async_clear_on_disconnect)
    , connection_(std::move(connection))
    , logger_(std::move(logger)) {
    if (options.async_enabled) {
        queue_ = std::make_unique<DispatchQueue>(
            options.async_queue_bytes(),
            options.async_throttle ? OverflowPolicy::Throttle : OverflowPolicy::Drop);
    }
    if (options.backlog_enabled && options.backlog_bytes() > 0) {
        backlog_ = std::make_unique<BacklogBuffer>(options.backlog_bytes(), options.backlog_flush_on);
    }
    listener_ = connection_->exchange_listener(std::make_shared<DeferringListener>(*this));
    connection_->set_state_observer([this](ConnectionState state) { on_state_change(state); });
}

Sender::~Sender() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void Sender::start() {
    if (queue_) {
        worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
        return;
    }
    {
        std::lock_guard lock(send_mutex_);
        maintain_connection_locked();
    }
    dispatch_events();
}

void Sender::stop() {
    if (stopped_.exchange(true)) return;

    if (worker_.joinable()) {
        worker_.request_stop();
        if (queue_) queue_->close();
        if (!flush_on_shutdown_) connection_->interrupt();
        worker_.join();
    } else if (queue_) {
        queue_->close();
    }

    {
        std::lock_guard lock(send_mutex_);
        if (flush_on_shutdown_) final_flush_locked();
        connection_->shutdown();
    }
    dispatch_events();

    if (logger_) {
        logger_->info(kComponent, "stopped after " + std::to_string(sent_.load()) + " packets sent");
    }
}

void Sender::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::lock_guard lock(send_mutex_);
            maintain_connection_locked();
        }
        dispatch_events();

        auto packet = queue_->pop(stop, kPopWait);
        if (!packet) continue;

        {
            std::lock_guard lock(send_mutex_);
            route_locked(std::move(*packet));
        }
        dispatch_events();
    }
}

// ─────────────────────────────────────────────
// Producer side
// ─────────────────────────────────────────────

void Sender::submit(EncodedPacket packet) {
    if (stopped_.load()) {
        ++discarded_;
        return;
    }
    // A listener logging from a callback is routed directly: on the worker,
    // a throttled push would wait on the only consumer.
    if (!queue_ || dispatching_here()) {
        deliver(std::move(packet));
        return;
    }
    if (auto pushed = queue_->push(std::move(packet)); !pushed) {
        report_error(pushed.error());
    }
}

Result<void> Sender::try_submit(EncodedPacket packet) {
    if (stopped_.load()) {
        ++discarded_;
        return queue_overflow_error("sender stopped");
    }
    if (!queue_ || dispatching_here()) {
        deliver(std::move(packet));
        return Result<void>{};
    }
    return queue_->try_push(std::move(packet));
}

void Sender::report_error(Error error) {
    post_event([error = std::move(error)](ConnectionListener& l) { l.on_error(error); });
}

void Sender::post_event(ListenerEvent event) {
    std::lock_guard lock(events_mutex_);
    pending_events_.push_back(std::move(event));
}

void Sender::deliver(EncodedPacket packet) {
    {
        std::lock_guard lock(send_mutex_);
        maintain_connection_locked();
        route_locked(std::move(packet));
        // A flush-on packet may have just landed in the backlog.
        maintain_connection_locked();
    }
    dispatch_events();
}

bool Sender::dispatching_here() const {
    return t_dispatching == this;
}

void Sender::dispatch_events() {
    // Events raised by a listener's own logging wait for the next round.
    if (dispatching_here()) return;

    if (const uint64_t dropped = overflow_dropped_.exchange(0); dropped > 0) {
        report_error(queue_overflow_error("backlog overflow: " + std::to_string(dropped) +
                                          " packets dropped"));
    }

    std::vector<ListenerEvent> events;
    {
        std::lock_guard lock(events_mutex_);
        events.swap(pending_events_);
    }
    if (events.empty()) return;

    DispatchScope scope(this);
    for (const auto& event : events) {
        event(*listener_);
    }
}

// ─────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────

void Sender::maintain_connection_locked() {
    if (connection_->connected()) return;
    if (!keep_open_ && !(backlog_ && backlog_->flush_requested())) return;
    if (!connection_->attempt_permitted()) return;

    if (!connection_->connect()) return;
    drain_backlog_locked();

    if (!keep_open_ && connection_->connected()) {
        // Burst mode: the backlog went out in one go; close until the next flush.
        connection_->disconnect();
    }
}

void Sender::route_locked(EncodedPacket packet) {
    if (connection_->connected() && drain_backlog_locked()) {
        if (connection_->send(packet.frame)) {
            ++sent_;
            return;
        }
    }
    to_backlog_locked(packet);
}

bool Sender::drain_backlog_locked() {
    if (!backlog_) return true;
    while (auto record = backlog_->peek()) {
        if (!connection_->send(record->frame)) return false;
        backlog_->commit_pop();
        ++sent_;
    }
    return true;
}

void Sender::to_backlog_locked(const EncodedPacket& packet) {
    if (!backlog_) {
        ++discarded_;
        return;
    }

    auto appended = backlog_->append(packet);
    if (!appended) {
        report_error(appended.error());
        return;
    }
    if (*appended > 0) {
        // One QueueOverflow per dispatch round, however many appends overflowed.
        overflow_dropped_ += *appended;
        if (logger_) {
            logger_->warn(kComponent, "backlog full, evicted " + std::to_string(*appended) +
                                      " oldest packets");
        }
    }
}

void Sender::final_flush_locked() {
    if (!connection_->connected() && connection_->attempt_permitted()) {
        (void)connection_->connect();
    }
    if (!connection_->connected()) {
        if (logger_) logger_->warn(kComponent, "shutdown flush skipped: not connected");
        return;
    }
    if (!drain_backlog_locked()) return;

    if (queue_) {
        while (auto packet = queue_->try_pop()) {
            if (!connection_->send(packet->frame)) {
                ++discarded_;
                break;
            }
            ++sent_;
        }
    }
}

void Sender::on_state_change(ConnectionState state) {
    if (state == ConnectionState::Disconnected && clear_on_disconnect_ && queue_) {
        const size_t removed = queue_->clear();
        if (removed > 0 && logger_) {
            logger_->info(kComponent, "cleared " + std::to_string(removed) +
                                      " queued packets on disconnect");
        }
    }
}

SenderStats Sender::stats() const {
    SenderStats out;
    if (queue_) out.queue = queue_->stats();
    if (backlog_) out.backlog = backlog_->stats();
    out.packets_sent = sent_.load();
    out.packets_discarded = discarded_.load();
    out.reconnects = connection_->reconnects();
    out.state = connection_->state();
    return out;
}

}  // namespace log_courier
