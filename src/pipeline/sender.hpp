/**
 * @file sender.hpp
 * @brief The background worker that moves packets to the console.
 * @author log_courier contributors
 *
 * A Sender owns one connection pipeline: the dispatch queue (async mode),
 * the backlog buffer (when enabled) and the connection manager. Producers
 * hand it encoded packets; a single std::jthread drains the queue, routes
 * packets to the transport or the backlog, and drives reconnects. In
 * synchronous mode the producer runs the same routing step under a mutex.
 *
 * Listener callbacks are queued while send_mutex_ is held and fired only
 * after it is released, so a listener may log through the same client.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "network/connection_manager.hpp"
#include "pipeline/backlog_buffer.hpp"
#include "pipeline/dispatch_queue.hpp"
#include "protocol/packet.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace log_courier {

/// A deferred ConnectionListener call.
using ListenerEvent = std::function<void(ConnectionListener&)>;

struct SenderStats {
    QueueStats queue;
    BacklogStats backlog;
    uint64_t packets_sent = 0;
    uint64_t packets_discarded = 0;   ///< lost while disconnected with no backlog
    uint64_t reconnects = 0;
    ConnectionState state = ConnectionState::Disconnected;
};

class Sender {
public:
    static constexpr std::chrono::milliseconds kPopWait{100};

    Sender(const ConnectionOptions& options,
           std::unique_ptr<ConnectionManager> connection,
           std::shared_ptr<Logger> logger);
    ~Sender();

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    /// Start the worker (async mode) or make the first connection attempt (sync mode).
    void start();

    /**
     * @brief Flush (unless disabled), close the connection and stop the worker.
     *
     * Idempotent. Afterwards submit() drops packets.
     */
    void stop();

    /**
     * @brief Hand over a packet; blocks only on a full throttled queue.
     *
     * Failures are reported through the listener's on_error, never returned.
     */
    void submit(EncodedPacket packet);

    /// Non-blocking variant; a full throttled queue is QueueOverflow.
    Result<void> try_submit(EncodedPacket packet);

    /// Queue an error for delivery on the sender's context.
    void report_error(Error error);

    /// Queue any listener call; fired once no pipeline lock is held.
    void post_event(ListenerEvent event);

    [[nodiscard]] SenderStats stats() const;
    [[nodiscard]] ConnectionState state() const { return connection_->state(); }
    [[nodiscard]] bool async() const noexcept { return queue_ != nullptr; }

private:
    void run(std::stop_token stop);

    /// Synchronous routing step for one packet (the caller holds no locks).
    void deliver(EncodedPacket packet);

    // Everything below requires send_mutex_.
    void route_locked(EncodedPacket packet);
    void maintain_connection_locked();
    bool drain_backlog_locked();
    void to_backlog_locked(const EncodedPacket& packet);
    void final_flush_locked();

    /// Fire queued listener events. Must be called without send_mutex_.
    void dispatch_events();
    [[nodiscard]] bool dispatching_here() const;

    void on_state_change(ConnectionState state);

    const bool keep_open_;
    const bool flush_on_shutdown_;
    const bool clear_on_disconnect_;

    std::unique_ptr<DispatchQueue> queue_;      ///< null in synchronous mode
    std::unique_ptr<BacklogBuffer> backlog_;    ///< null when the backlog is disabled
    std::unique_ptr<ConnectionManager> connection_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<ConnectionListener> listener_;   ///< the caller's listener

    std::mutex send_mutex_;
    std::mutex events_mutex_;
    std::vector<ListenerEvent> pending_events_;

    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> discarded_{0};
    std::atomic<uint64_t> overflow_dropped_{0};   ///< not yet reported to the listener
    std::atomic<bool> stopped_{false};

    std::jthread worker_;
};

}  // namespace log_courier
