/**
 * @file connection_manager.hpp
 * @brief Connection state machine with time-gated reconnect.
 * @author log_courier contributors
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/host_resolver.hpp"
#include "network/transport.hpp"
#include "protocol/packet.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace log_courier {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

/**
 * @brief Lifecycle notifications. Every method defaults to a no-op.
 *
 * A Sender fires these from its own context with no pipeline lock held, so
 * a listener may log through the same client. In synchronous mode that
 * context is the end of the producer's call, after its packet was routed.
 */
class ConnectionListener {
public:
    virtual ~ConnectionListener() = default;

    virtual void on_connect(bool /*reconnect*/) {}
    virtual void on_disconnect() {}
    virtual void on_error(const Error& /*error*/) {}
};

using SteadyClock = std::function<SteadyTime()>;
using StateObserver = std::function<void(ConnectionState)>;

/**
 * @brief Owns the transport and drives Disconnected → Connecting → Connected.
 *
 * A connection attempt is permitted only when at least the reconnect
 * interval has elapsed since the start of the previous attempt. The state
 * observer runs after the internal lock is released.
 */
class ConnectionManager {
public:
    ConnectionManager(ConnectionOptions options,
                      LogHeader header,
                      std::unique_ptr<ITransport> transport,
                      std::shared_ptr<ConnectionListener> listener,
                      std::shared_ptr<Logger> logger,
                      SteadyClock clock = {},
                      HostResolver resolver = HostResolver{});

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Attempt to connect if not connected and the time gate allows it.
    Result<void> connect();

    /// Whether connect() would start an attempt right now.
    [[nodiscard]] bool attempt_permitted() const;

    /**
     * @brief Write one frame. A failure closes the transport, moves to
     * Disconnected and notifies the listener before the error is returned.
     */
    Result<void> send(const std::vector<uint8_t>& frame);

    /// Close the transport and move to Disconnected.
    void disconnect();

    /// Terminal close: disconnect and never attempt again.
    void shutdown();

    /// Abort blocked transport I/O; safe from any thread.
    void interrupt();

    void set_state_observer(StateObserver observer);

    /// Swap the listener; call before the first connect(). Returns the previous one.
    std::shared_ptr<ConnectionListener> exchange_listener(std::shared_ptr<ConnectionListener> listener);

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] bool connected() const { return state() == ConnectionState::Connected; }
    [[nodiscard]] bool is_shut_down() const;
    [[nodiscard]] uint64_t attempts() const;
    [[nodiscard]] uint64_t reconnects() const;
    [[nodiscard]] const ConnectionOptions& options() const noexcept { return options_; }

private:
    void transition(ConnectionState next);
    void close_transport(bool notify);

    const ConnectionOptions options_;
    const LogHeader header_;
    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<ConnectionListener> listener_;
    std::shared_ptr<Logger> logger_;
    SteadyClock clock_;
    HostResolver resolver_;
    StateObserver observer_;

    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    std::optional<SteadyTime> last_attempt_;
    uint64_t attempts_{0};
    uint64_t successes_{0};
    bool shut_down_{false};
};

}  // namespace log_courier
