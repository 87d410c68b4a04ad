/**
 * @file client.hpp
 * @brief The Client facade: sessions, settings and one connection pipeline.
 * @author log_courier contributors
 *
 * A Client owns its sessions, its variable store and, while connected, a
 * Sender with its connection manager. Packets are filtered, built and
 * encoded on the calling thread; only encoded frames cross into the
 * pipeline.
 *
 *   log_courier::Client client("Shop");
 *   client.connect("tcp(host=127.0.0.1,port=4228)");
 *   client.main_session().log_message("started");
 */

#pragma once

#include "client/packet_sink.hpp"
#include "client/session.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/connection_manager.hpp"
#include "network/transport.hpp"
#include "pipeline/sender.hpp"
#include "protocol/packet.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace log_courier {

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

class Client : public PacketSink {
public:
    explicit Client(std::string app_name = "C++ App",
                    std::shared_ptr<ConnectionListener> listener = nullptr,
                    std::shared_ptr<Logger> logger = nullptr);
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // ── Settings ─────────────────────────────
    [[nodiscard]] std::string app_name() const override;
    void set_app_name(std::string name);
    [[nodiscard]] std::string host_name() const override;
    void set_host_name(std::string name);

    [[nodiscard]] bool enabled() const override { return enabled_.load(); }
    /**
     * @brief Enable or disable logging.
     *
     * Disabling disconnects; enabling reconnects with the last options used.
     */
    void set_enabled(bool enabled);

    [[nodiscard]] Level level() const override { return level_.load(); }
    void set_level(Level level) { level_.store(level); }
    [[nodiscard]] Level default_level() const override { return default_level_.load(); }
    void set_default_level(Level level) { default_level_.store(level); }

    // ── Sessions ─────────────────────────────
    [[nodiscard]] Session& main_session() { return *main_session_; }

    /// Registered session @p name, created on first reference.
    [[nodiscard]] std::shared_ptr<Session> session(const std::string& name);

    /// New session; registered only when @p store is set.
    std::shared_ptr<Session> add_session(const std::string& name, bool store = true);

    /// Unregister @p name. The main session cannot be deleted.
    bool delete_session(const std::string& name);

    [[nodiscard]] bool has_session(const std::string& name) const;

    // ── Variables ────────────────────────────
    void set_variable(const std::string& key, const std::string& value) { variables_.set(key, value); }
    void unset_variable(const std::string& key) { variables_.unset(key); }
    [[nodiscard]] std::optional<std::string> variable(const std::string& key) const {
        return variables_.get(key);
    }
    [[nodiscard]] const VariableStore& variables() const noexcept { return variables_; }

    // ── Connection ───────────────────────────
    /// Parse a `tcp(...)` descriptor and connect. Errors are ConfigurationError.
    Result<void> connect(std::string_view descriptor);
    Result<void> connect(const ConnectionOptions& options);

    /// Flush per options, close, and disable the client.
    void disconnect();

    /**
     * @brief Apply a TOML configuration file.
     *
     * A `connections` entry connects when `enabled = true`, is only stored
     * when `enabled` is absent, and disconnects when `enabled = false`.
     */
    Result<void> load_configuration(const std::filesystem::path& path);

    /// Replace how transports are created (tests, custom sockets).
    void set_transport_factory(TransportFactory factory);

    [[nodiscard]] ConnectionState connection_state() const;
    [[nodiscard]] bool connected() const { return connection_state() == ConnectionState::Connected; }
    /// Live pipeline counters; after disconnect, the final counters of the last pipeline.
    [[nodiscard]] SenderStats stats() const;
    [[nodiscard]] std::optional<ConnectionOptions> connection_options() const;

    // ── Raw packets ──────────────────────────
    void send_log_entry(Level level, LogEntry entry);
    void send_watch(Level level, Watch watch);
    void send_process_flow(Level level, ProcessFlow flow);
    void send_stream(Level level, StreamPacket stream);
    void send_control_command(ControlCommand command);

    /// Custom control command carrying `{"action":..,"caption":..}`.
    void dispatch(std::string_view caption, int32_t action);

    /// Filtered, encoded, queued; never blocks and never throws.
    void submit(Packet packet) override;

    /**
     * @brief Non-blocking submit that reports why a packet was not accepted.
     *
     * QueueOverflow for a full throttled queue, Connection when no pipeline
     * exists, Protocol when the packet cannot be encoded.
     */
    Result<void> try_submit(Packet packet);

    [[nodiscard]] Logger& logger() noexcept { return *logger_; }

private:
    [[nodiscard]] bool admitted(Level level) const;
    [[nodiscard]] std::shared_ptr<Sender> sender() const;
    void apply_diagnostics(const DiagnosticsConfig& diagnostics);

    std::atomic<bool> enabled_{false};
    std::atomic<Level> level_{Level::Debug};
    std::atomic<Level> default_level_{Level::Message};

    mutable std::mutex names_mutex_;
    std::string app_name_;
    std::string host_name_;

    std::shared_ptr<ConnectionListener> listener_;
    std::shared_ptr<Logger> logger_;
    bool logger_injected_;

    VariableStore variables_;

    mutable std::mutex sessions_mutex_;
    std::shared_ptr<Session> main_session_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    // Serializes connect/disconnect; sender_ itself is read under sender_mutex_.
    mutable std::mutex lifecycle_mutex_;
    mutable std::mutex sender_mutex_;
    std::shared_ptr<Sender> sender_;
    SenderStats last_stats_;
    std::optional<ConnectionOptions> last_options_;
    TransportFactory transport_factory_;
};

}  // namespace log_courier
