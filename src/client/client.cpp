/**
 * @file client.cpp
 * @brief Client implementation.
 * @author log_courier contributors
 */

#include "client/client.hpp"

#include "protocol/json_map.hpp"
#include "protocol/packet_codec.hpp"
#include "telemetry/json_sink.hpp"

#include <unistd.h>

namespace log_courier {

namespace {

constexpr std::string_view kComponent = "client";

std::string local_host_name() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    return std::string{buf};
}

}  // namespace

Client::Client(std::string app_name,
               std::shared_ptr<ConnectionListener> listener,
               std::shared_ptr<Logger> logger)
    : app_name_(std::move(app_name))
    , host_name_(local_host_name())
    , listener_(listener ? std::move(listener) : std::make_shared<ConnectionListener>())
    , logger_(logger ? logger : Logger::null())
    , logger_injected_(logger != nullptr) {
    main_session_ = std::make_shared<Session>(*this, std::string{kMainSessionName});
    sessions_.emplace(std::string{kMainSessionName}, main_session_);
    transport_factory_ = [] { return std::make_unique<TcpTransport>(); };
}

Client::~Client() {
    disconnect();
}

// ─────────────────────────────────────────────
// Settings
// ─────────────────────────────────────────────

std::string Client::app_name() const {
    std::lock_guard lock(names_mutex_);
    return app_name_;
}

void Client::set_app_name(std::string name) {
    std::lock_guard lock(names_mutex_);
    app_name_ = std::move(name);
}

std::string Client::host_name() const {
    std::lock_guard lock(names_mutex_);
    return host_name_;
}

void Client::set_host_name(std::string name) {
    std::lock_guard lock(names_mutex_);
    host_name_ = std::move(name);
}

void Client::set_enabled(bool enabled) {
    if (enabled == enabled_.load()) return;

    if (!enabled) {
        disconnect();
        return;
    }

    std::optional<ConnectionOptions> options;
    {
        std::lock_guard lock(lifecycle_mutex_);
        options = last_options_;
    }
    if (options && !sender()) {
        if (auto connected = connect(*options); !connected) {
            logger_->warn(kComponent, "reconnect on enable failed: " + connected.error().message);
        }
        return;
    }
    enabled_.store(true);
}

// ─────────────────────────────────────────────
// Sessions
// ─────────────────────────────────────────────

std::shared_ptr<Session> Client::session(const std::string& name) {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end()) {
        it = sessions_.emplace(name, std::make_shared<Session>(*this, name)).first;
    }
    return it->second;
}

std::shared_ptr<Session> Client::add_session(const std::string& name, bool store) {
    auto created = std::make_shared<Session>(*this, name);
    if (store && name != kMainSessionName) {
        std::lock_guard lock(sessions_mutex_);
        sessions_.insert_or_assign(name, created);
    }
    return created;
}

bool Client::delete_session(const std::string& name) {
    if (name == kMainSessionName) return false;
    std::lock_guard lock(sessions_mutex_);
    return sessions_.erase(name) > 0;
}

bool Client::has_session(const std::string& name) const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.count(name) > 0;
}

// ─────────────────────────────────────────────
// Connection lifecycle
// ─────────────────────────────────────────────

Result<void> Client::connect(std::string_view descriptor) {
    auto options = parse_connection_descriptor(descriptor, variables_, logger_.get());
    if (!options) {
        logger_->error(kComponent, options.error());
        return options.error();
    }
    return connect(*options);
}

Result<void> Client::connect(const ConnectionOptions& options) {
    if (auto valid = validate(options); !valid) {
        logger_->error(kComponent, valid.error());
        return valid.error();
    }

    disconnect();

    std::lock_guard lifecycle(lifecycle_mutex_);
    auto transport = transport_factory_();
    if (!transport) {
        return configuration_error("transport factory returned no transport");
    }

    LogHeader header{host_name(), app_name(), options.room};
    auto connection = std::make_unique<ConnectionManager>(
        options, std::move(header), std::move(transport), listener_, logger_);
    auto sender = std::make_shared<Sender>(options, std::move(connection), logger_);

    last_options_ = options;
    {
        std::lock_guard lock(sender_mutex_);
        sender_ = sender;
    }
    enabled_.store(true);
    logger_->info(kComponent, "pipeline started (" +
                              std::string(options.async_enabled ? "async" : "sync") + ")");
    sender->start();
    return Result<void>{};
}

void Client::disconnect() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    enabled_.store(false);

    std::shared_ptr<Sender> sender;
    {
        std::lock_guard lock(sender_mutex_);
        sender.swap(sender_);
    }
    if (!sender) return;
    sender->stop();

    SenderStats final_stats = sender->stats();
    logger_->info(kComponent, "pipeline stopped: " + std::to_string(final_stats.packets_sent) +
                              " sent, " + std::to_string(final_stats.packets_discarded) +
                              " discarded");
    std::lock_guard lock(sender_mutex_);
    last_stats_ = final_stats;
}

std::shared_ptr<Sender> Client::sender() const {
    std::lock_guard lock(sender_mutex_);
    return sender_;
}

void Client::set_transport_factory(TransportFactory factory) {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (factory) transport_factory_ = std::move(factory);
}

ConnectionState Client::connection_state() const {
    auto current = sender();
    return current ? current->state() : ConnectionState::Disconnected;
}

SenderStats Client::stats() const {
    std::shared_ptr<Sender> current;
    {
        std::lock_guard lock(sender_mutex_);
        if (!sender_) return last_stats_;
        current = sender_;
    }
    return current->stats();
}

std::optional<ConnectionOptions> Client::connection_options() const {
    std::lock_guard lock(lifecycle_mutex_);
    return last_options_;
}

// ─────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────

void Client::apply_diagnostics(const DiagnosticsConfig& diagnostics) {
    if (logger_injected_) return;

    auto level = parse_log_level(diagnostics.log_level).value_or(LogLevel::Warn);
    if (diagnostics.log_dir.empty()) {
        logger_->set_level(level);
        return;
    }
    logger_ = std::make_shared<Logger>(
        std::make_unique<RotatingFileSink>(diagnostics.log_dir, "log_courier",
                                       diagnostics.max_file_size_mb, diagnostics.rotate_count),
        level);
}

Result<void> Client::load_configuration(const std::filesystem::path& path) {
    auto loaded = load_config(path);
    if (!loaded) {
        logger_->error(kComponent, loaded.error());
        return loaded.error();
    }
    const ClientConfig& config = *loaded;

    if (!sender()) apply_diagnostics(config.diagnostics);

    if (config.app_name) set_app_name(*config.app_name);
    if (config.level) set_level(*config.level);
    if (config.default_level) set_default_level(*config.default_level);
    for (const auto& [key, value] : config.variables) {
        variables_.set(key, value);
    }

    if (!config.connections) {
        if (config.enabled) set_enabled(*config.enabled);
        return Result<void>{};
    }

    auto options = parse_connection_descriptor(*config.connections, variables_, logger_.get())
                       .map_error([](const Error& e) { return e.with_context("client.connections"); });
    if (!options) {
        logger_->error(kComponent, options.error());
        return options.error();
    }

    if (config.enabled && *config.enabled) {
        return connect(*options);
    }
    if (config.enabled) disconnect();

    std::lock_guard lifecycle(lifecycle_mutex_);
    last_options_ = *options;
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Packet submission
// ─────────────────────────────────────────────

bool Client::admitted(Level level) const {
    FilterState state;
    state.client_enabled = enabled();
    state.client_level = level_.load();
    return is_admitted(state, level);
}

void Client::submit(Packet packet) {
    auto current = sender();
    if (!current) return;

    auto encoded = PacketCodec::encode(packet);
    if (!encoded) {
        logger_->warn(kComponent, "packet dropped: " + encoded.error().message);
        current->report_error(encoded.error());
        return;
    }
    current->submit(std::move(*encoded));
}

Result<void> Client::try_submit(Packet packet) {
    auto current = sender();
    if (!current) return connection_error("client is not connected");

    auto encoded = PacketCodec::encode(packet);
    if (!encoded) return encoded.error();
    return current->try_submit(std::move(*encoded));
}

void Client::send_log_entry(Level level, LogEntry entry) {
    if (!admitted(level)) return;
    submit(Packet{level, std::move(entry)});
}

void Client::send_watch(Level level, Watch watch) {
    if (!admitted(level)) return;
    submit(Packet{level, std::move(watch)});
}

void Client::send_process_flow(Level level, ProcessFlow flow) {
    if (!admitted(level)) return;
    submit(Packet{level, std::move(flow)});
}

void Client::send_stream(Level level, StreamPacket stream) {
    if (!admitted(level)) return;
    submit(Packet{level, std::move(stream)});
}

void Client::send_control_command(ControlCommand command) {
    if (!admitted(Level::Control)) return;
    submit(Packet{Level::Control, std::move(command)});
}

void Client::dispatch(std::string_view caption, int32_t action) {
    const std::string payload = encode_json_map({{"action", std::to_string(action)},
                                                 {"caption", std::string(caption)}});
    ControlCommand command;
    command.command_type = static_cast<ControlCommandType>(action);
    command.data.assign(payload.begin(), payload.end());
    send_control_command(std::move(command));
}

}  // namespace log_courier
