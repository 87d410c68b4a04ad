/**
 * @file config.hpp
 * @brief Client configuration: TOML file, connection descriptor, variables.
 * @author log_courier contributors
 *
 * Two sources feed a Client. The TOML file carries application-level
 * settings (name, levels, the connection descriptor itself); the descriptor
 * string `tcp(key=value,...)` carries everything about the transport
 * pipeline. Placeholders in the descriptor are resolved from the client's
 * VariableStore before parsing.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "core/result.hpp"
#include "core/types.hpp"

namespace log_courier {

class Logger;

// ─────────────────────────────────────────────
// Connection options
// ─────────────────────────────────────────────

inline constexpr uint16_t kDefaultPort = 4228;

/// Largest accepted queue size (1 GiB); the backlog arena is allocated up front.
inline constexpr uint64_t kMaxQueueKb = 1024 * 1024;

/// Largest accepted timeout or reconnect interval (about 24 days).
inline constexpr Milliseconds kMaxTimespan{std::numeric_limits<int32_t>::max()};

struct ConnectionOptions {
    std::string host;                         ///< empty = auto (loopback or WSL gateway)
    uint16_t port = kDefaultPort;
    Milliseconds timeout{30000};
    std::string room = "default";

    bool reconnect = true;
    Milliseconds reconnect_interval{3000};

    bool backlog_enabled = true;
    uint64_t backlog_queue_kb = 2048;
    Level backlog_flush_on = Level::Error;
    bool backlog_keep_open = true;

    bool async_enabled = true;
    uint64_t async_queue_kb = 2048;
    bool async_throttle = false;
    bool async_clear_on_disconnect = false;

    bool flush_on_shutdown = true;

    [[nodiscard]] uint64_t backlog_bytes() const noexcept { return backlog_queue_kb * 1024; }
    [[nodiscard]] uint64_t async_queue_bytes() const noexcept { return async_queue_kb * 1024; }

    bool operator==(const ConnectionOptions&) const = default;
};

/// Range checks shared by the descriptor parser and Client::connect().
[[nodiscard]] Result<void> validate(const ConnectionOptions& options);

// ─────────────────────────────────────────────
// Variable store
// ─────────────────────────────────────────────

/**
 * @brief Key/value store for descriptor placeholders. Owned by a Client.
 */
class VariableStore {
public:
    void set(const std::string& key, const std::string& value);
    void unset(const std::string& key);
    void clear();

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Replace every `${key}` and `%key%` in @p text.
     *
     * An unterminated or unknown placeholder is a ConfigurationError.
     */
    [[nodiscard]] Result<std::string> expand(std::string_view text) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// ─────────────────────────────────────────────
// Descriptor parsing
// ─────────────────────────────────────────────

/**
 * @brief Parse `tcp(key=value,...)` into ConnectionOptions.
 *
 * Keys are case-insensitive. Unknown keys are reported through @p log as a
 * warning and otherwise ignored.
 */
[[nodiscard]] Result<ConnectionOptions> parse_connection_descriptor(
    std::string_view descriptor,
    const VariableStore& variables,
    Logger* log = nullptr);

/// `true/yes/on/1` or `false/no/off/0`, case-insensitive.
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text);

/// Plain number = milliseconds; `ms` and `s` suffixes accepted. Capped at kMaxTimespan.
[[nodiscard]] std::optional<Milliseconds> parse_timespan(std::string_view text);

/// Plain number = kilobytes; `kb`, `mb` and `gb` suffixes accepted. Capped at kMaxQueueKb.
[[nodiscard]] std::optional<uint64_t> parse_size_kb(std::string_view text);

// ─────────────────────────────────────────────
// Configuration file
// ─────────────────────────────────────────────

struct DiagnosticsConfig {
    std::string log_level = "warn";
    std::filesystem::path log_dir;            ///< empty = no file output
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 3;
};

/**
 * @brief Contents of a client configuration file.
 *
 * Fields that are absent from the file stay unset so that loading a file
 * only overrides what it names.
 */
struct ClientConfig {
    std::optional<std::string> app_name;
    std::optional<bool> enabled;
    std::optional<Level> level;
    std::optional<Level> default_level;
    std::optional<std::string> connections;
    std::map<std::string, std::string> variables;
    DiagnosticsConfig diagnostics;
};

/**
 * @brief Load a client configuration from a TOML file.
 */
Result<ClientConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Parse a client configuration from TOML text.
 */
Result<ClientConfig> parse_config(std::string_view toml_text);

}  // namespace log_courier
