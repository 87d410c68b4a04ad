/**
 * @file config.cpp
 * @brief Configuration loading (toml++) and connection descriptor parsing.
 * @author log_courier contributors
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <vector>

#include <toml++/toml.hpp>

namespace log_courier {

namespace {

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

/// Non-negative decimal number, optionally fractional.
std::optional<double> parse_number(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;

    double value = 0.0;
    double scale = 0.0;
    bool seen_digit = false;
    for (char c : text) {
        if (c == '.' && scale == 0.0) {
            scale = 1.0;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        seen_digit = true;
        if (scale == 0.0) {
            value = value * 10.0 + (c - '0');
        } else {
            scale /= 10.0;
            value += (c - '0') * scale;
        }
    }
    if (!seen_digit) return std::nullopt;
    return value;
}

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

Error invalid_value(std::string_view key, std::string_view value) {
    return configuration_error("invalid value for '" + std::string{key} + "': '" +
                               std::string{value} + "'");
}

}  // namespace

// ─────────────────────────────────────────────
// Value parsers
// ─────────────────────────────────────────────

std::optional<bool> parse_bool(std::string_view text) {
    auto lowered = to_lower(trim(text));
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") return false;
    return std::nullopt;
}

std::optional<Milliseconds> parse_timespan(std::string_view text) {
    auto lowered = to_lower(trim(text));
    std::string_view view{lowered};

    double factor = 1.0;
    if (ends_with(view, "ms")) {
        view.remove_suffix(2);
    } else if (ends_with(view, "s")) {
        view.remove_suffix(1);
        factor = 1000.0;
    }

    auto number = parse_number(view);
    if (!number) return std::nullopt;
    const double ms = std::round(*number * factor);
    if (ms > static_cast<double>(kMaxTimespan.count())) return std::nullopt;
    return Milliseconds{static_cast<int64_t>(ms)};
}

std::optional<uint64_t> parse_size_kb(std::string_view text) {
    auto lowered = to_lower(trim(text));
    std::string_view view{lowered};

    double factor = 1.0;
    if (ends_with(view, "kb")) {
        view.remove_suffix(2);
    } else if (ends_with(view, "mb")) {
        view.remove_suffix(2);
        factor = 1024.0;
    } else if (ends_with(view, "gb")) {
        view.remove_suffix(2);
        factor = 1024.0 * 1024.0;
    }

    auto number = parse_number(view);
    if (!number) return std::nullopt;
    const double kb = *number * factor;
    if (kb > static_cast<double>(kMaxQueueKb)) return std::nullopt;
    return static_cast<uint64_t>(kb);
}

Result<void> validate(const ConnectionOptions& options) {
    if (options.backlog_queue_kb > kMaxQueueKb) {
        return configuration_error("backlog.queue exceeds " + std::to_string(kMaxQueueKb) + " KB");
    }
    if (options.async_queue_kb > kMaxQueueKb) {
        return configuration_error("async.queue exceeds " + std::to_string(kMaxQueueKb) + " KB");
    }
    if (options.async_enabled && options.async_queue_kb == 0) {
        return configuration_error("async.queue must be greater than zero");
    }
    for (auto span : {options.timeout, options.reconnect_interval}) {
        if (span < Milliseconds::zero() || span > kMaxTimespan) {
            return configuration_error("timespan out of range: " + std::to_string(span.count()) + " ms");
        }
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// VariableStore
// ─────────────────────────────────────────────

void VariableStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    values_[key] = value;
}

void VariableStore::unset(const std::string& key) {
    std::lock_guard lock(mutex_);
    values_.erase(key);
}

void VariableStore::clear() {
    std::lock_guard lock(mutex_);
    values_.clear();
}

std::optional<std::string> VariableStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool VariableStore::contains(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return values_.contains(key);
}

size_t VariableStore::size() const {
    std::lock_guard lock(mutex_);
    return values_.size();
}

Result<std::string> VariableStore::expand(std::string_view text) const {
    std::lock_guard lock(mutex_);
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const bool brace = text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{';
        const bool percent = text[i] == '%';
        if (!brace && !percent) {
            out.push_back(text[i++]);
            continue;
        }

        const size_t key_start = brace ? i + 2 : i + 1;
        const size_t close = text.find(brace ? '}' : '%', key_start);
        if (close == std::string_view::npos) {
            return configuration_error("unterminated placeholder at offset " + std::to_string(i));
        }

        std::string key{text.substr(key_start, close - key_start)};
        auto it = values_.find(key);
        if (key.empty() || it == values_.end()) {
            return configuration_error("unknown variable '" + key + "'");
        }
        out += it->second;
        i = close + 1;
    }
    return out;
}

// ─────────────────────────────────────────────
// Descriptor
// ─────────────────────────────────────────────

Result<ConnectionOptions> parse_connection_descriptor(std::string_view descriptor,
                                                      const VariableStore& variables,
                                                      Logger* log) {
    auto expanded = variables.expand(descriptor);
    if (!expanded) return expanded.error();

    std::string_view text = trim(*expanded);
    if (text.size() < 5 || to_lower(text.substr(0, 4)) != "tcp(" || text.back() != ')') {
        return configuration_error("descriptor must have the form tcp(key=value,...): '" +
                                   std::string{text} + "'");
    }
    std::string_view body = text.substr(4, text.size() - 5);

    ConnectionOptions opts;
    for (auto pair : split(body, ',')) {
        pair = trim(pair);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            return configuration_error("expected key=value, got '" + std::string{pair} + "'");
        }
        const std::string key = to_lower(trim(pair.substr(0, eq)));
        const std::string_view value = trim(pair.substr(eq + 1));

        auto want_bool = [&](bool& field) -> std::optional<Error> {
            auto parsed = parse_bool(value);
            if (!parsed) return invalid_value(key, value);
            field = *parsed;
            return std::nullopt;
        };
        auto want_kb = [&](uint64_t& field) -> std::optional<Error> {
            auto parsed = parse_size_kb(value);
            if (!parsed) return invalid_value(key, value);
            field = *parsed;
            return std::nullopt;
        };
        auto want_level = [&](Level& field) -> std::optional<Error> {
            auto parsed = parse_level(value);
            if (!parsed) return invalid_value(key, value);
            field = *parsed;
            return std::nullopt;
        };
        auto want_timespan = [&](Milliseconds& field) -> std::optional<Error> {
            auto parsed = parse_timespan(value);
            if (!parsed) return invalid_value(key, value);
            field = *parsed;
            return std::nullopt;
        };

        std::optional<Error> failure;
        if (key == "host") {
            opts.host = std::string{value};
        } else if (key == "port") {
            int port = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
            if (ec != std::errc{} || ptr != value.data() + value.size() || port <= 0 || port > 65535) {
                failure = invalid_value(key, value);
            } else {
                opts.port = static_cast<uint16_t>(port);
            }
        } else if (key == "timeout") {
            failure = want_timespan(opts.timeout);
        } else if (key == "room") {
            opts.room = std::string{value};
        } else if (key == "reconnect") {
            failure = want_bool(opts.reconnect);
        } else if (key == "reconnect.interval") {
            failure = want_timespan(opts.reconnect_interval);
        } else if (key == "backlog") {
            uint64_t size = 0;
            failure = want_kb(size);
            if (!failure) {
                opts.backlog_enabled = size > 0;
                if (size > 0) opts.backlog_queue_kb = size;
            }
        } else if (key == "backlog.enabled") {
            failure = want_bool(opts.backlog_enabled);
        } else if (key == "backlog.queue") {
            failure = want_kb(opts.backlog_queue_kb);
        } else if (key == "backlog.flushon" || key == "flushon") {
            failure = want_level(opts.backlog_flush_on);
        } else if (key == "backlog.keepopen" || key == "keepopen") {
            failure = want_bool(opts.backlog_keep_open);
        } else if (key == "async.enabled") {
            failure = want_bool(opts.async_enabled);
        } else if (key == "async.queue") {
            failure = want_kb(opts.async_queue_kb);
        } else if (key == "async.throttle") {
            failure = want_bool(opts.async_throttle);
        } else if (key == "async.clearondisconnect") {
            failure = want_bool(opts.async_clear_on_disconnect);
        } else if (key == "flushonshutdown") {
            failure = want_bool(opts.flush_on_shutdown);
        } else if (log) {
            log->warn("config", "ignoring unknown descriptor key '" + key + "'");
        }

        if (failure) return *failure;
    }

    if (auto valid = validate(opts); !valid) return valid.error();
    return opts;
}

// ─────────────────────────────────────────────
// TOML
// ─────────────────────────────────────────────

namespace {

/// Levels may be written as a name or as their numeric value.
Result<std::optional<Level>> read_level(const toml::node_view<const toml::node>& node,
                                        std::string_view key) {
    if (!node) return std::optional<Level>{};
    if (auto text = node.value<std::string>()) {
        if (auto level = parse_level(*text)) return std::optional<Level>{*level};
        return configuration_error("invalid level for '" + std::string{key} + "': " + *text);
    }
    if (auto number = node.value<int64_t>()) {
        if (*number >= 0 && *number <= 6) {
            return std::optional<Level>{static_cast<Level>(*number)};
        }
    }
    return configuration_error("invalid level for '" + std::string{key} + "'");
}

Result<ClientConfig> build_config(const toml::table& tbl) {
    ClientConfig config;

    // [client]
    if (auto client = tbl["client"]; client.is_table()) {
        if (auto name = client["app_name"].value<std::string>()) config.app_name = *name;
        if (auto enabled = client["enabled"].value<bool>()) config.enabled = *enabled;
        if (auto conns = client["connections"].value<std::string>()) config.connections = *conns;

        auto level = read_level(client["level"], "client.level");
        if (!level) return level.error();
        config.level = *level;

        auto default_level = read_level(client["default_level"], "client.default_level");
        if (!default_level) return default_level.error();
        config.default_level = *default_level;
    }

    // [variables]
    if (const auto* vars = tbl["variables"].as_table()) {
        for (const auto& [key, node] : *vars) {
            if (auto text = node.value<std::string>()) {
                config.variables[std::string{key.str()}] = *text;
            } else if (auto number = node.value<int64_t>()) {
                config.variables[std::string{key.str()}] = std::to_string(*number);
            } else if (auto flag = node.value<bool>()) {
                config.variables[std::string{key.str()}] = *flag ? "true" : "false";
            } else {
                return configuration_error("unsupported value type for variable '" +
                                           std::string{key.str()} + "'");
            }
        }
    }

    // [diagnostics]
    if (auto diag = tbl["diagnostics"]; diag.is_table()) {
        config.diagnostics.log_level = diag["log_level"].value_or(std::string{"warn"});
        config.diagnostics.log_dir = diag["log_dir"].value_or(std::string{});
        config.diagnostics.max_file_size_mb = static_cast<uint32_t>(
            diag["max_file_size_mb"].value_or(int64_t{10}));
        config.diagnostics.rotate_count = static_cast<uint32_t>(
            diag["rotate_count"].value_or(int64_t{3}));
        if (!parse_log_level(config.diagnostics.log_level)) {
            return configuration_error("invalid diagnostics.log_level: " +
                                       config.diagnostics.log_level);
        }
    }

    return config;
}

}  // namespace

Result<ClientConfig> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return configuration_error("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return configuration_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<ClientConfig> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return configuration_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

}  // namespace log_courier
