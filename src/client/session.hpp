/**
 * @file session.hpp
 * @brief Named logging channel: the caller-facing logging API.
 * @author log_courier contributors
 *
 * Every operation checks admission first and builds its payload only for
 * admitted calls. Operations without an explicit level use the owner's
 * default level. Counters, checkpoints and timers are per session and
 * guarded by the session mutex.
 */

#pragma once

#include "client/message_builder.hpp"
#include "client/packet_sink.hpp"
#include "core/types.hpp"
#include "pipeline/level_filter.hpp"
#include "protocol/packet.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace log_courier {

inline constexpr std::string_view kMainSessionName = "Main";
inline constexpr std::string_view kMainThreadName = "Main Thread";

class Session;

/**
 * @brief A watch value with its console type.
 */
struct WatchValue {
    std::string text;
    WatchType type = WatchType::String;
};

[[nodiscard]] std::string format_double(double value);

template <typename T>
[[nodiscard]] WatchValue make_watch_value(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return {value ? "true" : "false", WatchType::Boolean};
    } else if constexpr (std::is_integral_v<T>) {
        return {std::to_string(value), WatchType::Integer};
    } else if constexpr (std::is_floating_point_v<T>) {
        return {format_double(static_cast<double>(value)), WatchType::Float};
    } else {
        return {std::string(std::string_view(value)), WatchType::String};
    }
}

// ─────────────────────────────────────────────
// MetricBuilder
// ─────────────────────────────────────────────

/**
 * @brief Fluent construction of a labeled watch.
 *
 *   session.metric("http_requests").with_label("route", "/api").set(42);
 */
class MetricBuilder {
public:
    MetricBuilder(Session& session, std::string name);

    MetricBuilder& with_label(std::string key, std::string value);
    MetricBuilder& for_instance(std::string instance);
    MetricBuilder& with_level(Level level);

    template <typename T>
    void set(const T& value) { send(make_watch_value(value)); }

private:
    void send(WatchValue value);

    Session& session_;
    std::string name_;
    ContextMap labels_;
    std::optional<Level> level_;
};

// ─────────────────────────────────────────────
// MethodScope
// ─────────────────────────────────────────────

/**
 * @brief Sends enter_method on construction and leave_method on destruction.
 */
class MethodScope {
public:
    MethodScope(Session& session, Level level, std::string name);
    ~MethodScope();

    MethodScope(MethodScope&& other) noexcept;
    MethodScope(const MethodScope&) = delete;
    MethodScope& operator=(const MethodScope&) = delete;
    MethodScope& operator=(MethodScope&&) = delete;

private:
    Session* session_;
    Level level_;
    std::string name_;
};

// ─────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────

class Session {
public:
    Session(PacketSink& sink, std::string name);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ── Settings ─────────────────────────────
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool active() const;
    void set_active(bool active);
    [[nodiscard]] Level level() const;
    void set_level(Level level);
    [[nodiscard]] Color color() const;
    void set_color(Color color);
    void reset_color();

    /// Whether a packet at @p level would be admitted right now.
    [[nodiscard]] bool is_on(Level level) const;
    /// Whether the client is enabled and the session active.
    [[nodiscard]] bool is_on() const;

    // ── Messages ─────────────────────────────
    void log_debug(std::string_view title);
    void log_verbose(std::string_view title);
    void log_message(std::string_view title);
    void log_warning(std::string_view title);
    void log_error(std::string_view title);
    void log_fatal(std::string_view title);

    void log(Level level, std::string_view title);
    void log(Level level, const MessageBuilder& message);

    /// Tags in @p context override scope tags for this entry only.
    void log_with_context(Level level, std::string_view title, const ContextMap& context);

    /// @p build runs only when @p level is admitted.
    template <typename Fn>
    void log_deferred(Level level, Fn&& build) {
        if (!is_on(level)) return;
        log(level, std::string_view(build()));
    }

    void log_separator();
    void log_separator(Level level);
    void log_colored(Color color, std::string_view title);
    void log_colored(Level level, Color color, std::string_view title);

    void log_exception(const std::exception& error, std::string_view title = {});
    void log_internal_error(std::string_view title);
    void log_assert(bool condition, std::string_view title);
    void log_conditional(bool condition, std::string_view title);
    void log_conditional(Level level, bool condition, std::string_view title);

    // ── Payload entries ──────────────────────
    void log_text(std::string_view title, std::string_view text);
    void log_text(Level level, std::string_view title, std::string_view text);
    void log_source(std::string_view title, std::string_view source, SourceId id);
    void log_source(Level level, std::string_view title, std::string_view source, SourceId id);
    void log_binary(std::string_view title, const std::vector<uint8_t>& data);
    void log_binary(Level level, std::string_view title, const std::vector<uint8_t>& data);

    /// @p build returns std::vector<uint8_t> and runs only when admitted.
    template <typename Fn>
    void log_binary_deferred(Level level, std::string_view title, Fn&& build) {
        if (!is_on(level)) return;
        log_binary(level, title, build());
    }

    void log_stream(std::string_view channel, std::string_view data,
                    std::string_view stream_type = {}, std::string_view group = {});
    void log_stream(Level level, std::string_view channel, std::string_view data,
                    std::string_view stream_type = {}, std::string_view group = {});

    // ── Watches ──────────────────────────────
    void watch_string(std::string_view name, std::string_view value, std::string_view group = {});
    void watch_int(std::string_view name, int64_t value, std::string_view group = {},
                   bool include_hex = false);
    void watch_float(std::string_view name, double value, std::string_view group = {});
    void watch_bool(std::string_view name, bool value, std::string_view group = {});
    void watch(Level level, std::string_view name, WatchValue value, std::string_view group = {});

    /// @p build returns a WatchValue and runs only when admitted.
    template <typename Fn>
    void watch_deferred(Level level, std::string_view name, Fn&& build) {
        if (!is_on(level)) return;
        watch(level, name, build());
    }

    template <typename T>
    void watch_with_labels(std::string_view name, const T& value, ContextMap labels,
                           std::optional<Level> level = std::nullopt) {
        send_labeled_watch(name, make_watch_value(value), std::move(labels), level);
    }

    [[nodiscard]] MetricBuilder metric(std::string name);

    // ── Counters / checkpoints / timers ──────
    void inc_counter(std::string_view name);
    void inc_counter(Level level, std::string_view name);
    void dec_counter(std::string_view name);
    void dec_counter(Level level, std::string_view name);
    void reset_counter(std::string_view name);
    [[nodiscard]] int64_t counter(std::string_view name) const;

    /// Anonymous checkpoint: "Checkpoint #N".
    void add_checkpoint();
    /// Named checkpoint: "name #N" or "name #N (details)".
    void add_checkpoint(std::string_view name, std::string_view details = {});
    void add_checkpoint(Level level, std::string_view name, std::string_view details = {});
    /// Reset the named sequence, or the anonymous one when @p name is empty.
    void reset_checkpoint(std::string_view name = {});

    void time_start(std::string_view name);
    /// Watches the elapsed milliseconds and logs them; unknown timers log a warning.
    void time_end(std::string_view name);

    // ── Process flow ─────────────────────────
    void enter_method(std::string_view name);
    void enter_method(Level level, std::string_view name);
    void leave_method(std::string_view name);
    void leave_method(Level level, std::string_view name);
    [[nodiscard]] MethodScope track_method(std::string name);
    [[nodiscard]] MethodScope track_method(Level level, std::string name);

    void enter_thread(std::string_view name = kMainThreadName);
    void leave_thread(std::string_view name = kMainThreadName);
    /// Empty @p name means the application name. Also enters the main thread.
    void enter_process(std::string_view name = {});
    void leave_process(std::string_view name = {});
    void reset_callstack();
    void reset_callstack(Level level);

    // ── Control commands ─────────────────────
    void clear_all();
    void clear_log();
    void clear_watches();
    void clear_auto_views();
    void clear_process_flow();

private:
    friend class MetricBuilder;

    [[nodiscard]] FilterState filter_state() const;

    void send_log_entry(Level level, std::string_view title, LogEntryType type, ViewerId viewer,
                        std::vector<uint8_t> data = {},
                        std::optional<Color> color = std::nullopt,
                        const ContextMap& inline_context = {});
    void send_watch(Level level, std::string_view name, WatchValue value,
                    std::string_view group = {}, ContextMap labels = {});
    void send_labeled_watch(std::string_view name, WatchValue value, ContextMap labels,
                            std::optional<Level> level);
    void send_process_flow(Level level, std::string_view title, ProcessFlowType type);
    void send_control_command(ControlCommandType type);
    void step_counter(Level level, std::string_view name, int64_t delta);

    PacketSink& sink_;
    const std::string name_;

    mutable std::mutex mutex_;
    bool active_ = true;
    Level level_ = Level::Debug;
    Color color_ = kDefaultColor;
    std::map<std::string, int64_t, std::less<>> counters_;
    std::map<std::string, int64_t, std::less<>> checkpoints_;
    int64_t checkpoint_counter_ = 0;
    std::map<std::string, SteadyTime, std::less<>> timers_;
};

}  // namespace log_courier
