/**
 * @file logger.hpp
 * @brief Diagnostics log of the library itself.
 * @author log_courier contributors
 *
 * Connection attempts, evictions and dropped packets are reported here,
 * never through the telemetry pipeline. Lines are NDJSON:
 *
 *   {"level":"warn","ts":"2024-05-01T10:00:00.123Z","component":"sender","msg":"..."}
 *
 * Lines logged from an Error carry an extra "kind" field before "msg".
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace log_courier {

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

/// Case-insensitive; "warning" is accepted for Warn.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

/// Destination of finished NDJSON lines. Calls are serialized by Logger.
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    /// Logger that formats nothing and writes nowhere.
    [[nodiscard]] static std::shared_ptr<Logger> null();

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warn(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    /// Error line tagged with the error's kind.
    void error(std::string_view component, const Error& failure);

    void log(LogLevel level, std::string_view component, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    /// Lock-free; callers on the send path test this before building a message.
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

private:
    void emit(LogLevel level, std::string_view component, std::string_view kind,
              std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex sink_mutex_;
};

[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace log_courier
