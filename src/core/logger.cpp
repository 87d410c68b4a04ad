/**
 * @file logger.cpp
 * @brief NDJSON line formatting and level gating.
 * @author log_courier contributors
 */

#include "core/logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace log_courier {

namespace {

class DiscardSink : public ILogSink {
public:
    void write(std::string_view) override {}
    void flush() override {}
};

/// "2024-05-01T10:00:00.123Z"
std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    ::gmtime_r(&seconds, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
    return buf;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    for (char& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
                    out += code;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(sink ? std::move(sink) : std::make_unique<DiscardSink>()), min_level_(min_level) {}

std::shared_ptr<Logger> Logger::null() {
    return std::make_shared<Logger>(std::make_unique<DiscardSink>(), LogLevel::Off);
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}

void Logger::warn(std::string_view component, std::string_view message) {
    log(LogLevel::Warn, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

void Logger::error(std::string_view component, const Error& failure) {
    if (!enabled(LogLevel::Error)) return;
    emit(LogLevel::Error, component, to_string(failure.kind), failure.message);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) return;
    emit(level, component, {}, message);
}

void Logger::emit(LogLevel level, std::string_view component, std::string_view kind,
                  std::string_view message) {
    std::string line;
    line.reserve(96 + message.size());
    line += R"({"level":")";
    line += to_string(level);
    line += R"(","ts":")";
    line += utc_timestamp();
    line += R"(","component":")";
    line += json_escape(component);
    if (!kind.empty()) {
        line += R"(","kind":")";
        line += kind;
    }
    line += R"(","msg":")";
    line += json_escape(message);
    line += R"("})";

    std::lock_guard lock(sink_mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(sink_mutex_);
    sink_->flush();
}

bool Logger::enabled(LogLevel level) const noexcept {
    const LogLevel min = min_level_.load(std::memory_order_relaxed);
    return min != LogLevel::Off && level != LogLevel::Off && level >= min;
}

}  // namespace log_courier
