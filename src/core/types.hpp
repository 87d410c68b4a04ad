/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout log_courier.
 * @author log_courier contributors
 *
 * Severity levels, time types, and the small helpers that convert them
 * from and to their textual form.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace log_courier {

inline constexpr std::string_view kLibraryVersion = "1.0.0";

// ─────────────────────────────────────────────
// Time
// ─────────────────────────────────────────────

/// Wall-clock timestamp at microsecond precision.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;
using SteadyTime = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

[[nodiscard]] inline Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

// ─────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────

/**
 * @brief Packet severity. Ordered; Control is reserved for control commands.
 */
enum class Level : uint8_t {
    Debug = 0,
    Verbose = 1,
    Message = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5,
    Control = 6
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug:   return "debug";
        case Level::Verbose: return "verbose";
        case Level::Message: return "message";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
        case Level::Fatal:   return "fatal";
        case Level::Control: return "control";
    }
    return "unknown";
}

/**
 * @brief Parse a level name (case-insensitive) or its numeric value 0-6.
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    for (auto level : {Level::Debug, Level::Verbose, Level::Message, Level::Warning,
                       Level::Error, Level::Fatal, Level::Control}) {
        if (lowered == to_string(level)) return level;
    }
    if (lowered.size() == 1 && lowered[0] >= '0' && lowered[0] <= '6') {
        return static_cast<Level>(lowered[0] - '0');
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Context
// ─────────────────────────────────────────────

/// Tag map attached to packets. Ordered so encodings are deterministic.
using ContextMap = std::map<std::string, std::string>;

}  // namespace log_courier
