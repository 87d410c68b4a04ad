/**
 * @file packet.hpp
 * @brief Packet taxonomy exchanged with the logging console.
 * @author log_courier contributors
 *
 * A Packet is a level plus exactly one body kind. Bodies are plain value
 * types; once a Packet is built it is encoded on the caller thread and only
 * the encoded frame travels through the pipeline.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace log_courier {

// ─────────────────────────────────────────────
// Console protocol enumerations
// ─────────────────────────────────────────────

enum class PacketType : int16_t {
    ControlCommand = 1,
    LogEntry = 4,
    Watch = 5,
    ProcessFlow = 6,
    LogHeader = 7,
    Stream = 8
};

enum class LogEntryType : int32_t {
    Separator = 0,
    EnterMethod = 1,
    LeaveMethod = 2,
    ResetCallstack = 3,
    Message = 100,
    Warning = 101,
    Error = 102,
    InternalError = 103,
    Comment = 104,
    VariableValue = 105,
    Checkpoint = 106,
    Debug = 107,
    Verbose = 108,
    Fatal = 109,
    Conditional = 110,
    Assert = 111,
    Text = 200,
    Binary = 201,
    Graphic = 202,
    Source = 203,
    Object = 204,
    WebContent = 205,
    System = 206,
    MemoryStatistic = 207,
    DatabaseResult = 208,
    DatabaseStructure = 209
};

enum class ViewerId : int32_t {
    None = -1,
    Title = 0,
    Data = 1,
    List = 2,
    ValueList = 3,
    Inspector = 4,
    Table = 5,
    Web = 100,
    Binary = 200,
    HtmlSource = 300,
    JavaScriptSource = 301,
    VbScriptSource = 302,
    PerlSource = 303,
    SqlSource = 304,
    IniSource = 305,
    PythonSource = 306,
    XmlSource = 307,
    Bitmap = 400,
    Jpeg = 401,
    Icon = 402,
    Metafile = 403
};

/// Source languages understood by the console's highlighting viewers.
enum class SourceId : int32_t {
    Html = static_cast<int32_t>(ViewerId::HtmlSource),
    JavaScript = static_cast<int32_t>(ViewerId::JavaScriptSource),
    VbScript = static_cast<int32_t>(ViewerId::VbScriptSource),
    Perl = static_cast<int32_t>(ViewerId::PerlSource),
    Sql = static_cast<int32_t>(ViewerId::SqlSource),
    Ini = static_cast<int32_t>(ViewerId::IniSource),
    Python = static_cast<int32_t>(ViewerId::PythonSource),
    Xml = static_cast<int32_t>(ViewerId::XmlSource)
};

enum class WatchType : int32_t {
    Char = 0,
    String = 1,
    Integer = 2,
    Float = 3,
    Boolean = 4,
    Address = 5,
    Timestamp = 6,
    Object = 7
};

enum class ControlCommandType : int32_t {
    ClearLog = 0,
    ClearWatches = 1,
    ClearAutoViews = 2,
    ClearAll = 3,
    ClearProcessFlow = 4
};

enum class ProcessFlowType : int32_t {
    EnterMethod = 0,
    LeaveMethod = 1,
    EnterThread = 2,
    LeaveThread = 3,
    EnterProcess = 4,
    LeaveProcess = 5
};

[[nodiscard]] constexpr std::string_view to_string(PacketType type) noexcept {
    switch (type) {
        case PacketType::ControlCommand: return "control_command";
        case PacketType::LogEntry:       return "log_entry";
        case PacketType::Watch:          return "watch";
        case PacketType::ProcessFlow:    return "process_flow";
        case PacketType::LogHeader:      return "log_header";
        case PacketType::Stream:         return "stream";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Color
// ─────────────────────────────────────────────

/**
 * @brief RGBA color; packed on the wire as r | g<<8 | b<<16 | a<<24.
 */
struct Color {
    uint8_t r = 5;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    [[nodiscard]] constexpr uint32_t to_int() const noexcept {
        return static_cast<uint32_t>(r) | (static_cast<uint32_t>(g) << 8) |
               (static_cast<uint32_t>(b) << 16) | (static_cast<uint32_t>(a) << 24);
    }

    [[nodiscard]] static constexpr Color from_int(uint32_t value) noexcept {
        return Color{static_cast<uint8_t>(value & 0xFF),
                     static_cast<uint8_t>((value >> 8) & 0xFF),
                     static_cast<uint8_t>((value >> 16) & 0xFF),
                     static_cast<uint8_t>((value >> 24) & 0xFF)};
    }

    bool operator==(const Color&) const = default;
};

/// Tells the console to use its theme color (0xFF000005).
inline constexpr Color kDefaultColor{};

namespace colors {
inline constexpr Color Red{180, 80, 80, 255};
inline constexpr Color Green{80, 150, 100, 255};
inline constexpr Color Blue{80, 120, 180, 255};
inline constexpr Color Yellow{200, 180, 100, 255};
inline constexpr Color Orange{200, 130, 80, 255};
inline constexpr Color Purple{140, 100, 160, 255};
inline constexpr Color Cyan{80, 160, 170, 255};
inline constexpr Color Gray{128, 128, 128, 255};
}  // namespace colors

/**
 * @brief Parse `#RGB`, `#RRGGBB` or `#RRGGBBAA` (leading '#' optional).
 * Unparseable input yields kDefaultColor.
 */
[[nodiscard]] Color parse_color(std::string_view text);

// ─────────────────────────────────────────────
// Packet bodies
// ─────────────────────────────────────────────

struct LogEntry {
    LogEntryType entry_type = LogEntryType::Message;
    ViewerId viewer_id = ViewerId::Title;
    std::string app_name;
    std::string session_name;
    std::string title;
    std::string host_name;
    std::string correlation_id;               ///< empty = none
    std::string operation_name;               ///< empty = none
    ContextMap context;
    std::vector<uint8_t> data;
    int32_t process_id = 0;
    int32_t thread_id = 0;
    Timestamp timestamp{};
    Color color = kDefaultColor;
    int32_t operation_depth = 0;

    bool operator==(const LogEntry&) const = default;
};

struct Watch {
    std::string name;
    std::string value;
    WatchType watch_type = WatchType::String;
    Timestamp timestamp{};
    std::string group;
    ContextMap labels;

    bool operator==(const Watch&) const = default;
};

struct ProcessFlow {
    ProcessFlowType flow_type = ProcessFlowType::EnterMethod;
    std::string title;
    std::string host_name;
    std::string correlation_id;
    int32_t process_id = 0;
    int32_t thread_id = 0;
    Timestamp timestamp{};

    bool operator==(const ProcessFlow&) const = default;
};

struct ControlCommand {
    ControlCommandType command_type = ControlCommandType::ClearAll;
    std::vector<uint8_t> data;

    bool operator==(const ControlCommand&) const = default;
};

struct StreamPacket {
    std::string channel;
    std::string data;
    std::string stream_type;
    Timestamp timestamp{};
    std::string group;

    bool operator==(const StreamPacket&) const = default;
};

/**
 * @brief First packet on every connection; identifies the client.
 */
struct LogHeader {
    std::string host_name;
    std::string app_name;
    std::string room = "default";

    /// `hostname=H\r\nappname=A\r\nroom=R\r\n`
    [[nodiscard]] std::string content() const;

    bool operator==(const LogHeader&) const = default;
};

using PacketBody = std::variant<LogEntry, Watch, ProcessFlow, ControlCommand, StreamPacket, LogHeader>;

// ─────────────────────────────────────────────
// Packet / EncodedPacket
// ─────────────────────────────────────────────

struct Packet {
    Level level = Level::Message;
    PacketBody body;

    [[nodiscard]] PacketType type() const noexcept;

    bool operator==(const Packet&) const = default;
};

/**
 * @brief A packet after encoding: what the queue and backlog hold.
 *
 * `frame` is the complete wire frame including the 6-byte header.
 */
struct EncodedPacket {
    Level level = Level::Message;
    PacketType type = PacketType::LogEntry;
    std::vector<uint8_t> frame;

    [[nodiscard]] size_t size() const noexcept { return frame.size(); }

    bool operator==(const EncodedPacket&) const = default;
};

}  // namespace log_courier
