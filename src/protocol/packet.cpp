/**
 * @file packet.cpp
 * @brief Packet helpers: type mapping, header content, color parsing.
 * @author log_courier contributors
 */

#include "protocol/packet.hpp"

#include <cctype>
#include <type_traits>

namespace log_courier {

std::string LogHeader::content() const {
    return "hostname=" + host_name + "\r\nappname=" + app_name + "\r\nroom=" + room + "\r\n";
}

PacketType Packet::type() const noexcept {
    return std::visit([](const auto& b) -> PacketType {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, LogEntry>) return PacketType::LogEntry;
        else if constexpr (std::is_same_v<T, Watch>) return PacketType::Watch;
        else if constexpr (std::is_same_v<T, ProcessFlow>) return PacketType::ProcessFlow;
        else if constexpr (std::is_same_v<T, ControlCommand>) return PacketType::ControlCommand;
        else if constexpr (std::is_same_v<T, StreamPacket>) return PacketType::Stream;
        else return PacketType::LogHeader;
    }, body);
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

Color parse_color(std::string_view text) {
    if (!text.empty() && text.front() == '#') text.remove_prefix(1);

    std::string hex;
    if (text.size() == 3) {
        for (char c : text) {
            hex.push_back(c);
            hex.push_back(c);
        }
    } else if (text.size() == 6 || text.size() == 8) {
        hex = std::string{text};
    } else {
        return kDefaultColor;
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    for (size_t i = 0; i < hex.size() / 2; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return kDefaultColor;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color{channels[0], channels[1], channels[2], channels[3]};
}

}  // namespace log_courier
