/**
 * @file packet_codec.hpp
 * @brief Binary wire codec for console packets.
 * @author log_courier contributors
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/result.hpp"
#include "protocol/packet.hpp"

namespace log_courier {

/**
 * @brief Encodes packets into console frames and back.
 *
 * Frame: [int16 packet type][int32 body size][body], little-endian.
 * Timestamps are OLE Automation dates (double, days since 1899-12-30).
 */
struct PacketCodec {
    static constexpr size_t kFrameHeaderSize = 6;
    static constexpr size_t kMaxBodySize = 16 * 1024 * 1024;

    /// Days between 1899-12-30 and 1970-01-01.
    static constexpr double kOleEpochOffsetDays = 25569.0;

    static Result<EncodedPacket> encode(const Packet& packet);

    /// Decode a frame; the level comes from the envelope.
    static Result<Packet> decode(const EncodedPacket& encoded);

    static Result<Packet> decode_frame(const std::vector<uint8_t>& frame,
                                       Level level = Level::Message);

    static double to_ole_date(Timestamp ts);
    static Timestamp from_ole_date(double days);

    static void put_i16(std::vector<uint8_t>& buf, int16_t val);
    static void put_i32(std::vector<uint8_t>& buf, int32_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static void put_f64(std::vector<uint8_t>& buf, double val);
    static int16_t get_i16(const uint8_t* p);
    static int32_t get_i32(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
    static double get_f64(const uint8_t* p);
};

}  // namespace log_courier
