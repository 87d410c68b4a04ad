/**
 * @file packet_codec.cpp
 * @brief PacketCodec binary serialization for the console protocol.
 * @author log_courier contributors
 *
 * Wire format (all multi-byte values are little-endian):
 *
 * Frame:
 *   [2B packet type][4B body size][body...]
 *
 * LogEntry:
 *   [4B entry type][4B viewer id][4B app len][4B session len][4B title len]
 *   [4B host len][4B correlation len][4B operation len][4B context len]
 *   [4B data len][4B pid][4B tid][8B timestamp][4B color][4B operation depth]
 *   [app][session][title][host][correlation][operation][context][data]
 *
 * Watch:
 *   [4B name len][4B value len][4B watch type][8B timestamp][4B group len]
 *   [4B labels len][name][value][group][labels]
 *
 * ProcessFlow:
 *   [4B flow type][4B title len][4B host len][4B correlation len][4B pid]
 *   [4B tid][8B timestamp][title][host][correlation]
 *
 * ControlCommand:
 *   [4B command type][4B data len][data]
 *
 * Stream:
 *   [4B channel len][4B data len][4B type len][8B timestamp][4B group len]
 *   [channel][data][type][group]
 *
 * LogHeader:
 *   [4B content len][content]
 */

#include "protocol/packet_codec.hpp"

#include "protocol/json_map.hpp"

#include <cmath>
#include <cstring>
#include <type_traits>

namespace log_courier {

// ─────────────────────────────────────────────
// Helper: little-endian encode/decode
// ─────────────────────────────────────────────

void PacketCodec::put_i16(std::vector<uint8_t>& buf, int16_t val) {
    auto u = static_cast<uint16_t>(val);
    buf.push_back(static_cast<uint8_t>(u & 0xFF));
    buf.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
}

void PacketCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
}

void PacketCodec::put_i32(std::vector<uint8_t>& buf, int32_t val) {
    put_u32(buf, static_cast<uint32_t>(val));
}

void PacketCodec::put_f64(std::vector<uint8_t>& buf, double val) {
    uint64_t bits = 0;
    std::memcpy(&bits, &val, sizeof(bits));
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

int16_t PacketCodec::get_i16(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                (static_cast<uint16_t>(p[1]) << 8));
}

uint32_t PacketCodec::get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

int32_t PacketCodec::get_i32(const uint8_t* p) {
    return static_cast<int32_t>(get_u32(p));
}

double PacketCodec::get_f64(const uint8_t* p) {
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 8) | p[i];
    }
    double val = 0.0;
    std::memcpy(&val, &bits, sizeof(val));
    return val;
}

// ─────────────────────────────────────────────
// OLE Automation dates
// ─────────────────────────────────────────────

namespace {
constexpr double kMicrosPerDay = 86400.0 * 1e6;
}  // namespace

double PacketCodec::to_ole_date(Timestamp ts) {
    const auto us = ts.time_since_epoch().count();
    return static_cast<double>(us) / kMicrosPerDay + kOleEpochOffsetDays;
}

Timestamp PacketCodec::from_ole_date(double days) {
    const auto us = std::llround((days - kOleEpochOffsetDays) * kMicrosPerDay);
    return Timestamp{std::chrono::microseconds{us}};
}

// ─────────────────────────────────────────────
// Encode
// ─────────────────────────────────────────────

namespace {

void put_len(std::vector<uint8_t>& buf, size_t len) {
    PacketCodec::put_i32(buf, static_cast<int32_t>(len));
}

template <typename Bytes>
void put_bytes(std::vector<uint8_t>& buf, const Bytes& bytes) {
    buf.insert(buf.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> encode_body(const LogEntry& e) {
    const std::string context = encode_json_map(e.context);

    std::vector<uint8_t> buf;
    buf.reserve(64 + e.app_name.size() + e.session_name.size() + e.title.size() +
                e.host_name.size() + e.correlation_id.size() + e.operation_name.size() +
                context.size() + e.data.size());

    PacketCodec::put_i32(buf, static_cast<int32_t>(e.entry_type));
    PacketCodec::put_i32(buf, static_cast<int32_t>(e.viewer_id));
    put_len(buf, e.app_name.size());
    put_len(buf, e.session_name.size());
    put_len(buf, e.title.size());
    put_len(buf, e.host_name.size());
    put_len(buf, e.correlation_id.size());
    put_len(buf, e.operation_name.size());
    put_len(buf, context.size());
    put_len(buf, e.data.size());
    PacketCodec::put_i32(buf, e.process_id);
    PacketCodec::put_i32(buf, e.thread_id);
    PacketCodec::put_f64(buf, PacketCodec::to_ole_date(e.timestamp));
    PacketCodec::put_u32(buf, e.color.to_int());
    PacketCodec::put_i32(buf, e.operation_depth);

    put_bytes(buf, e.app_name);
    put_bytes(buf, e.session_name);
    put_bytes(buf, e.title);
    put_bytes(buf, e.host_name);
    put_bytes(buf, e.correlation_id);
    put_bytes(buf, e.operation_name);
    put_bytes(buf, context);
    put_bytes(buf, e.data);
    return buf;
}

std::vector<uint8_t> encode_body(const Watch& w) {
    const std::string labels = encode_json_map(w.labels);

    std::vector<uint8_t> buf;
    put_len(buf, w.name.size());
    put_len(buf, w.value.size());
    PacketCodec::put_i32(buf, static_cast<int32_t>(w.watch_type));
    PacketCodec::put_f64(buf, PacketCodec::to_ole_date(w.timestamp));
    put_len(buf, w.group.size());
    put_len(buf, labels.size());

    put_bytes(buf, w.name);
    put_bytes(buf, w.value);
    put_bytes(buf, w.group);
    put_bytes(buf, labels);
    return buf;
}

std::vector<uint8_t> encode_body(const ProcessFlow& f) {
    std::vector<uint8_t> buf;
    PacketCodec::put_i32(buf, static_cast<int32_t>(f.flow_type));
    put_len(buf, f.title.size());
    put_len(buf, f.host_name.size());
    put_len(buf, f.correlation_id.size());
    PacketCodec::put_i32(buf, f.process_id);
    PacketCodec::put_i32(buf, f.thread_id);
    PacketCodec::put_f64(buf, PacketCodec::to_ole_date(f.timestamp));

    put_bytes(buf, f.title);
    put_bytes(buf, f.host_name);
    put_bytes(buf, f.correlation_id);
    return buf;
}

std::vector<uint8_t> encode_body(const ControlCommand& c) {
    std::vector<uint8_t> buf;
    PacketCodec::put_i32(buf, static_cast<int32_t>(c.command_type));
    put_len(buf, c.data.size());
    put_bytes(buf, c.data);
    return buf;
}

std::vector<uint8_t> encode_body(const StreamPacket& s) {
    std::vector<uint8_t> buf;
    put_len(buf, s.channel.size());
    put_len(buf, s.data.size());
    put_len(buf, s.stream_type.size());
    PacketCodec::put_f64(buf, PacketCodec::to_ole_date(s.timestamp));
    put_len(buf, s.group.size());

    put_bytes(buf, s.channel);
    put_bytes(buf, s.data);
    put_bytes(buf, s.stream_type);
    put_bytes(buf, s.group);
    return buf;
}

std::vector<uint8_t> encode_body(const LogHeader& h) {
    const std::string content = h.content();
    std::vector<uint8_t> buf;
    put_len(buf, content.size());
    put_bytes(buf, content);
    return buf;
}

}  // namespace

Result<EncodedPacket> PacketCodec::encode(const Packet& packet) {
    std::vector<uint8_t> body = std::visit([](const auto& b) { return encode_body(b); },
                                           packet.body);
    if (body.size() > kMaxBodySize) {
        return protocol_error(std::string{to_string(packet.type())} + " body of " +
                              std::to_string(body.size()) + " bytes exceeds the " +
                              std::to_string(kMaxBodySize) + " byte limit");
    }

    EncodedPacket out;
    out.level = packet.level;
    out.type = packet.type();
    out.frame.reserve(kFrameHeaderSize + body.size());
    put_i16(out.frame, static_cast<int16_t>(out.type));
    put_len(out.frame, body.size());
    out.frame.insert(out.frame.end(), body.begin(), body.end());
    return out;
}

// ─────────────────────────────────────────────
// Decode
// ─────────────────────────────────────────────

namespace {

/// Bounds-checked cursor over a frame body.
class BodyReader {
public:
    BodyReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool i32(int32_t& out) {
        if (!need(4)) return false;
        out = PacketCodec::get_i32(data_ + offset_);
        offset_ += 4;
        return true;
    }

    bool u32(uint32_t& out) {
        if (!need(4)) return false;
        out = PacketCodec::get_u32(data_ + offset_);
        offset_ += 4;
        return true;
    }

    bool len(size_t& out) {
        int32_t v = 0;
        if (!i32(v) || v < 0) return false;
        out = static_cast<size_t>(v);
        return true;
    }

    bool timestamp(Timestamp& out) {
        if (!need(8)) return false;
        out = PacketCodec::from_ole_date(PacketCodec::get_f64(data_ + offset_));
        offset_ += 8;
        return true;
    }

    bool string(size_t n, std::string& out) {
        if (!need(n)) return false;
        out.assign(reinterpret_cast<const char*>(data_ + offset_), n);
        offset_ += n;
        return true;
    }

    bool bytes(size_t n, std::vector<uint8_t>& out) {
        if (!need(n)) return false;
        out.assign(data_ + offset_, data_ + offset_ + n);
        offset_ += n;
        return true;
    }

    [[nodiscard]] bool at_end() const noexcept { return offset_ == size_; }

private:
    bool need(size_t n) const noexcept { return n <= size_ - offset_; }

    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

Error truncated(PacketType type) {
    return protocol_error(std::string{"truncated or malformed "} + std::string{to_string(type)} +
                          " body");
}

Result<PacketBody> decode_log_entry(BodyReader& r) {
    LogEntry e;
    int32_t entry_type = 0, viewer = 0;
    size_t app = 0, session = 0, title = 0, host = 0, corr = 0, op = 0, ctx = 0, data = 0;
    uint32_t color = 0;
    std::string context;

    bool ok = r.i32(entry_type) && r.i32(viewer) &&
              r.len(app) && r.len(session) && r.len(title) && r.len(host) &&
              r.len(corr) && r.len(op) && r.len(ctx) && r.len(data) &&
              r.i32(e.process_id) && r.i32(e.thread_id) && r.timestamp(e.timestamp) &&
              r.u32(color) && r.i32(e.operation_depth) &&
              r.string(app, e.app_name) && r.string(session, e.session_name) &&
              r.string(title, e.title) && r.string(host, e.host_name) &&
              r.string(corr, e.correlation_id) && r.string(op, e.operation_name) &&
              r.string(ctx, context) && r.bytes(data, e.data);
    if (!ok) return truncated(PacketType::LogEntry);

    auto map = decode_json_map(context);
    if (!map) return map.error();

    e.entry_type = static_cast<LogEntryType>(entry_type);
    e.viewer_id = static_cast<ViewerId>(viewer);
    e.color = Color::from_int(color);
    e.context = std::move(*map);
    return PacketBody{std::move(e)};
}

Result<PacketBody> decode_watch(BodyReader& r) {
    Watch w;
    size_t name = 0, value = 0, group = 0, labels = 0;
    int32_t watch_type = 0;
    std::string labels_json;

    bool ok = r.len(name) && r.len(value) && r.i32(watch_type) && r.timestamp(w.timestamp) &&
              r.len(group) && r.len(labels) &&
              r.string(name, w.name) && r.string(value, w.value) &&
              r.string(group, w.group) && r.string(labels, labels_json);
    if (!ok) return truncated(PacketType::Watch);

    auto map = decode_json_map(labels_json);
    if (!map) return map.error();

    w.watch_type = static_cast<WatchType>(watch_type);
    w.labels = std::move(*map);
    return PacketBody{std::move(w)};
}

Result<PacketBody> decode_process_flow(BodyReader& r) {
    ProcessFlow f;
    int32_t flow_type = 0;
    size_t title = 0, host = 0, corr = 0;

    bool ok = r.i32(flow_type) && r.len(title) && r.len(host) && r.len(corr) &&
              r.i32(f.process_id) && r.i32(f.thread_id) && r.timestamp(f.timestamp) &&
              r.string(title, f.title) && r.string(host, f.host_name) &&
              r.string(corr, f.correlation_id);
    if (!ok) return truncated(PacketType::ProcessFlow);

    f.flow_type = static_cast<ProcessFlowType>(flow_type);
    return PacketBody{std::move(f)};
}

Result<PacketBody> decode_control_command(BodyReader& r) {
    ControlCommand c;
    int32_t command_type = 0;
    size_t data = 0;

    if (!(r.i32(command_type) && r.len(data) && r.bytes(data, c.data))) {
        return truncated(PacketType::ControlCommand);
    }
    c.command_type = static_cast<ControlCommandType>(command_type);
    return PacketBody{std::move(c)};
}

Result<PacketBody> decode_stream(BodyReader& r) {
    StreamPacket s;
    size_t channel = 0, data = 0, type = 0, group = 0;

    bool ok = r.len(channel) && r.len(data) && r.len(type) && r.timestamp(s.timestamp) &&
              r.len(group) &&
              r.string(channel, s.channel) && r.string(data, s.data) &&
              r.string(type, s.stream_type) && r.string(group, s.group);
    if (!ok) return truncated(PacketType::Stream);
    return PacketBody{std::move(s)};
}

Result<PacketBody> decode_log_header(BodyReader& r) {
    size_t len = 0;
    std::string content;
    if (!(r.len(len) && r.string(len, content))) return truncated(PacketType::LogHeader);

    LogHeader h;
    h.room.clear();
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find("\r\n", pos);
        if (end == std::string::npos) end = content.size();
        std::string line = content.substr(pos, end - pos);
        pos = end + 2;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        if (key == "hostname") h.host_name = value;
        else if (key == "appname") h.app_name = value;
        else if (key == "room") h.room = value;
    }
    return PacketBody{std::move(h)};
}

}  // namespace

Result<Packet> PacketCodec::decode(const EncodedPacket& encoded) {
    return decode_frame(encoded.frame, encoded.level);
}

Result<Packet> PacketCodec::decode_frame(const std::vector<uint8_t>& frame, Level level) {
    if (frame.size() < kFrameHeaderSize) {
        return protocol_error("frame shorter than its header");
    }

    const auto type = static_cast<PacketType>(get_i16(frame.data()));
    const int32_t body_size = get_i32(frame.data() + 2);
    if (body_size < 0 || static_cast<size_t>(body_size) != frame.size() - kFrameHeaderSize) {
        return protocol_error("frame body size " + std::to_string(body_size) +
                              " does not match " + std::to_string(frame.size() - kFrameHeaderSize));
    }

    BodyReader reader{frame.data() + kFrameHeaderSize, static_cast<size_t>(body_size)};
    Result<PacketBody> body = [&]() -> Result<PacketBody> {
        switch (type) {
            case PacketType::LogEntry:       return decode_log_entry(reader);
            case PacketType::Watch:          return decode_watch(reader);
            case PacketType::ProcessFlow:    return decode_process_flow(reader);
            case PacketType::ControlCommand: return decode_control_command(reader);
            case PacketType::Stream:         return decode_stream(reader);
            case PacketType::LogHeader:      return decode_log_header(reader);
        }
        return protocol_error("unknown packet type " +
                              std::to_string(static_cast<int>(type)));
    }();
    if (!body) return body.error();
    if (!reader.at_end()) return truncated(type);

    return Packet{level, std::move(*body)};
}

}  // namespace log_courier
