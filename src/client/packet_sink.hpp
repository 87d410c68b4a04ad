/**
 * @file packet_sink.hpp
 * @brief What a Session needs from its owner.
 * @author log_courier contributors
 */

#pragma once

#include "core/types.hpp"
#include "protocol/packet.hpp"

#include <string>

namespace log_courier {

/**
 * @brief The owner of a Session: client-wide settings plus the submit path.
 *
 * Implemented by Client; tests substitute a recording sink.
 */
class PacketSink {
public:
    virtual ~PacketSink() = default;

    [[nodiscard]] virtual bool enabled() const = 0;
    [[nodiscard]] virtual Level level() const = 0;
    [[nodiscard]] virtual Level default_level() const = 0;
    [[nodiscard]] virtual std::string app_name() const = 0;
    [[nodiscard]] virtual std::string host_name() const = 0;

    /// Encode and enqueue an admitted packet. Never throws transport faults.
    virtual void submit(Packet packet) = 0;
};

}  // namespace log_courier
