/**
 * @file transport.hpp
 * @brief Byte channel to the logging console.
 * @author log_courier contributors
 *
 * The console speaks a line-based greeting followed by framed packets:
 * the server sends a banner line, the client answers with its own banner,
 * and from then on every frame written is acknowledged with 2 bytes.
 * Uses non-blocking sockets with poll() so every wait is bounded.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace log_courier {

/**
 * @brief Transport seam used by the connection manager.
 *
 * connect() performs the banner exchange; send_frame() writes one frame
 * and waits for its acknowledgement. interrupt() may be called from any
 * thread to abort blocked I/O; everything else is called by one thread.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Open and greet; returns the server banner (without line ending).
    virtual Result<std::string> connect(const std::string& address, uint16_t port,
                                        Milliseconds timeout) = 0;
    virtual Result<void> send_frame(const std::vector<uint8_t>& frame) = 0;
    virtual void close() = 0;
    virtual void interrupt() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief POSIX TCP implementation of ITransport.
 */
class TcpTransport : public ITransport {
public:
    static constexpr size_t kAckSize = 2;
    static constexpr size_t kMaxBannerSize = 1024;

    TcpTransport();
    ~TcpTransport() override;

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    Result<std::string> connect(const std::string& address, uint16_t port,
                                Milliseconds timeout) override;
    Result<void> send_frame(const std::vector<uint8_t>& frame) override;
    void close() override;
    void interrupt() override;
    [[nodiscard]] bool is_open() const override;

    /// Line the client sends after the server banner.
    [[nodiscard]] static std::string client_banner();

    /// Outcome of one bounded socket transfer.
    enum class IoStatus : uint8_t { Done, TimedOut, Closed, Failed };

private:
    Result<void> open_socket(const std::string& address, uint16_t port, Milliseconds timeout);
    Result<std::string> read_line(size_t max_len);

    static IoStatus send_all(int fd, const void* buf, size_t len, Milliseconds timeout);
    static IoStatus recv_all(int fd, void* buf, size_t len, Milliseconds timeout);

    std::atomic<int> fd_{-1};
    mutable std::mutex fd_mutex_;
    Milliseconds io_timeout_{30000};
};

}  // namespace log_courier
