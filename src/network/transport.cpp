/**
 * @file transport.cpp
 * @brief TcpTransport: banner handshake and acknowledged frames.
 * @author log_courier contributors
 */

#include "network/transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <algorithm>
#include <chrono>
#include <climits>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace log_courier {

namespace {

using Clock = std::chrono::steady_clock;
using IoStatus = TcpTransport::IoStatus;

std::string errno_text(int err) {
    return std::strerror(err);
}

/// Call straight after the failed transfer: Failed reads errno.
std::string describe(IoStatus status) {
    switch (status) {
        case IoStatus::Done:     return "ok";
        case IoStatus::TimedOut: return "timed out";
        case IoStatus::Closed:   return "connection closed";
        case IoStatus::Failed:   return errno_text(errno);
    }
    return "unknown";
}

/// Saturating: a far deadline must not wrap when added to now().
Clock::time_point deadline_after(Milliseconds timeout) {
    const auto now = Clock::now();
    if (timeout >= std::chrono::duration_cast<Milliseconds>(Clock::time_point::max() - now)) {
        return Clock::time_point::max();
    }
    return now + timeout;
}

std::string endpoint(const std::string& address, uint16_t port) {
    return address + ":" + std::to_string(port);
}

/// Wait for @p events until @p deadline.
IoStatus wait_ready(int fd, short events, Clock::time_point deadline) {
    while (true) {
        const auto left = std::chrono::duration_cast<Milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) return IoStatus::TimedOut;

        pollfd pfd{fd, events, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(std::min<int64_t>(left, INT_MAX)));
        if (ready < 0 && errno == EINTR) continue;
        if (ready < 0) return IoStatus::Failed;
        if (ready == 0) continue;  // re-check the deadline
        return (pfd.revents & events) != 0 ? IoStatus::Done : IoStatus::Closed;
    }
}

/**
 * Move exactly @p len bytes with @p io (send or recv) before @p deadline.
 * The whole transfer shares one deadline, not one per chunk.
 */
template <typename Io>
IoStatus transfer(int fd, uint8_t* data, size_t len, short events, Clock::time_point deadline,
                  Io io) {
    size_t done = 0;
    while (done < len) {
        if (auto status = wait_ready(fd, events, deadline); status != IoStatus::Done) {
            return status;
        }
        const ssize_t n = io(fd, data + done, len - done);
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) return IoStatus::Closed;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        return IoStatus::Failed;
    }
    return IoStatus::Done;
}

}  // namespace

TcpTransport::TcpTransport() = default;

TcpTransport::~TcpTransport() {
    close();
}

std::string TcpTransport::client_banner() {
    return "log_courier C++ Library v" + std::string{kLibraryVersion} + "\n";
}

// ─────────────────────────────────────────────
// Connect / handshake
// ─────────────────────────────────────────────

Result<void> TcpTransport::open_socket(const std::string& address, uint16_t port,
                                       Milliseconds timeout) {
    sockaddr_in peer{};
    peer.sin_family = AF_INET;
    peer.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &peer.sin_addr) != 1) {
        return connection_error("not an IPv4 address: '" + address + "'");
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return connection_error("socket(): " + errno_text(errno));
    }

    auto fail = [&](const std::string& why) -> Result<void> {
        ::close(fd);
        return connection_error("connect to " + endpoint(address, port) + ": " + why);
    };

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&peer), sizeof(peer)) < 0) {
        if (errno != EINPROGRESS) return fail(errno_text(errno));
        if (auto status = wait_ready(fd, POLLOUT, deadline_after(timeout));
            status != IoStatus::Done && status != IoStatus::Closed) {
            return fail(describe(status));
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) return fail(errno_text(so_error));
    }

    // Small frames must not wait for Nagle; keepalive notices a vanished console.
    const int on = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));

    std::lock_guard lock(fd_mutex_);
    fd_.store(fd);
    return Result<void>{};
}

Result<std::string> TcpTransport::connect(const std::string& address, uint16_t port,
                                          Milliseconds timeout) {
    if (is_open()) {
        return connection_error("already connected");
    }
    io_timeout_ = timeout;

    if (auto opened = open_socket(address, port, timeout); !opened) {
        return opened.error();
    }

    auto banner = read_line(kMaxBannerSize);
    if (!banner) {
        close();
        return banner.error().with_context("handshake");
    }

    const std::string reply = client_banner();
    if (auto status = send_all(fd_.load(), reply.data(), reply.size(), io_timeout_);
        status != IoStatus::Done) {
        const std::string why = describe(status);
        close();
        return connection_error("handshake: could not send client banner: " + why);
    }
    return *banner;
}

Result<std::string> TcpTransport::read_line(size_t max_len) {
    const auto deadline = deadline_after(io_timeout_);
    const int fd = fd_.load();

    std::string line;
    while (line.size() < max_len) {
        uint8_t c = 0;
        const auto status = transfer(fd, &c, 1, POLLIN, deadline,
                                     [](int s, uint8_t* p, size_t n) { return ::recv(s, p, n, 0); });
        if (status != IoStatus::Done) {
            return connection_error("no console banner: " + describe(status));
        }
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        line.push_back(static_cast<char>(c));
    }
    return connection_error("console banner longer than " + std::to_string(max_len) + " bytes");
}

// ─────────────────────────────────────────────
// Frames
// ─────────────────────────────────────────────

Result<void> TcpTransport::send_frame(const std::vector<uint8_t>& frame) {
    const int fd = fd_.load();
    if (fd < 0) {
        return connection_error("not connected");
    }

    if (auto status = send_all(fd, frame.data(), frame.size(), io_timeout_);
        status != IoStatus::Done) {
        return connection_error("frame write failed: " + describe(status));
    }

    uint8_t ack[kAckSize];
    if (auto status = recv_all(fd, ack, kAckSize, io_timeout_); status != IoStatus::Done) {
        return connection_error("no acknowledgement from console: " + describe(status));
    }
    return Result<void>{};
}

void TcpTransport::close() {
    std::lock_guard lock(fd_mutex_);
    const int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

void TcpTransport::interrupt() {
    // Wakes a poll() blocked in another thread; the fd stays owned until close().
    std::lock_guard lock(fd_mutex_);
    const int fd = fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

bool TcpTransport::is_open() const {
    return fd_.load() >= 0;
}

TcpTransport::IoStatus TcpTransport::send_all(int fd, const void* buf, size_t len,
                                              Milliseconds timeout) {
    auto* data = const_cast<uint8_t*>(static_cast<const uint8_t*>(buf));
    return transfer(fd, data, len, POLLOUT, deadline_after(timeout),
                    [](int s, uint8_t* p, size_t n) { return ::send(s, p, n, MSG_NOSIGNAL); });
}

TcpTransport::IoStatus TcpTransport::recv_all(int fd, void* buf, size_t len,
                                              Milliseconds timeout) {
    return transfer(fd, static_cast<uint8_t*>(buf), len, POLLIN, deadline_after(timeout),
                    [](int s, uint8_t* p, size_t n) { return ::recv(s, p, n, 0); });
}

}  // namespace log_courier
