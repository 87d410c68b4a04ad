/**
 * @file fake_console.hpp
 * @brief Loopback TCP server speaking the console side of the protocol.
 * @author log_courier contributors
 *
 * Sends a banner, reads the client banner, then acknowledges every frame
 * with two bytes and records it. One client at a time.
 */

#pragma once

#include "protocol/packet_codec.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace log_courier::test_support {

class FakeConsole {
public:
    FakeConsole() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int flag = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 4);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        worker_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    }

    ~FakeConsole() {
        worker_.request_stop();
        if (worker_.joinable()) worker_.join();
        ::close(listen_fd_);
    }

    FakeConsole(const FakeConsole&) = delete;
    FakeConsole& operator=(const FakeConsole&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Close the current client connection from the server side.
    void drop_client() { drop_requested_.store(true); }

    /// Keep reading frames but stop acknowledging them.
    void withhold_acks(bool withhold) { withhold_acks_.store(withhold); }

    [[nodiscard]] std::vector<std::vector<uint8_t>> frames() const {
        std::lock_guard lock(mutex_);
        return frames_;
    }

    [[nodiscard]] std::vector<Packet> packets() const {
        std::vector<Packet> out;
        for (const auto& frame : frames()) {
            auto decoded = PacketCodec::decode_frame(frame);
            if (decoded && decoded->type() != PacketType::LogHeader) {
                out.push_back(std::move(*decoded));
            }
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> client_banners() const {
        std::lock_guard lock(mutex_);
        return banners_;
    }

    [[nodiscard]] size_t connections() const {
        std::lock_guard lock(mutex_);
        return banners_.size();
    }

    /// Wait until at least @p count non-header frames arrived.
    bool wait_for_packets(size_t count, std::chrono::milliseconds timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return packet_frames_ >= count; });
    }

private:
    static constexpr int kPollMs = 20;

    void serve(std::stop_token stop) {
        while (!stop.stop_requested()) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, kPollMs) <= 0) continue;
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) continue;
            drop_requested_.store(false);
            handle(client, stop);
            ::close(client);
        }
    }

    bool read_exact(int fd, uint8_t* buf, size_t len, std::stop_token& stop) {
        size_t got = 0;
        while (got < len) {
            if (stop.stop_requested() || drop_requested_.load()) return false;
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, kPollMs) <= 0) continue;
            auto n = ::recv(fd, buf + got, len - got, 0);
            if (n <= 0) return false;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    void handle(int fd, std::stop_token& stop) {
        const std::string banner = "Fake Console v1.0\r\n";
        ::send(fd, banner.data(), banner.size(), MSG_NOSIGNAL);

        std::string client_banner;
        uint8_t c = 0;
        while (read_exact(fd, &c, 1, stop)) {
            if (c == '\n') break;
            client_banner.push_back(static_cast<char>(c));
        }
        if (c != '\n') return;
        {
            std::lock_guard lock(mutex_);
            banners_.push_back(client_banner);
        }

        while (true) {
            std::vector<uint8_t> frame(PacketCodec::kFrameHeaderSize);
            if (!read_exact(fd, frame.data(), frame.size(), stop)) return;
            const auto type = PacketCodec::get_i16(frame.data());
            const auto size = static_cast<size_t>(PacketCodec::get_i32(frame.data() + 2));
            frame.resize(PacketCodec::kFrameHeaderSize + size);
            if (size > 0 && !read_exact(fd, frame.data() + PacketCodec::kFrameHeaderSize, size, stop)) {
                return;
            }
            {
                std::lock_guard lock(mutex_);
                frames_.push_back(frame);
                if (type != static_cast<int16_t>(PacketType::LogHeader)) ++packet_frames_;
            }
            cv_.notify_all();
            if (withhold_acks_.load()) continue;

            const uint8_t ack[2] = {0, 0};
            if (::send(fd, ack, sizeof(ack), MSG_NOSIGNAL) != static_cast<ssize_t>(sizeof(ack))) return;
        }
    }

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> drop_requested_{false};
    std::atomic<bool> withhold_acks_{false};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::vector<uint8_t>> frames_;
    std::vector<std::string> banners_;
    size_t packet_frames_ = 0;

    std::jthread worker_;
};

}  // namespace log_courier::test_support
