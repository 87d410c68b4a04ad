/**
 * @file host_resolver.cpp
 * @brief HostResolver implementation.
 * @author log_courier contributors
 */

#include "network/host_resolver.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <fstream>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <utility>

namespace log_courier {

namespace {

constexpr const char* kLoopback = "127.0.0.1";

std::string lowered_file_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) return {};
    std::ostringstream oss;
    oss << in.rdbuf();
    std::string text = oss.str();
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

HostResolver::HostResolver() : paths_{} {}

HostResolver::HostResolver(Paths paths) : paths_(std::move(paths)) {}

bool HostResolver::is_loopback(const std::string& host) {
    return host == "localhost" || host == "::1" || host.rfind("127.", 0) == 0;
}

bool HostResolver::is_private_ipv4(const std::string& address) {
    in_addr addr{};
    if (::inet_pton(AF_INET, address.c_str(), &addr) != 1) return false;
    const uint32_t ip = ntohl(addr.s_addr);
    const uint8_t a = static_cast<uint8_t>(ip >> 24);
    const uint8_t b = static_cast<uint8_t>((ip >> 16) & 0xFF);
    return a == 10 || (a == 172 && b >= 16 && b <= 31) || (a == 192 && b == 168);
}

bool HostResolver::running_in_wsl() const {
    const std::string version = lowered_file_text(paths_.proc_version);
    return version.find("microsoft") != std::string::npos ||
           version.find("wsl") != std::string::npos;
}

std::optional<std::string> HostResolver::nameserver_gateway() const {
    std::ifstream in(paths_.resolv_conf);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string keyword, address;
        fields >> keyword >> address;
        if (keyword == "nameserver" && is_private_ipv4(address)) {
            return address;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HostResolver::default_route_gateway() const {
    // Columns: Iface Destination Gateway Flags ...; addresses are hex in host byte order.
    std::ifstream in(paths_.route_table);
    std::string line;
    std::getline(in, line);  // header
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway;
        if (!(fields >> iface >> destination >> gateway)) continue;
        if (destination != "00000000" || gateway == "00000000") continue;

        uint32_t raw = 0;
        try {
            raw = static_cast<uint32_t>(std::stoul(gateway, nullptr, 16));
        } catch (const std::exception&) {
            continue;
        }
        in_addr addr{};
        addr.s_addr = raw;
        char buf[INET_ADDRSTRLEN] = {};
        if (::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) != nullptr) {
            return std::string{buf};
        }
    }
    return std::nullopt;
}

std::optional<std::string> HostResolver::wsl_gateway() const {
    if (auto ns = nameserver_gateway()) return ns;
    return default_route_gateway();
}

Result<std::string> HostResolver::resolve(const std::string& host) const {
    if (host.empty() || is_loopback(host)) {
        if (running_in_wsl()) {
            if (auto gateway = wsl_gateway()) return *gateway;
        }
        return std::string{kLoopback};
    }

    in_addr literal{};
    if (::inet_pton(AF_INET, host.c_str(), &literal) == 1) {
        return host;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0 || results == nullptr) {
        return connection_error("Cannot resolve host '" + host + "': " + ::gai_strerror(rc));
    }

    char buf[INET_ADDRSTRLEN] = {};
    const auto* sin = reinterpret_cast<const sockaddr_in*>(results->ai_addr);
    const bool ok = ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr;
    ::freeaddrinfo(results);
    if (!ok) {
        return connection_error("Cannot format address for host '" + host + "'");
    }
    return std::string{buf};
}

}  // namespace log_courier
