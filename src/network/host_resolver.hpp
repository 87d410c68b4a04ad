/**
 * @file host_resolver.hpp
 * @brief Console host resolution, including the WSL gateway substitution.
 * @author log_courier contributors
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace log_courier {

/**
 * @brief Turns a configured host into an IPv4 address to connect to.
 *
 * Inside a WSL network namespace (detected from /proc/version) the console
 * usually runs on the Windows side, which is not reachable on loopback. An
 * empty or loopback host is then replaced by the private nameserver from
 * resolv.conf, or failing that by the default-route gateway. Other names go
 * through getaddrinfo. Paths are injectable for tests.
 */
class HostResolver {
public:
    struct Paths {
        std::filesystem::path proc_version = "/proc/version";
        std::filesystem::path resolv_conf = "/etc/resolv.conf";
        std::filesystem::path route_table = "/proc/net/route";
    };

    HostResolver();
    explicit HostResolver(Paths paths);

    [[nodiscard]] Result<std::string> resolve(const std::string& host) const;

    [[nodiscard]] bool running_in_wsl() const;

    /// Windows host address as seen from WSL, if it can be discovered.
    [[nodiscard]] std::optional<std::string> wsl_gateway() const;

    [[nodiscard]] static bool is_loopback(const std::string& host);
    [[nodiscard]] static bool is_private_ipv4(const std::string& address);

private:
    [[nodiscard]] std::optional<std::string> nameserver_gateway() const;
    [[nodiscard]] std::optional<std::string> default_route_gateway() const;

    Paths paths_;
};

}  // namespace log_courier
