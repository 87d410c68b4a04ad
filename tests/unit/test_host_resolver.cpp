/**
 * @file test_host_resolver.cpp
 * @brief Unit tests for console host resolution and WSL gateway discovery.
 * @author log_courier contributors
 */

#include "network/host_resolver.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace log_courier;

class HostResolverTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    HostResolver::Paths paths_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "log_courier_test_resolver";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        paths_.proc_version = dir_ / "version";
        paths_.resolv_conf = dir_ / "resolv.conf";
        paths_.route_table = dir_ / "route";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static void write(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    void make_wsl() {
        write(paths_.proc_version,
              "Linux version 5.15.90.1-microsoft-standard-WSL2 (gcc) #1 SMP\n");
    }

    void make_native() {
        write(paths_.proc_version, "Linux version 6.8.0-45-generic (buildd@lcy02) #45-Ubuntu\n");
    }
};

TEST_F(HostResolverTest, LoopbackOnNativeLinux) {
    make_native();
    HostResolver resolver(paths_);
    EXPECT_FALSE(resolver.running_in_wsl());
    EXPECT_EQ(resolver.resolve("").value(), std::string{"127.0.0.1"});
    EXPECT_EQ(resolver.resolve("localhost").value(), std::string{"127.0.0.1"});
}

TEST_F(HostResolverTest, WslUsesPrivateNameserver) {
    make_wsl();
    write(paths_.resolv_conf,
          "# generated by WSL\nnameserver 8.8.8.8\nnameserver 172.23.96.1\n");
    HostResolver resolver(paths_);
    EXPECT_TRUE(resolver.running_in_wsl());
    EXPECT_EQ(resolver.resolve("").value(), std::string{"172.23.96.1"});
    EXPECT_EQ(resolver.resolve("127.0.0.1").value(), std::string{"172.23.96.1"});
}

TEST_F(HostResolverTest, WslFallsBackToDefaultRoute) {
    make_wsl();
    write(paths_.resolv_conf, "nameserver 1.1.1.1\n");
    write(paths_.route_table,
          "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\n"
          "eth0\t0060A8C0\t00000000\t0001\t0\t0\t0\t00F0FFFF\n"
          "eth0\t00000000\t0100A8C0\t0003\t0\t0\t0\t00000000\n");
    HostResolver resolver(paths_);
    EXPECT_EQ(resolver.wsl_gateway(), std::string{"192.168.0.1"});
    EXPECT_EQ(resolver.resolve("localhost").value(), std::string{"192.168.0.1"});
}

TEST_F(HostResolverTest, WslWithoutGatewayKeepsLoopback) {
    make_wsl();
    HostResolver resolver(paths_);
    EXPECT_FALSE(resolver.wsl_gateway().has_value());
    EXPECT_EQ(resolver.resolve("").value(), std::string{"127.0.0.1"});
}

TEST_F(HostResolverTest, ExplicitAddressUntouchedInWsl) {
    make_wsl();
    write(paths_.resolv_conf, "nameserver 172.23.96.1\n");
    HostResolver resolver(paths_);
    EXPECT_EQ(resolver.resolve("10.1.2.3").value(), std::string{"10.1.2.3"});
}

TEST_F(HostResolverTest, UnresolvableNameIsConnectionError) {
    make_native();
    HostResolver resolver(paths_);
    auto result = resolver.resolve("no-such-host.invalid");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Connection);
}

TEST(HostResolverStaticTest, Classification) {
    EXPECT_TRUE(HostResolver::is_loopback("127.0.1.1"));
    EXPECT_TRUE(HostResolver::is_loopback("::1"));
    EXPECT_FALSE(HostResolver::is_loopback("10.0.0.1"));

    EXPECT_TRUE(HostResolver::is_private_ipv4("10.255.0.1"));
    EXPECT_TRUE(HostResolver::is_private_ipv4("172.16.0.1"));
    EXPECT_TRUE(HostResolver::is_private_ipv4("192.168.10.1"));
    EXPECT_FALSE(HostResolver::is_private_ipv4("172.32.0.1"));
    EXPECT_FALSE(HostResolver::is_private_ipv4("8.8.8.8"));
    EXPECT_FALSE(HostResolver::is_private_ipv4("not-an-ip"));
}
