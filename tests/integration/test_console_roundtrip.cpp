/**
 * @file test_console_roundtrip.cpp
 * @brief End-to-end tests: Client over real TCP against a loopback console.
 * @author log_courier contributors
 */

#include "client/client.hpp"
#include "network/transport.hpp"
#include "protocol/packet_codec.hpp"
#include "support/fake_console.hpp"
#include "support/recording.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace log_courier;
using namespace log_courier::test_support;

namespace {

std::vector<std::string> titles_of(const std::vector<Packet>& packets) {
    std::vector<std::string> out;
    for (const auto& packet : packets) {
        if (const auto* entry = std::get_if<LogEntry>(&packet.body)) out.push_back(entry->title);
    }
    return out;
}

std::vector<uint8_t> header_frame() {
    auto encoded = PacketCodec::encode(Packet{Level::Control, LogHeader{"it-host", "Raw", "default"}});
    return std::move(encoded).value().frame;
}

std::string descriptor(uint16_t port, const std::string& extra = {}) {
    std::string text = "tcp(host=127.0.0.1,port=" + std::to_string(port);
    if (!extra.empty()) text += "," + extra;
    return text + ")";
}

}  // namespace

class ConsoleRoundtripTest : public ::testing::Test {
protected:
    FakeConsole console_;
    std::shared_ptr<RecordingListener> listener_ = std::make_shared<RecordingListener>();
    std::unique_ptr<Client> client_;

    void SetUp() override {
        client_ = std::make_unique<Client>("Roundtrip", listener_);
        client_->set_host_name("it-host");
    }

    void TearDown() override {
        client_.reset();
    }
};

// ═══════════════════════════════════════════════
// Handshake and delivery
// ═══════════════════════════════════════════════

TEST_F(ConsoleRoundtripTest, HandshakeThenOrderedDelivery) {
    ASSERT_TRUE(client_->connect(descriptor(console_.port())).has_value());

    for (int i = 0; i < 20; ++i) {
        client_->main_session().log_message("event " + std::to_string(i));
    }
    ASSERT_TRUE(console_.wait_for_packets(20, std::chrono::seconds(5)));

    auto banners = console_.client_banners();
    ASSERT_EQ(banners.size(), 1u);
    EXPECT_EQ(banners[0], "log_courier C++ Library v1.0.0");

    auto frames = console_.frames();
    ASSERT_FALSE(frames.empty());
    auto header = PacketCodec::decode_frame(frames[0]);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(std::get<LogHeader>(header->body), (LogHeader{"it-host", "Roundtrip", "default"}));

    auto titles = titles_of(console_.packets());
    ASSERT_EQ(titles.size(), 20u);
    for (size_t i = 0; i < titles.size(); ++i) {
        EXPECT_EQ(titles[i], "event " + std::to_string(i));
    }
}

TEST_F(ConsoleRoundtripTest, SyncModeDeliversBeforeReturning) {
    ASSERT_TRUE(client_->connect(descriptor(console_.port(), "async.enabled=false")).has_value());
    client_->main_session().log_warning("inline");
    client_->main_session().watch_int("depth", 3);

    // Each frame was acknowledged before the call returned.
    auto packets = console_.packets();
    ASSERT_EQ(packets.size(), 2u);
    EXPECT_EQ(std::get<LogEntry>(packets[0].body).title, "inline");
    EXPECT_EQ(std::get<Watch>(packets[1].body).value, "3");
}

TEST_F(ConsoleRoundtripTest, DisconnectFlushesQueuedPackets) {
    ASSERT_TRUE(client_->connect(descriptor(console_.port())).has_value());
    for (int i = 0; i < 100; ++i) {
        client_->main_session().log_debug("burst " + std::to_string(i));
    }
    client_->disconnect();

    ASSERT_TRUE(console_.wait_for_packets(100, std::chrono::seconds(5)));
    EXPECT_EQ(client_->stats().packets_sent, 100u);
}

// ═══════════════════════════════════════════════
// Connection loss
// ═══════════════════════════════════════════════

TEST_F(ConsoleRoundtripTest, ReconnectsAndReplaysAfterConsoleDrop) {
    ASSERT_TRUE(client_->connect(descriptor(console_.port(), "reconnect.interval=100ms"))
                    .has_value());
    client_->main_session().log_message("before");
    ASSERT_TRUE(console_.wait_for_packets(1, std::chrono::seconds(5)));

    console_.drop_client();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // The first send after the drop fails; the packet waits in the backlog.
    client_->main_session().log_message("after");
    ASSERT_TRUE(console_.wait_for_packets(2, std::chrono::seconds(5)));

    EXPECT_EQ(titles_of(console_.packets()), (std::vector<std::string>{"before", "after"}));
    EXPECT_EQ(console_.connections(), 2u);
    // Listener events fire after the worker releases the pipeline.
    for (int i = 0; i < 100 && listener_->connects().size() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(listener_->connects(), (std::vector<bool>{false, true}));
    EXPECT_GE(listener_->disconnects(), 1);
}

TEST_F(ConsoleRoundtripTest, RefusedPortKeepsPacketsInBacklog) {
    uint16_t closed_port = 0;
    {
        FakeConsole transient;
        closed_port = transient.port();
    }
    ASSERT_TRUE(client_->connect(descriptor(closed_port, "async.enabled=false,reconnect=false"))
                    .has_value());

    client_->main_session().log_message("parked");
    EXPECT_FALSE(client_->connected());
    EXPECT_EQ(client_->stats().backlog.count, 1u);
    EXPECT_GE(listener_->errors_of(ErrorKind::Connection), 1u);
}

// ═══════════════════════════════════════════════
// Transport timeouts
// ═══════════════════════════════════════════════

TEST_F(ConsoleRoundtripTest, LongestTimeoutStillHandshakes) {
    TcpTransport transport;
    auto banner = transport.connect("127.0.0.1", console_.port(), kMaxTimespan);
    ASSERT_TRUE(banner.has_value()) << banner.error().message;
    EXPECT_EQ(*banner, "Fake Console v1.0");
    EXPECT_TRUE(transport.send_frame(header_frame()).has_value());
}

TEST_F(ConsoleRoundtripTest, UnboundedTimeoutDoesNotWrap) {
    TcpTransport transport;
    auto banner = transport.connect("127.0.0.1", console_.port(), Milliseconds::max());
    ASSERT_TRUE(banner.has_value()) << banner.error().message;
    EXPECT_TRUE(transport.send_frame(header_frame()).has_value());
}

TEST_F(ConsoleRoundtripTest, MissingAckReportsTimeout) {
    TcpTransport transport;
    ASSERT_TRUE(transport.connect("127.0.0.1", console_.port(), std::chrono::milliseconds(200))
                    .has_value());
    console_.withhold_acks(true);

    auto sent = transport.send_frame(header_frame());
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().kind, ErrorKind::Connection);
    EXPECT_NE(sent.error().message.find("timed out"), std::string::npos) << sent.error().message;
}
