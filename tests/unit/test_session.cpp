/**
 * @file test_session.cpp
 * @brief Unit tests for the Session logging API.
 * @author log_courier contributors
 */

#include "client/session.hpp"
#include "context/context.hpp"
#include "support/recording.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace log_courier;
using log_courier::test_support::RecordingPacketSink;

class SessionTest : public ::testing::Test {
protected:
    RecordingPacketSink sink_;
    Session session_{sink_, "Main"};
    ContextBinding binding_{std::make_shared<ExecutionContext>()};

    [[nodiscard]] const LogEntry& entry(size_t i) const { return sink_.entry(i); }
    [[nodiscard]] const Watch& watch(size_t i) const { return sink_.watch(i); }
};

// ═══════════════════════════════════════════════
// Admission
// ═══════════════════════════════════════════════

TEST_F(SessionTest, SessionLevelAdmission) {
    session_.set_level(Level::Warning);
    int built = 0;
    auto build = [&built] {
        ++built;
        return std::string{"expensive"};
    };

    for (auto level : {Level::Debug, Level::Verbose, Level::Message}) {
        session_.log_deferred(level, build);
    }
    EXPECT_TRUE(sink_.packets.empty());
    EXPECT_EQ(built, 0);

    for (auto level : {Level::Warning, Level::Error, Level::Fatal}) {
        session_.log_deferred(level, build);
    }
    EXPECT_EQ(sink_.packets.size(), 3u);
    EXPECT_EQ(built, 3);
}

TEST_F(SessionTest, DisabledClientSendsNothing) {
    sink_.enabled_flag = false;
    session_.log_fatal("x");
    session_.clear_all();
    session_.watch_int("n", 1);
    EXPECT_TRUE(sink_.packets.empty());
    EXPECT_FALSE(session_.is_on());
}

TEST_F(SessionTest, ClientLevelAlsoFilters) {
    sink_.client_level = Level::Error;
    session_.log_warning("no");
    session_.log_error("yes");
    ASSERT_EQ(sink_.packets.size(), 1u);
    EXPECT_EQ(entry(0).title, "yes");
}

TEST_F(SessionTest, InactiveSessionStillSendsControlCommands) {
    session_.set_active(false);
    session_.log_fatal("dropped");
    session_.clear_log();
    ASSERT_EQ(sink_.packets.size(), 1u);
    EXPECT_EQ(sink_.packets[0].level, Level::Control);
    EXPECT_EQ(std::get<ControlCommand>(sink_.packets[0].body).command_type,
              ControlCommandType::ClearLog);
}

TEST_F(SessionTest, DeferredPayloadsSkippedWhenRejected) {
    session_.set_level(Level::Error);
    bool ran = false;
    session_.log_binary_deferred(Level::Debug, "blob", [&ran] {
        ran = true;
        return std::vector<uint8_t>{1, 2, 3};
    });
    session_.watch_deferred(Level::Debug, "w", [&ran] {
        ran = true;
        return WatchValue{"1", WatchType::Integer};
    });
    EXPECT_FALSE(ran);
    EXPECT_TRUE(sink_.packets.empty());
}

// ═══════════════════════════════════════════════
// Log entries
// ═══════════════════════════════════════════════

TEST_F(SessionTest, EntryFieldsFilledFromOwner) {
    session_.log_warning("disk almost full");
    ASSERT_EQ(sink_.packets.size(), 1u);

    const auto& e = entry(0);
    EXPECT_EQ(sink_.packets[0].level, Level::Warning);
    EXPECT_EQ(e.entry_type, LogEntryType::Warning);
    EXPECT_EQ(e.viewer_id, ViewerId::Title);
    EXPECT_EQ(e.app_name, "TestApp");
    EXPECT_EQ(e.host_name, "test-host");
    EXPECT_EQ(e.session_name, "Main");
    EXPECT_EQ(e.color, kDefaultColor);
    EXPECT_GT(e.process_id, 0);
    EXPECT_GT(e.thread_id, 0);
    EXPECT_GT(e.timestamp.time_since_epoch().count(), 0);
}

TEST_F(SessionTest, LevelSelectsEntryType) {
    session_.log_debug("d");
    session_.log_verbose("v");
    session_.log_message("m");
    session_.log_error("e");
    session_.log_fatal("f");
    EXPECT_EQ(entry(0).entry_type, LogEntryType::Debug);
    EXPECT_EQ(entry(1).entry_type, LogEntryType::Verbose);
    EXPECT_EQ(entry(2).entry_type, LogEntryType::Message);
    EXPECT_EQ(entry(3).entry_type, LogEntryType::Error);
    EXPECT_EQ(entry(4).entry_type, LogEntryType::Fatal);
}

TEST_F(SessionTest, MessageBuilderJoinsFragments) {
    session_.log(Level::Message, MessageBuilder{"retry", 3, "of", 5, "after", 1.5, "s", true});
    EXPECT_EQ(entry(0).title, "retry 3 of 5 after 1.5 s true");

    MessageBuilder streamed;
    streamed << "user" << 'x' << 42u;
    EXPECT_EQ(streamed.str(), "user x 42");
}

TEST_F(SessionTest, ScopeTagsAndInlineContext) {
    TagScope scope(ContextMap{{"tenant", "acme"}, {"region", "eu"}});
    auto correlation = begin_correlation("checkout");

    session_.log_with_context(Level::Message, "charged", {{"region", "us"}});
    const auto& e = entry(0);
    EXPECT_EQ(e.context, (ContextMap{{"region", "us"}, {"tenant", "acme"}}));
    EXPECT_EQ(e.correlation_id, correlation.correlation_id());
    EXPECT_EQ(e.operation_name, "checkout");
}

TEST_F(SessionTest, ColoredAndSessionColor) {
    session_.log_colored(colors::Red, "red");
    session_.set_color(colors::Blue);
    session_.log_message("blue");
    session_.reset_color();
    session_.log_message("default");

    EXPECT_EQ(entry(0).color, colors::Red);
    EXPECT_EQ(entry(1).color, colors::Blue);
    EXPECT_EQ(entry(2).color, kDefaultColor);
}

TEST_F(SessionTest, TextPayloadCarriesBom) {
    session_.log_text("notes", "hello");
    session_.log_source("query", "SELECT 1", SourceId::Sql);

    const std::vector<uint8_t> expected = {0xEF, 0xBB, 0xBF, 'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(entry(0).entry_type, LogEntryType::Text);
    EXPECT_EQ(entry(0).viewer_id, ViewerId::Data);
    EXPECT_EQ(entry(0).data, expected);

    EXPECT_EQ(entry(1).entry_type, LogEntryType::Source);
    EXPECT_EQ(entry(1).viewer_id, ViewerId::SqlSource);
    EXPECT_EQ(entry(1).data.size(), 3u + 8u);
}

TEST_F(SessionTest, BinaryEntry) {
    session_.log_binary("bytes", {0x00, 0xFF});
    EXPECT_EQ(entry(0).entry_type, LogEntryType::Binary);
    EXPECT_EQ(entry(0).viewer_id, ViewerId::Binary);
    EXPECT_EQ(entry(0).data, (std::vector<uint8_t>{0x00, 0xFF}));
}

TEST_F(SessionTest, ExceptionIsErrorWithDetails) {
    session_.log_exception(std::runtime_error("socket closed"));
    ASSERT_EQ(sink_.packets.size(), 1u);
    EXPECT_EQ(sink_.packets[0].level, Level::Error);
    EXPECT_EQ(entry(0).title, "socket closed");
    EXPECT_EQ(entry(0).viewer_id, ViewerId::Data);
    ASSERT_GE(entry(0).data.size(), 3u);
    EXPECT_EQ(entry(0).data[0], 0xEF);

    session_.log_exception(std::runtime_error("x"), "while saving");
    EXPECT_EQ(entry(1).title, "while saving");
}

TEST_F(SessionTest, AssertAndConditional) {
    session_.log_assert(true, "fine");
    session_.log_assert(false, "broken invariant");
    session_.log_conditional(false, "skipped");
    session_.log_conditional(true, "taken");

    ASSERT_EQ(sink_.packets.size(), 2u);
    EXPECT_EQ(sink_.packets[0].level, Level::Error);
    EXPECT_EQ(entry(0).entry_type, LogEntryType::Assert);
    EXPECT_EQ(entry(1).entry_type, LogEntryType::Conditional);
    EXPECT_EQ(sink_.packets[1].level, Level::Message);
}

TEST_F(SessionTest, SeparatorUsesDefaultLevel) {
    sink_.default_level_value = Level::Warning;
    session_.log_separator();
    EXPECT_EQ(sink_.packets[0].level, Level::Warning);
    EXPECT_EQ(entry(0).entry_type, LogEntryType::Separator);
}

TEST_F(SessionTest, StreamPacket) {
    session_.log_stream("cpu", "0.42", "gauge", "host");
    const auto& s = std::get<StreamPacket>(sink_.packets.at(0).body);
    EXPECT_EQ(s.channel, "cpu");
    EXPECT_EQ(s.data, "0.42");
    EXPECT_EQ(s.stream_type, "gauge");
    EXPECT_EQ(s.group, "host");
}

// ═══════════════════════════════════════════════
// Watches
// ═══════════════════════════════════════════════

TEST_F(SessionTest, TypedWatches) {
    session_.watch_string("name", "value", "grp");
    session_.watch_int("count", 255, {}, true);
    session_.watch_float("ratio", 0.25);
    session_.watch_bool("ready", true);

    EXPECT_EQ(watch(0).watch_type, WatchType::String);
    EXPECT_EQ(watch(0).group, "grp");
    EXPECT_EQ(watch(1).value, "255 (0x000000ff)");
    EXPECT_EQ(watch(1).watch_type, WatchType::Integer);
    EXPECT_EQ(watch(2).value, "0.25");
    EXPECT_EQ(watch(2).watch_type, WatchType::Float);
    EXPECT_EQ(watch(3).value, "true");
    EXPECT_EQ(watch(3).watch_type, WatchType::Boolean);
}

TEST_F(SessionTest, LabeledMetric) {
    session_.metric("http_requests").with_label("route", "/api").for_instance("web-1")
            .with_level(Level::Verbose).set(42);
    session_.watch_with_labels("latency_ms", 12.5, ContextMap{{"route", "/api"}});

    EXPECT_EQ(sink_.packets[0].level, Level::Verbose);
    EXPECT_EQ(watch(0).name, "http_requests");
    EXPECT_EQ(watch(0).value, "42");
    EXPECT_EQ(watch(0).labels, (ContextMap{{"instance", "web-1"}, {"route", "/api"}}));
    EXPECT_EQ(sink_.packets[1].level, Level::Message);
    EXPECT_EQ(watch(1).watch_type, WatchType::Float);
}

TEST(WatchValueTest, MakeWatchValue) {
    EXPECT_EQ(make_watch_value(false).text, "false");
    EXPECT_EQ(make_watch_value(-7).type, WatchType::Integer);
    EXPECT_EQ(make_watch_value(std::string{"s"}).type, WatchType::String);
    EXPECT_EQ(format_double(3.0), "3");
}

// ═══════════════════════════════════════════════
// Counters, checkpoints, timers
// ═══════════════════════════════════════════════

TEST_F(SessionTest, CountersAreIntegerWatches) {
    session_.inc_counter("jobs");
    session_.inc_counter("jobs");
    session_.dec_counter("jobs");
    EXPECT_EQ(session_.counter("jobs"), 1);
    EXPECT_EQ(watch(2).value, "1");
    EXPECT_EQ(watch(2).watch_type, WatchType::Integer);

    session_.reset_counter("jobs");
    EXPECT_EQ(session_.counter("jobs"), 0);
    session_.inc_counter("jobs");
    EXPECT_EQ(watch(3).value, "1");
}

TEST_F(SessionTest, RejectedCounterDoesNotChange) {
    session_.set_level(Level::Error);
    session_.inc_counter(Level::Debug, "jobs");
    EXPECT_EQ(session_.counter("jobs"), 0);
}

TEST_F(SessionTest, ConcurrentCountersLoseNothing) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 250; ++i) session_.inc_counter(Level::Debug, "hits");
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(session_.counter("hits"), 1000);
}

TEST_F(SessionTest, CheckpointTitles) {
    session_.add_checkpoint();
    session_.add_checkpoint();
    session_.add_checkpoint("load");
    session_.add_checkpoint("load", "cache warm");
    session_.reset_checkpoint();
    session_.add_checkpoint();

    EXPECT_EQ(entry(0).title, "Checkpoint #1");
    EXPECT_EQ(entry(1).title, "Checkpoint #2");
    EXPECT_EQ(entry(2).title, "load #1");
    EXPECT_EQ(entry(3).title, "load #2 (cache warm)");
    EXPECT_EQ(entry(4).title, "Checkpoint #1");
    EXPECT_EQ(entry(0).entry_type, LogEntryType::Checkpoint);
}

TEST_F(SessionTest, TimerReportsElapsed) {
    session_.time_start("parse");
    session_.time_end("parse");

    ASSERT_EQ(sink_.packets.size(), 3u);
    EXPECT_EQ(entry(0).title, "Timer \"parse\" started");
    EXPECT_EQ(watch(1).name, "parse");
    EXPECT_EQ(watch(1).watch_type, WatchType::Float);
    EXPECT_EQ(entry(2).title.rfind("Timer \"parse\": ", 0), 0u);
    EXPECT_NE(entry(2).title.find("ms"), std::string::npos);
}

TEST_F(SessionTest, UnknownTimerWarns) {
    session_.time_end("never");
    ASSERT_EQ(sink_.packets.size(), 1u);
    EXPECT_EQ(sink_.packets[0].level, Level::Warning);
    EXPECT_EQ(entry(0).title, "Timer \"never\" not found");
}

// ═══════════════════════════════════════════════
// Process flow and control
// ═══════════════════════════════════════════════

TEST_F(SessionTest, TrackMethodEntersAndLeaves) {
    {
        auto scope = session_.track_method("load_config");
    }
    ASSERT_EQ(sink_.packets.size(), 4u);
    EXPECT_EQ(entry(0).entry_type, LogEntryType::EnterMethod);
    EXPECT_EQ(std::get<ProcessFlow>(sink_.packets[1].body).flow_type, ProcessFlowType::EnterMethod);
    EXPECT_EQ(entry(2).entry_type, LogEntryType::LeaveMethod);
    EXPECT_EQ(std::get<ProcessFlow>(sink_.packets[3].body).title, "load_config");
}

TEST_F(SessionTest, EnterProcessAlsoEntersMainThread) {
    session_.enter_process();
    ASSERT_EQ(sink_.packets.size(), 2u);
    const auto& process = std::get<ProcessFlow>(sink_.packets[0].body);
    const auto& thread = std::get<ProcessFlow>(sink_.packets[1].body);
    EXPECT_EQ(process.flow_type, ProcessFlowType::EnterProcess);
    EXPECT_EQ(process.title, "TestApp");
    EXPECT_EQ(thread.flow_type, ProcessFlowType::EnterThread);
    EXPECT_EQ(thread.title, "Main Thread");
}

TEST_F(SessionTest, ClearCommandsAreControlLevel) {
    session_.clear_all();
    session_.clear_watches();
    session_.clear_auto_views();
    session_.clear_process_flow();

    ASSERT_EQ(sink_.packets.size(), 4u);
    for (const auto& packet : sink_.packets) {
        EXPECT_EQ(packet.level, Level::Control);
    }
    EXPECT_EQ(std::get<ControlCommand>(sink_.packets[3].body).command_type,
              ControlCommandType::ClearProcessFlow);
}
