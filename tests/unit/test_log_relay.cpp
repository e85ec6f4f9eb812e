#include <atomic>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "bridge/log_relay.hpp"
#include "bridge/message_router.hpp"
#include "core/logging/logger.hpp"
#include "fake_transport.hpp"

namespace {

using hostlink::bridge::ConnectionSupervisor;
using hostlink::bridge::filter_logs;
using hostlink::bridge::HostLogForwarder;
using hostlink::bridge::LogBuffer;
using hostlink::bridge::LogCollector;
using hostlink::bridge::LogQuery;
using hostlink::bridge::MessageRouter;
using hostlink::bridge::parse_log_query;
using hostlink::bridge::PeerRole;
using hostlink::bridge::query_logs;
using hostlink::core::errors::get_error;
using hostlink::core::errors::get_value;
using hostlink::core::errors::is_error;
using hostlink::core::logging::LogEvent;
using hostlink::core::logging::LogLevel;
using hostlink::protocol::LogRecord;
using hostlink::protocol::MessageKind;
using hostlink::protocol::Severity;
using hostlink::testing::FakeTransport;
using hostlink::testing::ManualClock;
using hostlink::testing::wait_until;
using nlohmann::json;

LogRecord make_record(const std::string& message, Severity severity,
                      const std::string& timestamp, const std::string& stack = "") {
    LogRecord record;
    record.message = message;
    record.severity = severity;
    record.timestamp = timestamp;
    record.stack_trace = stack;
    return record;
}

std::vector<LogRecord> sample_records() {
    return {
        make_record("Game started", Severity::Log, "2024-01-15T10:00:00.000Z"),
        make_record("Texture missing", Severity::Warning, "2024-01-15T10:01:00.000Z"),
        make_record("NullReferenceException", Severity::Exception, "2024-01-15T10:02:00.000Z",
                    "at Player.Update()"),
        make_record("Shader failed", Severity::Error, "2024-01-15T10:03:00.000Z",
                    "at Renderer.Draw()"),
        make_record("Game saved", Severity::Log, "2024-01-15T10:04:00.000Z"),
    };
}

LogQuery parse(const json& arguments) {
    auto query = parse_log_query(arguments);
    EXPECT_FALSE(is_error(query)) << arguments.dump();
    return is_error(query) ? LogQuery{} : get_value(query);
}

std::vector<std::string> messages(const std::vector<LogRecord>& records) {
    std::vector<std::string> result;
    for (const auto& record : records) {
        result.push_back(record.message);
    }
    return result;
}

TEST(LoggerTest, ThrowingListenerDoesNotEscapeLogCall) {
    auto& logger = hostlink::core::logging::Logger::get();
    std::ostringstream out;
    logger.set_stream(out);
    std::atomic<int> later_calls{0};
    const auto throwing = logger.add_listener(
        [](const LogEvent&) { throw std::runtime_error("listener broke"); });
    const auto counting = logger.add_listener([&later_calls](const LogEvent&) { ++later_calls; });

    EXPECT_NO_THROW(LOG_WARN("still logged"));

    logger.remove_listener(throwing);
    logger.remove_listener(counting);
    logger.set_stream(std::cerr);
    EXPECT_GE(later_calls.load(), 1);
    EXPECT_NE(out.str().find("still logged"), std::string::npos);
    EXPECT_NE(out.str().find("Log listener failed: listener broke"), std::string::npos);
}

TEST(LogBufferTest, EvictsOldestBeyondCapacity) {
    LogBuffer buffer(3);
    for (int i = 0; i < 5; ++i) {
        buffer.append(make_record("m" + std::to_string(i), Severity::Log, ""));
    }

    ASSERT_EQ(buffer.size(), 3u);
    EXPECT_EQ(messages(buffer.snapshot()), (std::vector<std::string>{"m2", "m3", "m4"}));

    buffer.clear();
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(LogQueryTest, DefaultsReturnMostRecentHundred) {
    const auto query = parse(json());
    EXPECT_EQ(query.count, 100u);
    EXPECT_TRUE(query.severities.empty());
    EXPECT_TRUE(query.fields.empty());

    std::vector<LogRecord> records;
    for (int i = 0; i < 150; ++i) {
        records.push_back(make_record("m" + std::to_string(i), Severity::Log, ""));
    }
    const auto result = filter_logs(records, query);
    ASSERT_EQ(result.size(), 100u);
    EXPECT_EQ(result.front().message, "m50");
    EXPECT_EQ(result.back().message, "m149");
}

TEST(LogQueryTest, FiltersBySeverity) {
    const auto query = parse(json{{"types", json::array({"Error", "Exception"})}});
    EXPECT_EQ(messages(filter_logs(sample_records(), query)),
              (std::vector<std::string>{"NullReferenceException", "Shader failed"}));
}

TEST(LogQueryTest, SubstringFiltersAreCaseSensitive) {
    EXPECT_EQ(messages(filter_logs(sample_records(), parse(json{{"messageContains", "Game"}}))),
              (std::vector<std::string>{"Game started", "Game saved"}));
    EXPECT_TRUE(filter_logs(sample_records(), parse(json{{"messageContains", "game"}})).empty());
    EXPECT_EQ(
        messages(filter_logs(sample_records(), parse(json{{"stackTraceContains", "Player"}}))),
        (std::vector<std::string>{"NullReferenceException"}));
}

TEST(LogQueryTest, TimeRangeIsInclusive) {
    const auto query = parse(json{{"timestampAfter", "2024-01-15T10:01:00Z"},
                                  {"timestampBefore", "2024-01-15T10:03:00Z"}});
    EXPECT_EQ(messages(filter_logs(sample_records(), query)),
              (std::vector<std::string>{"Texture missing", "NullReferenceException",
                                        "Shader failed"}));
}

TEST(LogQueryTest, UnreadableRecordTimestampsPassRangeFilters) {
    auto records = sample_records();
    records.push_back(make_record("Clockless", Severity::Log, "not a time"));

    const auto query = parse(json{{"timestampAfter", "2030-01-01T00:00:00Z"}});
    EXPECT_EQ(messages(filter_logs(records, query)), (std::vector<std::string>{"Clockless"}));
}

TEST(LogQueryTest, CountAppliesAfterFiltering) {
    const auto query = parse(json{{"types", json::array({"Log"})}, {"count", 1}});
    EXPECT_EQ(messages(filter_logs(sample_records(), query)),
              (std::vector<std::string>{"Game saved"}));
}

TEST(LogQueryTest, ProjectsSelectedFields) {
    LogBuffer buffer;
    for (const auto& record : sample_records()) {
        buffer.append(record);
    }

    const auto result = query_logs(buffer, parse(json{{"fields", json::array({"message", "severity"})},
                                                      {"count", 2}}));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (json{{"message", "Shader failed"}, {"severity", "Error"}}));
    EXPECT_FALSE(result[1].contains("timestamp"));
}

TEST(LogQueryTest, FullRecordsWithoutFieldSelection) {
    LogBuffer buffer;
    buffer.append(sample_records()[2]);

    const auto result = query_logs(buffer, parse(json::object()));

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0]["stackTrace"], "at Player.Update()");
    EXPECT_EQ(result[0]["severity"], "Exception");
    EXPECT_EQ(result[0]["timestamp"], "2024-01-15T10:02:00.000Z");
}

TEST(LogQueryTest, EmptyNeedlesAndTypesFilterNothing) {
    const auto query = parse(json{{"types", json::array()}, {"messageContains", ""}});
    EXPECT_EQ(filter_logs(sample_records(), query).size(), 5u);
}

TEST(LogQueryTest, RejectsInvalidArguments) {
    const json invalid[] = {
        json::array(),
        json{{"types", json::array({"Verbose"})}},
        json{{"types", "Error"}},
        json{{"count", 0}},
        json{{"count", 1001}},
        json{{"count", "10"}},
        json{{"count", 2.5}},
        json{{"fields", json::array({"level"})}},
        json{{"messageContains", 5}},
        json{{"timestampAfter", "yesterday"}},
    };
    for (const auto& arguments : invalid) {
        const auto query = parse_log_query(arguments);
        ASSERT_TRUE(is_error(query)) << arguments.dump();
        EXPECT_EQ(get_error(query).code, "invalid_argument") << arguments.dump();
    }
}

TEST(LogSeverityTest, MapsLoggerLevels) {
    EXPECT_EQ(hostlink::bridge::severity_for(LogLevel::DEBUG), Severity::Log);
    EXPECT_EQ(hostlink::bridge::severity_for(LogLevel::INFO), Severity::Log);
    EXPECT_EQ(hostlink::bridge::severity_for(LogLevel::WARN), Severity::Warning);
    EXPECT_EQ(hostlink::bridge::severity_for(LogLevel::ERROR), Severity::Error);
}

class LogRelayTest : public ::testing::Test {
protected:
    LogRelayTest()
        : supervisor_(hostlink::testing::test_options(PeerRole::Accepting, clock_)),
          router_(supervisor_) {}

    ~LogRelayTest() override { supervisor_.shutdown(); }

    LogEvent event(LogLevel level, const std::string& message) {
        return LogEvent{level, message, std::chrono::system_clock::now()};
    }

    ManualClock clock_;
    ConnectionSupervisor supervisor_;
    MessageRouter router_;
};

TEST_F(LogRelayTest, ForwarderBuffersLocallyWhileDisconnected) {
    LogBuffer buffer;
    HostLogForwarder forwarder(router_, buffer);

    forwarder.forward(event(LogLevel::WARN, "offline warning"));

    ASSERT_EQ(buffer.size(), 1u);
    EXPECT_EQ(buffer.snapshot()[0].severity, Severity::Warning);
    EXPECT_EQ(forwarder.forwarded(), 0u);
    EXPECT_EQ(forwarder.failed(), 0u);
}

TEST_F(LogRelayTest, ForwarderSendsLogEnvelopesWhenConnected) {
    auto transport = std::make_shared<FakeTransport>();
    supervisor_.accept(transport);
    LogBuffer buffer;
    HostLogForwarder forwarder(router_, buffer);

    forwarder.forward(event(LogLevel::ERROR, "boom"));

    const auto sent = transport->sent_envelopes();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].type(), MessageKind::Log);
    EXPECT_EQ(sent[0].payload["message"], "boom");
    EXPECT_EQ(sent[0].payload["severity"], "Error");
    EXPECT_EQ(forwarder.forwarded(), 1u);
}

TEST_F(LogRelayTest, ForwarderCountsFailedSends) {
    auto transport = std::make_shared<FakeTransport>();
    supervisor_.accept(transport);
    transport->fail_sends(true);
    LogBuffer buffer;
    HostLogForwarder forwarder(router_, buffer);

    forwarder.forward(event(LogLevel::INFO, "lost"));

    EXPECT_EQ(forwarder.failed(), 1u);
    EXPECT_EQ(buffer.size(), 1u);
    EXPECT_FALSE(supervisor_.is_usable());
}

TEST_F(LogRelayTest, ForwarderFollowsTheProcessLogger) {
    auto transport = std::make_shared<FakeTransport>();
    supervisor_.accept(transport);
    LogBuffer buffer;
    HostLogForwarder forwarder(router_, buffer);

    forwarder.attach();
    LOG_WARN("attached warning");
    forwarder.detach();
    LOG_WARN("detached warning");

    const auto records = buffer.snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "attached warning");
    EXPECT_EQ(transport->count_sent(MessageKind::Log), 1u);
}

TEST_F(LogRelayTest, CollectorStoresInboundRecords) {
    LogBuffer buffer;
    LogCollector collector(router_, buffer);
    auto transport = std::make_shared<FakeTransport>();
    supervisor_.accept(transport);

    transport->push_message(MessageKind::Log,
                            json{{"message", "from host"},
                                 {"stackTrace", ""},
                                 {"severity", "Assert"},
                                 {"timestamp", "2024-01-15T10:00:00.000Z"}});
    transport->push_message(MessageKind::Log, json{{"severity", "Error"}});
    transport->push_message(MessageKind::Log, json{{"message", "second"}});

    ASSERT_TRUE(wait_until([&buffer] { return buffer.size() == 2; }));
    const auto records = buffer.snapshot();
    EXPECT_EQ(records[0].severity, Severity::Assert);
    EXPECT_EQ(records[1].message, "second");
    supervisor_.shutdown();
}

}  // namespace
