#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "bridge/message_router.hpp"
#include "bridge/request_correlator.hpp"
#include "fake_transport.hpp"

namespace {

using namespace std::chrono_literals;
using hostlink::bridge::ConnectionSupervisor;
using hostlink::bridge::MessageRouter;
using hostlink::bridge::PeerRole;
using hostlink::bridge::RequestCorrelator;
using hostlink::core::errors::BridgeError;
using hostlink::core::errors::ErrorCategory;
using hostlink::core::errors::get_error;
using hostlink::core::errors::get_value;
using hostlink::core::errors::is_error;
using hostlink::protocol::MessageKind;
using hostlink::protocol::RequestTable;
using hostlink::testing::FakeTransport;
using hostlink::testing::ManualClock;
using hostlink::testing::wait_until;
using nlohmann::json;

// Answers each object-details command with the object's name, in the order
// the commands reach the wire, the way the host's single privileged context
// does.
class EchoingTransport : public FakeTransport {
public:
    hostlink::core::errors::Status send_text(const std::string& text) override {
        auto sent = FakeTransport::send_text(text);
        if (is_error(sent)) {
            return sent;
        }
        const auto decoded = hostlink::protocol::decode_envelope(text);
        if (!is_error(decoded) && get_value(decoded).type() == MessageKind::GetObjectDetails) {
            push_message(MessageKind::ObjectDetails,
                         json{{"name", get_value(decoded).payload.at("objectName")}});
        }
        return sent;
    }
};

class RequestCorrelatorTest : public ::testing::Test {
protected:
    RequestCorrelatorTest()
        : supervisor_(hostlink::testing::test_options(PeerRole::Accepting, clock_)),
          router_(supervisor_),
          correlator_(router_, RequestTable(2000ms, 2000ms)),
          transport_(std::make_shared<FakeTransport>()) {
        supervisor_.accept(transport_);
    }

    ~RequestCorrelatorTest() override { supervisor_.shutdown(); }

    bool sent_count(MessageKind kind, std::size_t count) {
        return wait_until([&] { return transport_->count_sent(kind) == count; });
    }

    ManualClock clock_;
    ConnectionSupervisor supervisor_;
    MessageRouter router_;
    RequestCorrelator correlator_;
    std::shared_ptr<FakeTransport> transport_;
};

TEST_F(RequestCorrelatorTest, ResolvesWithReplyPayload) {
    auto pending = correlator_.request_async(MessageKind::GetObjectDetails,
                                             json{{"objectName", "Cube"}});
    ASSERT_TRUE(sent_count(MessageKind::GetObjectDetails, 1));
    EXPECT_EQ(transport_->sent_envelopes().back().payload["objectName"], "Cube");

    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "Cube"}, {"active", true}});

    const auto result = pending.get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["name"], "Cube");
    EXPECT_EQ(correlator_.pending_count(), 0u);
}

TEST_F(RequestCorrelatorTest, RepliesResolveWaitersInSendOrder) {
    auto first = correlator_.request_async(MessageKind::GetObjectDetails,
                                           json{{"objectName", "A"}});
    ASSERT_TRUE(wait_until([this] {
        return correlator_.pending_count(MessageKind::GetObjectDetails) == 1;
    }));
    auto second = correlator_.request_async(MessageKind::GetObjectDetails,
                                            json{{"objectName", "B"}});
    ASSERT_TRUE(wait_until([this] {
        return correlator_.pending_count(MessageKind::ObjectDetails) == 2;
    }));

    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "A"}});
    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "B"}});

    EXPECT_EQ(get_value(first.get())["name"], "A");
    EXPECT_EQ(get_value(second.get())["name"], "B");
}

TEST_F(RequestCorrelatorTest, ConcurrentCallersGetTheirOwnReply) {
    auto echo = std::make_shared<EchoingTransport>();
    supervisor_.accept(echo);
    ASSERT_TRUE(supervisor_.is_usable());

    constexpr int kThreads = 8;
    constexpr int kRequestsPerThread = 100;
    std::vector<int> mismatched(kThreads, 0);
    std::vector<int> failed(kThreads, 0);
    std::vector<std::thread> callers;
    for (int t = 0; t < kThreads; ++t) {
        callers.emplace_back([&, t] {
            for (int i = 0; i < kRequestsPerThread; ++i) {
                const std::string name = std::to_string(t) + ":" + std::to_string(i);
                const auto result = correlator_.request(MessageKind::GetObjectDetails,
                                                        json{{"objectName", name}});
                if (is_error(result)) {
                    ++failed[t];
                } else if (get_value(result)["name"] != name) {
                    ++mismatched[t];
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(failed[t], 0) << "thread " << t;
        EXPECT_EQ(mismatched[t], 0) << "thread " << t;
    }
    EXPECT_EQ(correlator_.pending_count(), 0u);
    EXPECT_EQ(correlator_.dropped_replies(), 0u);
}

TEST_F(RequestCorrelatorTest, RepliesOnlyResolveTheirOwnKind) {
    auto details = correlator_.request_async(MessageKind::GetObjectDetails,
                                             json{{"objectName", "A"}});
    auto state = correlator_.request_async(MessageKind::GetState, json::object());
    ASSERT_TRUE(wait_until([this] { return correlator_.pending_count() == 2; }));

    transport_->push_message(MessageKind::State, json{{"playMode", false}});

    const auto state_result = state.get();
    ASSERT_FALSE(is_error(state_result));
    EXPECT_EQ(get_value(state_result)["playMode"], false);
    EXPECT_EQ(correlator_.pending_count(MessageKind::GetObjectDetails), 1u);

    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "A"}});
    EXPECT_FALSE(is_error(details.get()));
}

TEST_F(RequestCorrelatorTest, SingleFlightRejectsSecondScreenshot) {
    auto first = correlator_.request_async(MessageKind::TakeScreenshot, json::object());
    ASSERT_TRUE(wait_until([this] {
        return correlator_.pending_count(MessageKind::TakeScreenshot) == 1;
    }));

    const auto second = correlator_.request(MessageKind::TakeScreenshot, json::object());
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "request_in_flight");
    EXPECT_EQ(transport_->count_sent(MessageKind::TakeScreenshot), 1u);

    transport_->push_message(MessageKind::Screenshot, json{{"base64", "AAAA"}});
    EXPECT_FALSE(is_error(first.get()));
}

TEST_F(RequestCorrelatorTest, ErrorReplyIsHandlerFailure) {
    auto pending = correlator_.request_async(MessageKind::ManipulateScene,
                                             json{{"action", "delete_game_object"}, {"name", "X"}});
    ASSERT_TRUE(sent_count(MessageKind::ManipulateScene, 1));

    transport_->push_message(MessageKind::SceneManipulationResult,
                             json{{"error", "GameObject 'X' not found"}});

    const auto result = pending.get();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Handler);
    EXPECT_EQ(get_error(result).code, "handler_failed");
    EXPECT_EQ(get_error(result).message, "GameObject 'X' not found");
    EXPECT_TRUE(supervisor_.is_usable());
}

TEST_F(RequestCorrelatorTest, NullErrorFieldIsSuccess) {
    auto pending = correlator_.request_async(MessageKind::ManageAssets,
                                             json{{"action", "refresh"}});
    ASSERT_TRUE(sent_count(MessageKind::ManageAssets, 1));

    transport_->push_message(MessageKind::AssetManagementResult,
                             json{{"error", nullptr}, {"message", "done"}});

    EXPECT_FALSE(is_error(pending.get()));
}

TEST_F(RequestCorrelatorTest, TimeoutRemovesWaiterAndDropsLateReply) {
    const auto result =
        correlator_.request(MessageKind::GetObjectDetails, json{{"objectName", "Slow"}}, 50ms);

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(result).code, "reply_timeout");
    EXPECT_EQ(correlator_.pending_count(), 0u);

    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "Slow"}});
    ASSERT_TRUE(wait_until([this] { return correlator_.dropped_replies() == 1; }));
    EXPECT_TRUE(supervisor_.is_usable());
}

TEST_F(RequestCorrelatorTest, LateReplyDoesNotResolveNextRequest) {
    const auto timed_out =
        correlator_.request(MessageKind::GetObjectDetails, json{{"objectName", "Old"}}, 30ms);
    ASSERT_TRUE(is_error(timed_out));
    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "Old"}});
    ASSERT_TRUE(wait_until([this] { return correlator_.dropped_replies() == 1; }));

    auto fresh = correlator_.request_async(MessageKind::GetObjectDetails,
                                           json{{"objectName", "New"}});
    ASSERT_TRUE(sent_count(MessageKind::GetObjectDetails, 2));
    transport_->push_message(MessageKind::ObjectDetails, json{{"name", "New"}});

    EXPECT_EQ(get_value(fresh.get())["name"], "New");
}

TEST_F(RequestCorrelatorTest, DisconnectRejectsEveryWaiter) {
    auto details = correlator_.request_async(MessageKind::GetObjectDetails,
                                             json{{"objectName", "A"}});
    auto state = correlator_.request_async(MessageKind::GetState, json::object());
    ASSERT_TRUE(wait_until([this] { return correlator_.pending_count() == 2; }));

    supervisor_.disconnect(BridgeError{ErrorCategory::Transport, "socket closed",
                                       "connection_lost"});

    for (auto* future : {&details, &state}) {
        ASSERT_EQ(future->wait_for(1s), std::future_status::ready);
        const auto result = future->get();
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "connection_lost");
    }
    EXPECT_EQ(correlator_.pending_count(), 0u);
}

TEST_F(RequestCorrelatorTest, FailsFastWhenNotConnected) {
    supervisor_.disconnect(BridgeError{ErrorCategory::Transport, "gone", "connection_lost"});
    const auto before = transport_->sent().size();

    const auto result = correlator_.request(MessageKind::GetState, json::object());

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "peer_not_connected");
    EXPECT_EQ(transport_->sent().size(), before);
    EXPECT_EQ(correlator_.pending_count(), 0u);
}

TEST_F(RequestCorrelatorTest, SendFailureLeavesNothingPending) {
    transport_->fail_sends(true);

    const auto result = correlator_.request(MessageKind::GetState, json::object());

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "send_failed");
    EXPECT_EQ(correlator_.pending_count(), 0u);
    EXPECT_FALSE(supervisor_.is_usable());
}

TEST_F(RequestCorrelatorTest, RejectsKindsWithoutReply) {
    const auto result = correlator_.request(MessageKind::Ping, json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unsupported_command");
}

TEST_F(RequestCorrelatorTest, UnsolicitedReplyIsDropped) {
    transport_->push_message(MessageKind::CommandResult, json{{"result", 1}});

    ASSERT_TRUE(wait_until([this] { return correlator_.dropped_replies() == 1; }));
    EXPECT_TRUE(supervisor_.is_usable());
}

}  // namespace
