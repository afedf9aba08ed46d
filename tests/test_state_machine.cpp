#include <gtest/gtest.h>
#include "http_framing.hpp"

using namespace co::http_framing;

class StateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 每个测试前的设置
    }

    void TearDown() override {
        // 每个测试后的清理
    }

    // 完成一个不带正文的请求/响应周期
    void run_simple_cycle() {
        ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
        ASSERT_TRUE(machine_.process_event(role::client, event_kind::headers).has_value());
        ASSERT_TRUE(machine_.process_event(role::client, event_kind::end_of_message).has_value());
        ASSERT_TRUE(machine_.process_event(role::server, event_kind::response_line).has_value());
        ASSERT_TRUE(machine_.process_event(role::server, event_kind::headers).has_value());
        ASSERT_TRUE(machine_.process_event(role::server, event_kind::end_of_message).has_value());
    }

    state_machine machine_;
};

// =============================================================================
// 基本状态转换测试
// =============================================================================

TEST_F(StateMachineTest, InitialState) {
    EXPECT_EQ(machine_.state(role::client), connection_state::idle);
    EXPECT_EQ(machine_.state(role::server), connection_state::idle);
    EXPECT_TRUE(machine_.keep_alive());
    EXPECT_FALSE(machine_.has_pending_switch_proposals());
}

TEST_F(StateMachineTest, RequestLineMovesBothSides) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::send_headers);
    EXPECT_EQ(machine_.state(role::server), connection_state::send_response);

    ASSERT_TRUE(machine_.process_event(role::client, event_kind::headers).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::send_body);

    ASSERT_TRUE(machine_.process_event(role::client, event_kind::data).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::send_body);
}

TEST_F(StateMachineTest, FullCycleAndReuse) {
    run_simple_cycle();
    EXPECT_EQ(machine_.state(role::client), connection_state::done);
    EXPECT_EQ(machine_.state(role::server), connection_state::done);

    ASSERT_TRUE(machine_.start_next_cycle().has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::idle);
    EXPECT_EQ(machine_.state(role::server), connection_state::idle);
}

TEST_F(StateMachineTest, InformationalResponsesKeepServerWaiting) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    ASSERT_TRUE(machine_.process_event(role::server, event_kind::informational_response).has_value());
    EXPECT_EQ(machine_.state(role::server), connection_state::send_response);
    ASSERT_TRUE(machine_.process_event(role::server, event_kind::response_line).has_value());
    EXPECT_EQ(machine_.state(role::server), connection_state::send_headers);
}

// =============================================================================
// 非法事件测试
// =============================================================================

TEST_F(StateMachineTest, IllegalEventLeavesStateUnchanged) {
    auto result = machine_.process_event(role::client, event_kind::data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::illegal_event);
    EXPECT_NE(result.error().message.find("state=IDLE"), std::string::npos);
    EXPECT_EQ(machine_.state(role::client), connection_state::idle);
}

TEST_F(StateMachineTest, ServerCannotSendRequestLine) {
    auto result = machine_.process_event(role::server, event_kind::request_line);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::illegal_event);
}

TEST_F(StateMachineTest, StartNextCycleRequiresBothDone) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    auto result = machine_.start_next_cycle();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_reusable);
    EXPECT_EQ(machine_.state(role::client), connection_state::send_headers);
}

TEST_F(StateMachineTest, ErrorStateAcceptsNothing) {
    machine_.process_error(role::client);
    EXPECT_EQ(machine_.state(role::client), connection_state::error);

    auto result = machine_.process_event(role::client, event_kind::connection_closed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::error);
}

// =============================================================================
// Keep-Alive与连接关闭测试
// =============================================================================

TEST_F(StateMachineTest, KeepAliveDisabledForcesMustClose) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    machine_.process_keep_alive_disabled();
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::headers).has_value());
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::end_of_message).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::must_close);

    ASSERT_TRUE(machine_.process_event(role::client, event_kind::connection_closed).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::closed);
}

TEST_F(StateMachineTest, PeerCloseForcesOtherSideToMustClose) {
    run_simple_cycle();
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::connection_closed).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::closed);
    EXPECT_EQ(machine_.state(role::server), connection_state::must_close);
}

TEST_F(StateMachineTest, ErrorWhileOtherSideDone) {
    run_simple_cycle();
    machine_.process_error(role::server);
    EXPECT_EQ(machine_.state(role::client), connection_state::must_close);
}

// =============================================================================
// 协议切换测试
// =============================================================================

TEST_F(StateMachineTest, UpgradeAccepted) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::headers).has_value());
    machine_.process_client_switch_proposal(switch_event::upgrade);
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::end_of_message).has_value());
    EXPECT_EQ(machine_.state(role::client), connection_state::might_switch_protocol);

    ASSERT_TRUE(machine_.process_event(role::server, event_kind::informational_response,
                                       switch_event::upgrade).has_value());
    EXPECT_EQ(machine_.state(role::server), connection_state::switched_protocol);
    EXPECT_EQ(machine_.state(role::client), connection_state::switched_protocol);
}

TEST_F(StateMachineTest, UpgradeDeclinedByFinalResponse) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::headers).has_value());
    machine_.process_client_switch_proposal(switch_event::upgrade);
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::end_of_message).has_value());

    ASSERT_TRUE(machine_.process_event(role::server, event_kind::response_line).has_value());
    EXPECT_FALSE(machine_.has_pending_switch_proposals());
    EXPECT_EQ(machine_.state(role::client), connection_state::done);
}

TEST_F(StateMachineTest, ConnectAccepted) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::headers).has_value());
    machine_.process_client_switch_proposal(switch_event::connect);
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::end_of_message).has_value());

    ASSERT_TRUE(machine_.process_event(role::server, event_kind::response_line, switch_event::connect).has_value());
    EXPECT_EQ(machine_.state(role::server), connection_state::send_headers);
    ASSERT_TRUE(machine_.process_event(role::server, event_kind::headers, switch_event::connect).has_value());
    EXPECT_EQ(machine_.state(role::server), connection_state::switched_protocol);
    EXPECT_EQ(machine_.state(role::client), connection_state::switched_protocol);
}

TEST_F(StateMachineTest, UnproposedSwitchRejected) {
    ASSERT_TRUE(machine_.process_event(role::client, event_kind::request_line).has_value());
    auto result = machine_.process_event(role::server, event_kind::informational_response, switch_event::upgrade);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::unexpected_switch);
}

TEST_F(StateMachineTest, StateNames) {
    EXPECT_EQ(to_string(connection_state::send_body), "SEND_BODY");
    EXPECT_EQ(to_string(connection_state::might_switch_protocol), "MIGHT_SWITCH_PROTOCOL");
    EXPECT_EQ(to_string(switch_event::connect), "connect");
}
