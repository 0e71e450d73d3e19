/**
 * @file SubscriptionManagerTest.cpp
 * @brief Unit tests for the single-channel subscribe / unsubscribe lifecycle
 */

#include <gtest/gtest.h>
#include "Errors.hpp"
#include "FakeStreamSocket.hpp"
#include "SubscriptionManager.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;
using namespace std::chrono_literals;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class SubscriptionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        connector = std::make_shared<FakeStreamConnector>();
    }

    std::unique_ptr<SubscriptionManager> make_manager(RetryPolicy retry = {}) {
        return std::make_unique<SubscriptionManager>(
            connector, "wss://stream.test/ws", retry, false,
            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    static IStreamSocket::MessageHandler ignore_frames() {
        return [](const std::string&) {};
    }

    std::shared_ptr<FakeStreamConnector> connector;
    std::vector<std::chrono::milliseconds> sleeps;
};

// ============================================================================
// START
// ============================================================================

TEST_F(SubscriptionManagerTest, Constructor_NullConnector_Throws) {
    EXPECT_THROW(SubscriptionManager(nullptr, "wss://stream.test/ws"), std::invalid_argument);
}

TEST_F(SubscriptionManagerTest, Start_OpensSocketOnConfiguredUrl) {
    auto manager = make_manager();

    manager->start({"BTC-USDT"}, ignore_frames());

    ASSERT_EQ(connector->records.size(), 1u);
    EXPECT_EQ(connector->last().url, "wss://stream.test/ws");
    EXPECT_TRUE(manager->is_active());
}

TEST_F(SubscriptionManagerTest, Start_SubscribeSentOnlyOnceOpen) {
    auto manager = make_manager();
    manager->start({"btc-usdt", "eth-usdt"}, ignore_frames());

    EXPECT_TRUE(connector->last().sent.empty());

    connector->last_socket().open_now();

    ASSERT_EQ(connector->last().sent.size(), 1u);
    auto frame = json::parse(connector->last().sent[0]);
    EXPECT_EQ(frame["op"], "subscribe");
    ASSERT_EQ(frame["args"].size(), 2u);
    EXPECT_EQ(frame["args"][0]["channel"], "tickers");
    EXPECT_EQ(frame["args"][0]["instId"], "BTC-USDT");
    EXPECT_EQ(frame["args"][1]["instId"], "ETH-USDT");
}

TEST_F(SubscriptionManagerTest, Start_FramesReachHandler) {
    std::vector<std::string> frames;
    auto manager = make_manager();
    manager->start({"BTC-USDT"}, [&](const std::string& f) { frames.push_back(f); });

    connector->last_socket().open_now();
    connector->last_socket().deliver("one");
    connector->last_socket().deliver("two");

    EXPECT_EQ(frames, (std::vector<std::string>{"one", "two"}));
}

TEST_F(SubscriptionManagerTest, Start_WhileActive_ThrowsInvalidState) {
    auto manager = make_manager();
    manager->start({"BTC-USDT"}, ignore_frames());

    EXPECT_THROW(manager->start({"ETH-USDT"}, ignore_frames()), InvalidStateError);
    EXPECT_EQ(connector->records.size(), 1u);
}

TEST_F(SubscriptionManagerTest, ActiveMessage_TracksState) {
    auto manager = make_manager();
    EXPECT_EQ(manager->active_message(), nullptr);

    manager->start({"BTC-USDT"}, ignore_frames());
    ASSERT_NE(manager->active_message(), nullptr);
    EXPECT_EQ(manager->active_message()->op, SubscriptionOp::Subscribe);

    ASSERT_TRUE(manager->stop());
    EXPECT_EQ(manager->active_message(), nullptr);
}

// ============================================================================
// STOP
// ============================================================================

TEST_F(SubscriptionManagerTest, Stop_Idle_ReturnsTrueWithoutSideEffects) {
    auto manager = make_manager();

    EXPECT_TRUE(manager->stop());
    EXPECT_TRUE(connector->records.empty());
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(SubscriptionManagerTest, Stop_Active_SendsUnsubscribeClosesAndReleases) {
    auto manager = make_manager();
    manager->start({"BTC-USDT", "ETH-USDT"}, ignore_frames());
    connector->last_socket().open_now();
    auto record = connector->records.back();

    ASSERT_TRUE(manager->stop());

    ASSERT_EQ(record->sent.size(), 2u);
    auto subscribe   = json::parse(record->sent[0]);
    auto unsubscribe = json::parse(record->sent[1]);
    EXPECT_EQ(unsubscribe["op"], "unsubscribe");
    EXPECT_EQ(unsubscribe["args"], subscribe["args"]);
    EXPECT_EQ(record->close_calls, 1);
    EXPECT_TRUE(record->destroyed);
    EXPECT_FALSE(manager->is_active());
}

TEST_F(SubscriptionManagerTest, Stop_DetachesMessageHandler) {
    int frames = 0;
    auto manager = make_manager();
    manager->start({"BTC-USDT"}, [&](const std::string&) { ++frames; });
    auto record = connector->records.back();
    connector->last_socket().open_now();
    connector->last_socket().deliver("before");

    EXPECT_FALSE(record->handler_detached);
    ASSERT_TRUE(manager->stop());

    EXPECT_TRUE(record->handler_detached);
    EXPECT_EQ(frames, 1);
}

TEST_F(SubscriptionManagerTest, Stop_Twice_SecondIsNoop) {
    auto manager = make_manager();
    manager->start({"BTC-USDT"}, ignore_frames());
    auto record = connector->records.back();

    ASSERT_TRUE(manager->stop());
    ASSERT_TRUE(manager->stop());

    EXPECT_EQ(record->close_calls, 1);
}

TEST_F(SubscriptionManagerTest, StartAfterStop_OpensFreshSocket) {
    auto manager = make_manager();
    manager->start({"BTC-USDT"}, ignore_frames());
    ASSERT_TRUE(manager->stop());

    manager->start({"ETH-USDT"}, ignore_frames());

    EXPECT_EQ(connector->records.size(), 2u);
    EXPECT_EQ(connector->live(), 1);
    EXPECT_EQ(connector->max_live, 1);
}

// ============================================================================
// RETRY
// ============================================================================

TEST_F(SubscriptionManagerTest, Stop_SendFails_RetriesAfterBackoff) {
    auto manager = make_manager();
    manager->start({"BTC-USDT"}, ignore_frames());
    auto record = connector->records.back();
    record->send_failures = 2;

    ASSERT_TRUE(manager->stop());

    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{300ms, 300ms}));
    ASSERT_EQ(record->sent.size(), 1u);
    EXPECT_EQ(json::parse(record->sent[0])["op"], "unsubscribe");
    EXPECT_TRUE(record->destroyed);
}

TEST_F(SubscriptionManagerTest, Stop_CloseFails_RetriesUntilClosed) {
    auto manager = make_manager(RetryPolicy{50ms, 0});
    manager->start({"BTC-USDT"}, ignore_frames());
    auto record = connector->records.back();
    record->close_failures = 3;

    ASSERT_TRUE(manager->stop());

    EXPECT_EQ(sleeps.size(), 3u);
    EXPECT_EQ(sleeps.front(), 50ms);
    EXPECT_EQ(record->close_calls, 1);
    EXPECT_FALSE(manager->is_active());
}

TEST_F(SubscriptionManagerTest, Stop_BoundedPolicy_GivesUpAndStaysActive) {
    auto manager = make_manager(RetryPolicy{10ms, 3});
    manager->start({"BTC-USDT"}, ignore_frames());
    auto record = connector->records.back();
    record->send_failures = 5;

    EXPECT_FALSE(manager->stop());

    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_TRUE(manager->is_active());
    EXPECT_FALSE(record->destroyed);
    EXPECT_THROW(manager->start({"ETH-USDT"}, ignore_frames()), InvalidStateError);
}

TEST_F(SubscriptionManagerTest, Stop_DefaultSleeper_WaitsBackoff) {
    SubscriptionManager manager(connector, "wss://stream.test/ws", RetryPolicy{}, false);
    manager.start({"BTC-USDT"}, ignore_frames());
    connector->last().send_failures = 1;

    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(manager.stop());
    auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_GE(elapsed, 300ms);
}
