#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "SubscriptionMessage.hpp"

using json = nlohmann::json;

TEST(SubscriptionMessageTest, MakeTickerSubscription_UppercasesInstruments) {
    auto msg = make_ticker_subscription({"btc-usdt", "Eth-Usdt"});

    EXPECT_EQ(msg.op, SubscriptionOp::Subscribe);
    ASSERT_EQ(msg.args.size(), 2u);
    EXPECT_EQ(msg.args[0].channel, "tickers");
    EXPECT_EQ(msg.args[0].inst_id, "BTC-USDT");
    EXPECT_EQ(msg.args[1].inst_id, "ETH-USDT");
}

TEST(SubscriptionMessageTest, Dump_Subscribe_MatchesWireShape) {
    auto msg = make_ticker_subscription({"BTC-USDT"});

    auto j = json::parse(msg.dump());

    EXPECT_EQ(j["op"], "subscribe");
    ASSERT_TRUE(j["args"].is_array());
    ASSERT_EQ(j["args"].size(), 1u);
    EXPECT_EQ(j["args"][0]["channel"], "tickers");
    EXPECT_EQ(j["args"][0]["instId"], "BTC-USDT");
    EXPECT_EQ(j.size(), 2u);
}

TEST(SubscriptionMessageTest, Dump_Unsubscribe_FlipsOpOnly) {
    auto msg = make_ticker_subscription({"BTC-USDT", "ETH-USDT"});
    auto before = json::parse(msg.dump());

    msg.op = SubscriptionOp::Unsubscribe;
    auto after = json::parse(msg.dump());

    EXPECT_EQ(after["op"], "unsubscribe");
    EXPECT_EQ(after["args"], before["args"]);
}

TEST(SubscriptionMessageTest, Dump_NoInstruments_EmptyArgsArray) {
    auto j = json::parse(make_ticker_subscription({}).dump());

    ASSERT_TRUE(j["args"].is_array());
    EXPECT_TRUE(j["args"].empty());
}
