#include <gtest/gtest.h>
#include "Ticker.hpp"
#include "TickerPublisher.hpp"

using json = nlohmann::json;

TEST(TickerTest, ToJson_UsesVenueFieldNames) {
    Ticker t;
    t.inst_id = "BTC-USDT";
    t.ask_px = "43250.2";
    t.vol_ccy_24h = "1000";
    t.sod_utc0 = "42100";

    json j = t;

    EXPECT_EQ(j["instId"], "BTC-USDT");
    EXPECT_EQ(j["askPx"], "43250.2");
    EXPECT_EQ(j["volCcy24h"], "1000");
    EXPECT_EQ(j["sodUtc0"], "42100");
    EXPECT_EQ(j["last"], "");
}

TEST(TickerTest, FromJson_MissingFields_Empty) {
    auto t = json::parse(R"({"instId": "ETH-USDT", "bidPx": "2300"})").get<Ticker>();

    EXPECT_EQ(t.inst_id, "ETH-USDT");
    EXPECT_EQ(t.bid_px, "2300");
    EXPECT_TRUE(t.inst_type.empty());
    EXPECT_TRUE(t.ts.empty());
}

TEST(TickerTest, FromJson_NonStringField_Throws) {
    EXPECT_THROW(json::parse(R"({"last": 1.5})").get<Ticker>(), json::exception);
}

TEST(TickerTest, PublisherTopic_PrefixedInstId) {
    Ticker t;
    t.inst_id = "SOL-USDT";

    EXPECT_EQ(TickerPublisher::topic_for(t), "ticker.SOL-USDT");
}
