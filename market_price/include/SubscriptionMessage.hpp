#pragma once
#include <string>
#include <vector>

enum class SubscriptionOp {
    Subscribe,
    Unsubscribe
};

struct SubscriptionArg {
    std::string channel;   // "tickers"
    std::string inst_id;   // upper-cased, e.g. "BTC-USDT"
};

// {"op":"subscribe","args":[{"channel":"tickers","instId":"BTC-USDT"}, ...]}
struct SubscriptionMessage {
    SubscriptionOp op = SubscriptionOp::Subscribe;
    std::vector<SubscriptionArg> args;

    std::string dump() const;
};

inline constexpr const char* kTickersChannel = "tickers";

SubscriptionMessage make_ticker_subscription(const std::vector<std::string>& instruments);
