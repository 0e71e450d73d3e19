#include "SubscriptionMessage.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

using json = nlohmann::json;

std::string SubscriptionMessage::dump() const {
    json args_j = json::array();
    for (const auto& a : args) {
        args_j.push_back({{"channel", a.channel}, {"instId", a.inst_id}});
    }

    json msg = {
        {"op", op == SubscriptionOp::Subscribe ? "subscribe" : "unsubscribe"},
        {"args", args_j}
    };
    return msg.dump();
}

SubscriptionMessage make_ticker_subscription(const std::vector<std::string>& instruments) {
    SubscriptionMessage msg;
    msg.op = SubscriptionOp::Subscribe;
    msg.args.reserve(instruments.size());
    for (const auto& ins : instruments) {
        std::string up = ins;
        for (auto& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        msg.args.push_back({kTickersChannel, up});
    }
    return msg;
}
