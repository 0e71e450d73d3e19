#pragma once
#include <nlohmann/json.hpp>
#include <string>

// One "tickers" channel record, fields kept as the decimal text the venue sends.
struct Ticker {
    std::string inst_type;     // "SPOT", "SWAP", ...
    std::string inst_id;       // "BTC-USDT"
    std::string last;          // last traded price
    std::string last_sz;
    std::string ask_px;        // best ask
    std::string ask_sz;
    std::string bid_px;        // best bid
    std::string bid_sz;
    std::string open_24h;
    std::string high_24h;
    std::string low_24h;
    std::string sod_utc0;
    std::string sod_utc8;
    std::string vol_ccy_24h;
    std::string vol_24h;
    std::string ts;            // venue timestamp, ms since epoch
};

// Missing fields decode as empty strings. Throws nlohmann::json::exception
// if a present field is not a string.
void from_json(const nlohmann::json& j, Ticker& t);
void to_json(nlohmann::json& j, const Ticker& t);
