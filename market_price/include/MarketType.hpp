#pragma once
#include <string>

enum class MarketType {
    Spot,
    Margin,
    Swap,
    Futures,
    Option
};

// Second-side currencies usable as an instrument filter ("BTC-USDT" -> USDT)
enum class QuoteCurrency {
    USDT,
    ETH,
    BTC,
    EUR,
    GBP,
    TRY
};

// Upper-case wire name, e.g. "SPOT"
std::string to_string(MarketType type);
std::string to_string(QuoteCurrency currency);

// Case-insensitive. Throws std::invalid_argument on unknown names.
MarketType parse_market_type(const std::string& text);
