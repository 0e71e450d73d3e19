#include "MarketType.hpp"
#include <cctype>
#include <stdexcept>

std::string to_string(MarketType type) {
    switch (type) {
        case MarketType::Spot:    return "SPOT";
        case MarketType::Margin:  return "MARGIN";
        case MarketType::Swap:    return "SWAP";
        case MarketType::Futures: return "FUTURES";
        case MarketType::Option:  return "OPTION";
    }
    return "SPOT";
}

std::string to_string(QuoteCurrency currency) {
    switch (currency) {
        case QuoteCurrency::USDT: return "USDT";
        case QuoteCurrency::ETH:  return "ETH";
        case QuoteCurrency::BTC:  return "BTC";
        case QuoteCurrency::EUR:  return "EUR";
        case QuoteCurrency::GBP:  return "GBP";
        case QuoteCurrency::TRY:  return "TRY";
    }
    return "USDT";
}

MarketType parse_market_type(const std::string& text) {
    std::string up = text;
    for (auto& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    if (up == "SPOT")    return MarketType::Spot;
    if (up == "MARGIN")  return MarketType::Margin;
    if (up == "SWAP")    return MarketType::Swap;
    if (up == "FUTURES") return MarketType::Futures;
    if (up == "OPTION")  return MarketType::Option;

    throw std::invalid_argument("unknown market type: " + text);
}
