#pragma once
#include "RetryPolicy.hpp"
#include <string>

inline constexpr const char* kDefaultStreamUrl = "wss://ws.okx.com:8443/ws/v5/public";
inline constexpr const char* kDefaultRestUrl   = "https://www.okx.com/api/v5/public/instruments?instType=";

struct MarketPriceConfig {
    bool verbose = true;
    std::string stream_url;   // empty -> kDefaultStreamUrl
    std::string rest_url;     // empty -> kDefaultRestUrl; market type is appended
    int page_size = 10;       // <= 0 -> 10
    RetryPolicy retry;
};
