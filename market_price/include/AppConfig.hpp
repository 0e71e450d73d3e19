#pragma once
#include "MarketPriceConfig.hpp"
#include "MarketType.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Command-line driver settings (config.json)
struct AppConfig {
    MarketPriceConfig service;
    MarketType market = MarketType::Spot;
    int page = 1;
    std::string filter;          // empty = no filter
    std::string zmq_endpoint;    // empty = no republishing
};

// Missing keys keep their defaults. Throws std::invalid_argument on bad values.
AppConfig parse_app_config(const nlohmann::json& j);

// Reads the file, then applies MARKET_PRICE_STREAM_URL / MARKET_PRICE_REST_URL.
// Throws std::runtime_error if the file cannot be opened or parsed.
AppConfig load_app_config(const std::string& path);
