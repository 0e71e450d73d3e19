#include "AppConfig.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

static std::string env_or(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : defv;
}

AppConfig parse_app_config(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("config must be a json object");

    AppConfig cfg;
    cfg.service.verbose    = j.value("verbose", cfg.service.verbose);
    cfg.service.stream_url = j.value("streamUrl", cfg.service.stream_url);
    cfg.service.rest_url   = j.value("restUrl", cfg.service.rest_url);
    cfg.service.page_size  = j.value("pageSize", cfg.service.page_size);

    if (j.contains("retry") && j["retry"].is_object()) {
        const auto& r = j["retry"];
        int backoff_ms = r.value("backoffMs", static_cast<int>(cfg.service.retry.backoff.count()));
        if (backoff_ms < 0) throw std::invalid_argument("retry.backoffMs must be >= 0");
        cfg.service.retry.backoff      = std::chrono::milliseconds(backoff_ms);
        cfg.service.retry.max_attempts = r.value("maxAttempts", cfg.service.retry.max_attempts);
    }

    cfg.market = parse_market_type(j.value("marketType", std::string("SPOT")));
    cfg.page   = j.value("page", cfg.page);
    if (cfg.page < 1) throw std::invalid_argument("page must be >= 1");

    cfg.filter       = j.value("filter", cfg.filter);
    cfg.zmq_endpoint = j.value("zmqEndpoint", cfg.zmq_endpoint);
    return cfg;
}

AppConfig load_app_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("failed to open " + path);
    }

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("failed to parse " + path);
    }

    AppConfig cfg = parse_app_config(j);
    cfg.service.stream_url = env_or("MARKET_PRICE_STREAM_URL", cfg.service.stream_url);
    cfg.service.rest_url   = env_or("MARKET_PRICE_REST_URL", cfg.service.rest_url);
    return cfg;
}
