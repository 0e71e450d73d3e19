#include "MarketPriceService.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <stdexcept>

static const char* kTag = "MarketPriceService";

static MarketPriceConfig with_defaults(MarketPriceConfig config) {
    if (config.stream_url.empty()) config.stream_url = kDefaultStreamUrl;
    if (config.rest_url.empty())   config.rest_url   = kDefaultRestUrl;
    if (config.page_size <= 0)     config.page_size  = CurrencyRepo::kDefaultPageSize;
    return config;
}

MarketPriceService::MarketPriceService(MarketPriceConfig config,
                                       std::shared_ptr<IInstrumentSource> instruments,
                                       std::shared_ptr<IStreamConnector> connector,
                                       SubscriptionManager::Sleeper sleeper)
    : config_(with_defaults(std::move(config))),
      instruments_(std::move(instruments)),
      subscriptions_(std::move(connector), config_.stream_url, config_.retry,
                     config_.verbose, std::move(sleeper))
{
    if (!instruments_) throw std::invalid_argument("instrument source is required");
}

MarketPriceService::~MarketPriceService() = default;

void MarketPriceService::get(int page,
                             MarketType type,
                             TickerCallback callback,
                             const std::optional<std::string>& second_side_filter) {
    if (!callback) {
        log_error(kTag, "invalid callback passed to start new subscription.");
        throw std::invalid_argument("invalid callback");
    }

    log("check and close current subscription...");
    if (!subscriptions_.stop()) {
        throw TransportError("previous subscription could not be closed");
    }

    log("setting up new subscription arguments...");
    auto currencies = find_currencies_by_market(type, page, second_side_filter);

    log("binding callback to subscription data...");
    subscriptions_.start(currencies, make_frame_adapter(std::move(callback)));
    log("new subscription started.");
}

void MarketPriceService::get(int page, MarketType type, TickerCallback callback,
                             QuoteCurrency second_side) {
    get(page, type, std::move(callback), std::optional<std::string>(to_string(second_side)));
}

void MarketPriceService::dispose() {
    log("disposing market price service...");
    if (!subscriptions_.stop()) {
        log_error(kTag, "subscription left open on dispose");
        return;
    }
    log("~Bye bye~");
}

int MarketPriceService::get_page_size(MarketType type) const {
    auto it = repos_.find(type);
    return it == repos_.end() ? 0 : it->second.get_page_size();
}

int MarketPriceService::get_page_count(MarketType type) const {
    auto it = repos_.find(type);
    return it == repos_.end() ? 0 : it->second.get_page_count();
}

void MarketPriceService::seed(MarketType type, const std::vector<std::string>& instruments) {
    repos_.emplace(type, CurrencyRepo(instruments, config_.page_size));
}

std::vector<std::string> MarketPriceService::find_currencies_by_market(
    MarketType type, int page, const std::optional<std::string>& filter)
{
    log("looking for " + to_string(type) + " market currencies...");
    auto it = repos_.find(type);
    if (it == repos_.end()) {
        it = repos_.emplace(type, fetch_currencies_by_market(type)).first;
    }
    log("currencies are ready.");
    return it->second.get(page, filter);
}

CurrencyRepo MarketPriceService::fetch_currencies_by_market(MarketType type) {
    try {
        log("fetching currencies for market " + to_string(type) + "...");
        auto currencies = instruments_->fetch_instruments(config_.rest_url + to_string(type));
        log("currencies fetched (" + std::to_string(currencies.size()) + ").");
        return CurrencyRepo(currencies, config_.page_size);
    } catch (const std::exception& e) {
        log_error(kTag, "cannot fetch " + to_string(type) + " market currencies due to error \""
                            + e.what() + "\"");
        throw;
    }
}

void MarketPriceService::log(const std::string& msg) const {
    if (!config_.verbose) return;
    log_info(kTag, msg);
}
