#pragma once
#include "CurrencyRepo.hpp"
#include "FrameAdapter.hpp"
#include "IInstrumentSource.hpp"
#include "IStreamSocket.hpp"
#include "MarketPriceConfig.hpp"
#include "MarketType.hpp"
#include "SubscriptionManager.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/* ================= MarketPriceService =================
 *
 * Live ticker prices for one page of one market's instruments at a time.
 *
 * get() tears down the current subscription, resolves the requested page
 * (instrument lists are fetched once per market type and cached for the
 * lifetime of the service), then subscribes to it. Calls are expected to be
 * serialised by the caller; the ticker callback runs on the transport's I/O
 * thread and must not block or call back into the service.
 */
class MarketPriceService {
public:
    MarketPriceService(MarketPriceConfig config,
                       std::shared_ptr<IInstrumentSource> instruments,
                       std::shared_ptr<IStreamConnector> connector,
                       SubscriptionManager::Sleeper sleeper = {});
    ~MarketPriceService();

    MarketPriceService(const MarketPriceService&) = delete;
    MarketPriceService& operator=(const MarketPriceService&) = delete;

    // Throws std::invalid_argument for an empty callback, FetchError when the
    // instrument list cannot be fetched, TransportError when the previous
    // subscription could not be closed under a bounded retry policy.
    void get(int page,
             MarketType type,
             TickerCallback callback,
             const std::optional<std::string>& second_side_filter = std::nullopt);

    void get(int page, MarketType type, TickerCallback callback, QuoteCurrency second_side);

    // Closes the active subscription, if any. Safe to call repeatedly.
    void dispose();

    // 0 until the market type has been loaded; never fetches
    int get_page_size(MarketType type) const;
    int get_page_count(MarketType type) const;

    // Pre-seeds the cache for a market type; ignored if already cached.
    void seed(MarketType type, const std::vector<std::string>& instruments);

    bool has_active_subscription() const { return subscriptions_.is_active(); }

    const MarketPriceConfig& config() const { return config_; }

private:
    std::vector<std::string> find_currencies_by_market(MarketType type,
                                                       int page,
                                                       const std::optional<std::string>& filter);
    CurrencyRepo fetch_currencies_by_market(MarketType type);

    void log(const std::string& msg) const;

    MarketPriceConfig config_;
    std::shared_ptr<IInstrumentSource> instruments_;
    SubscriptionManager subscriptions_;
    std::map<MarketType, CurrencyRepo> repos_;
};
