#include "AppConfig.hpp"
#include "BeastStreamSocket.hpp"
#include "CurlInstrumentSource.hpp"
#include "Log.hpp"
#include "MarketPriceService.hpp"
#include "TickerPublisher.hpp"
#include <curl/curl.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

static std::atomic<bool> g_sigint{false};

static void on_sigint(int) {
    g_sigint.store(true);
}

static void print_ticker(const Ticker& t) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cout << "[TICK] " << t.inst_id
              << " bid=" << t.bid_px
              << " ask=" << t.ask_px
              << " last=" << t.last
              << " ts=" << t.ts << "\n";
}

int main(int argc, char* argv[]) {
    const std::string cfg_path = argc > 1 ? argv[1] : "../config.json";

    AppConfig cfg;
    try {
        cfg = load_app_config(cfg_path);
    } catch (const std::exception& e) {
        std::cerr << "[market_price] " << e.what() << "\n";
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;

    try {
        std::unique_ptr<TickerPublisher> publisher;
        if (!cfg.zmq_endpoint.empty()) {
            publisher = std::make_unique<TickerPublisher>(cfg.zmq_endpoint);
            log_info("market_price", "republishing tickers on " + cfg.zmq_endpoint);
        }

        MarketPriceService service(cfg.service,
                                   std::make_shared<CurlInstrumentSource>(),
                                   std::make_shared<BeastStreamConnector>());

        TickerCallback on_ticker = [p = publisher.get()](const Ticker& t) {
            print_ticker(t);
            if (p) p->publish(t);
        };

        MarketType market = cfg.market;
        int page = cfg.page;
        std::optional<std::string> filter;
        if (!cfg.filter.empty()) filter = cfg.filter;

        auto subscribe = [&]() {
            try {
                service.get(page, market, on_ticker, filter);
                log_info("market_price", to_string(market) + " page " + std::to_string(page)
                                             + "/" + std::to_string(service.get_page_count(market))
                                             + (filter ? " filter=" + *filter : ""));
            } catch (const std::exception& e) {
                log_error("market_price", e.what());
            }
        };

        std::signal(SIGINT, on_sigint);
        subscribe();

        std::cout << "\nCommands:\n"
                  << "  next | prev | page <n>\n"
                  << "  market <spot|margin|swap|futures|option>\n"
                  << "  filter <text> | nofilter\n"
                  << "  info\n"
                  << "  quit\n\n";

        std::string line;
        while (!g_sigint.load() && std::getline(std::cin, line)) {
            std::istringstream iss(line);
            std::string cmd;
            if (!(iss >> cmd)) continue;

            if (cmd == "quit") break;

            if (cmd == "next") {
                ++page;
                subscribe();
            } else if (cmd == "prev") {
                if (page > 1) --page;
                subscribe();
            } else if (cmd == "page") {
                int n = 0;
                if (!(iss >> n) || n < 1) {
                    std::cout << "usage: page <n>, n >= 1\n";
                    continue;
                }
                page = n;
                subscribe();
            } else if (cmd == "market") {
                std::string name;
                iss >> name;
                try {
                    market = parse_market_type(name);
                } catch (const std::invalid_argument& e) {
                    std::cout << e.what() << "\n";
                    continue;
                }
                page = 1;
                subscribe();
            } else if (cmd == "filter") {
                std::string text;
                iss >> text;
                filter = text.empty() ? std::nullopt : std::optional<std::string>(text);
                page = 1;
                subscribe();
            } else if (cmd == "nofilter") {
                filter.reset();
                page = 1;
                subscribe();
            } else if (cmd == "info") {
                std::cout << to_string(market)
                          << " pageSize=" << service.get_page_size(market)
                          << " pageCount=" << service.get_page_count(market)
                          << " page=" << page
                          << " active=" << (service.has_active_subscription() ? "yes" : "no")
                          << "\n";
            } else {
                std::cout << "unknown command: " << cmd << "\n";
            }
        }

        service.dispose();
    } catch (const std::exception& e) {
        std::cerr << "[market_price] Fatal error: " << e.what() << std::endl;
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
