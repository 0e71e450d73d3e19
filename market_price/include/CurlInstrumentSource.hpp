#pragma once
#include "IInstrumentSource.hpp"
#include <string>
#include <vector>

class CurlInstrumentSource : public IInstrumentSource {
public:
    explicit CurlInstrumentSource(long timeout_ms = 10000);

    std::vector<std::string> fetch_instruments(const std::string& url) override;

private:
    long timeout_ms_;
};

// {"code":"0","msg":"","data":[{"instId":"BTC-USDT",...}, ...]}
// Throws FetchError if the body is not that shape or code != "0".
std::vector<std::string> parse_instrument_response(const std::string& body);
