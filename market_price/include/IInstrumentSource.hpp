#pragma once
#include <string>
#include <vector>

// REST directory of tradable instruments.
class IInstrumentSource {
public:
    virtual ~IInstrumentSource() = default;

    // GET url, returns the instId list. Throws FetchError on any failure.
    virtual std::vector<std::string> fetch_instruments(const std::string& url) = 0;
};
