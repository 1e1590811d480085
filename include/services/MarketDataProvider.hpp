#pragma once
#include <stdexcept>
#include <string>
#include "services/MarketData.hpp"

namespace ShareMonitor {

// Raised for any provider transport, HTTP or payload failure for one symbol
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& what) : std::runtime_error(what) {}
};

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    // Throws ProviderError
    virtual PriceHistory fetchHistory(const std::string& symbol,
                                      const std::string& period,
                                      const std::string& interval) = 0;

    // Missing fields are left empty; throws ProviderError on transport failure
    virtual QuoteInfo fetchInfo(const std::string& symbol) = 0;
};

}
