#pragma once
#include <string>
#include "services/MarketDataProvider.hpp"

namespace ShareMonitor {

class YahooFinanceProvider : public MarketDataProvider {
public:
    explicit YahooFinanceProvider(std::string baseUrl = "https://query1.finance.yahoo.com");

    PriceHistory fetchHistory(const std::string& symbol,
                              const std::string& period,
                              const std::string& interval) override;
    QuoteInfo fetchInfo(const std::string& symbol) override;

    // Response parsers, exposed for tests. Both throw ProviderError.
    static PriceHistory parseChart(const std::string& body, const std::string& symbol);
    static QuoteInfo parseQuote(const std::string& body, const std::string& symbol);

    // "1m" -> 60, "1wk" -> 604800; 0 for anything unrecognised
    static int intervalSeconds(const std::string& interval);

private:
    std::string baseUrl_;
};

}
