#include <iostream>
#include <string>
#include "services/MarketDataProvider.hpp"
#include "services/YahooFinanceProvider.hpp"

using namespace ShareMonitor;

int main() {
    {
        const std::string body = R"({"chart":{"result":[{"meta":{"symbol":"BHP.AX","dataGranularity":"1m"},
            "timestamp":[1700000000,1700000060,1700000120],
            "indicators":{"quote":[{"close":[45.1,null,45.25]}]}}],"error":null}})";
        auto history = YahooFinanceProvider::parseChart(body, "BHP.AX");
        if (history.points.size() != 2) {
            std::cerr << "Null closes should be skipped, got " << history.points.size() << " points\n";
            return 1;
        }
        if (history.points[1].timestamp != 1700000120 || history.points[1].close != 45.25) {
            std::cerr << "Wrong second point\n";
            return 1;
        }
        if (history.granularitySeconds != 60) {
            std::cerr << "Expected 60s granularity, got " << history.granularitySeconds << "\n";
            return 1;
        }
    }

    {
        // Integer closes are accepted as prices
        const std::string body = R"({"chart":{"result":[{"meta":{"dataGranularity":"1d"},
            "timestamp":[1700000000],"indicators":{"quote":[{"close":[12]}]}}],"error":null}})";
        auto history = YahooFinanceProvider::parseChart(body, "PL8.AX");
        if (history.points.size() != 1 || history.points[0].close != 12.0 || history.granularitySeconds != 86400) {
            std::cerr << "Integer close not parsed\n";
            return 1;
        }
    }

    {
        // No trades in the period
        const std::string body = R"({"chart":{"result":[{"meta":{"dataGranularity":"5m"},"indicators":{"quote":[{}]}}],"error":null}})";
        auto history = YahooFinanceProvider::parseChart(body, "QUIET.AX");
        if (!history.empty() || history.granularitySeconds != 300) {
            std::cerr << "Expected empty history with known granularity\n";
            return 1;
        }
    }

    {
        const std::string body = R"({"chart":{"result":null,"error":{"code":"Not Found","description":"No data found, symbol may be delisted"}}})";
        bool threw = false;
        try {
            YahooFinanceProvider::parseChart(body, "NOPE.AX");
        } catch (const ProviderError& e) {
            threw = std::string(e.what()).find("symbol may be delisted") != std::string::npos;
        }
        if (!threw) {
            std::cerr << "chart.error should raise ProviderError with the description\n";
            return 1;
        }
    }

    {
        bool threw = false;
        try {
            YahooFinanceProvider::parseChart("<html>rate limited</html>", "BHP.AX");
        } catch (const ProviderError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Malformed body should raise ProviderError\n";
            return 1;
        }
    }

    {
        const std::string body = R"({"quoteResponse":{"result":[{"symbol":"BHP.AX","regularMarketPrice":45.1,"regularMarketOpen":44}],"error":null}})";
        auto info = YahooFinanceProvider::parseQuote(body, "BHP.AX");
        if (!info.price || *info.price != 45.1 || !info.openPrice || *info.openPrice != 44.0) {
            std::cerr << "Quote fields not parsed\n";
            return 1;
        }
    }

    {
        const std::string body = R"({"quoteResponse":{"result":[{"symbol":"BHP.AX","regularMarketPrice":45.1}],"error":null}})";
        auto info = YahooFinanceProvider::parseQuote(body, "BHP.AX");
        if (!info.price || info.openPrice) {
            std::cerr << "Missing open should stay missing\n";
            return 1;
        }
    }

    {
        auto info = YahooFinanceProvider::parseQuote(R"({"quoteResponse":{"result":[],"error":null}})", "X.AX");
        if (info.price || info.openPrice) {
            std::cerr << "Empty quote result should give no fields\n";
            return 1;
        }
    }

    if (YahooFinanceProvider::intervalSeconds("5m") != 300 ||
        YahooFinanceProvider::intervalSeconds("1wk") != 604800 ||
        YahooFinanceProvider::intervalSeconds("bogus") != 0) {
        std::cerr << "intervalSeconds table wrong\n";
        return 1;
    }

    std::cout << "yahoo_parser_test passed\n";
    return 0;
}
