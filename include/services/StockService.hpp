#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "services/MarketData.hpp"
#include "services/MetricCalculator.hpp"

namespace ShareMonitor {

class MarketDataProvider;

// Most recent fetch result for one symbol. When error is set only symbol
// and errorMessage are meaningful.
struct QuoteSnapshot {
    std::string symbol;
    bool error = false;
    std::string errorMessage;
    DerivedMetrics metrics;
    PriceHistory history;
    PriceHistory intradayHistory;
    TimeRange range = kDefaultTimeRange;
    std::int64_t fetchedAt = 0;

    static QuoteSnapshot failed(const std::string& symbol, const std::string& message);
};

using SnapshotBatch = std::map<std::string, QuoteSnapshot>;

class StockService {
public:
    explicit StockService(std::shared_ptr<MarketDataProvider> provider);
    virtual ~StockService() = default;

    // Never throws for provider failures; they produce an error snapshot
    QuoteSnapshot fetchStock(const std::string& symbol, TimeRange range);

    // Symbols are fetched one after another on the calling thread
    virtual SnapshotBatch fetchAllStocks(const std::vector<std::string>& symbols, TimeRange range);

private:
    std::shared_ptr<MarketDataProvider> provider_;
};

}
