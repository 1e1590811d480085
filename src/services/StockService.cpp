#include "services/StockService.hpp"
#include "services/MarketDataProvider.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <utility>

namespace ShareMonitor {

namespace {

std::int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}

QuoteSnapshot QuoteSnapshot::failed(const std::string& symbol, const std::string& message) {
    QuoteSnapshot s;
    s.symbol = symbol;
    s.error = true;
    s.errorMessage = message;
    s.fetchedAt = nowSeconds();
    return s;
}

StockService::StockService(std::shared_ptr<MarketDataProvider> provider)
    : provider_(std::move(provider)) {}

QuoteSnapshot StockService::fetchStock(const std::string& symbol, TimeRange range) {
    const TimeRangeSpec& spec = timeRangeSpec(range);
    spdlog::info("FETCH: Starting fetch for {}...", symbol);

    try {
        // Scalar fields are optional; the history fallback covers a failed lookup
        QuoteInfo info;
        try {
            info = provider_->fetchInfo(symbol);
        } catch (const ProviderError& e) {
            spdlog::debug("FETCH: quote info unavailable for {}: {}", symbol, e.what());
        }

        QuoteSnapshot snapshot;
        snapshot.symbol = symbol;
        snapshot.range = range;
        snapshot.history = provider_->fetchHistory(symbol, spec.period, spec.interval);
        snapshot.intradayHistory = provider_->fetchHistory(symbol, kIntradayPeriod, kIntradayInterval);
        snapshot.metrics = computeMetrics(symbol, snapshot.history, snapshot.intradayHistory,
                                          info.price, info.openPrice);
        snapshot.fetchedAt = nowSeconds();

        spdlog::info("FETCH: Completed fetch for {}.", symbol);
        return snapshot;
    } catch (const std::exception& e) {
        spdlog::error("FETCH: Error fetching data for {}: {}", symbol, e.what());
        return QuoteSnapshot::failed(symbol, e.what());
    }
}

SnapshotBatch StockService::fetchAllStocks(const std::vector<std::string>& symbols, TimeRange range) {
    SnapshotBatch results;
    for (const auto& sym : symbols) {
        results[sym] = fetchStock(sym, range);
    }
    return results;
}

}
