#include "services/MetricCalculator.hpp"
#include "services/MarketDataProvider.hpp"
#include <spdlog/spdlog.h>

namespace ShareMonitor {

DerivedMetrics computeMetrics(const std::string& symbol,
                              const PriceHistory& history,
                              const PriceHistory& intradayHistory,
                              std::optional<double> price,
                              std::optional<double> openPrice) {
    DerivedMetrics m;

    if (price && openPrice) {
        m.price = *price;
        m.openPrice = *openPrice;
    } else if (!history.empty()) {
        m.price = history.points.back().close;
        m.openPrice = history.points.front().close;
    } else {
        throw ProviderError("No usable price data found for " + symbol + ".");
    }

    if (m.openPrice <= 0.0) {
        throw ProviderError("Open price for " + symbol + " is not positive.");
    }

    m.dailyChangeAbs = m.price - m.openPrice;
    m.dailyChangePct = m.dailyChangeAbs / m.openPrice * 100.0;

    if (intradayHistory.granularitySeconds != 0 &&
        intradayHistory.granularitySeconds != kHourlyGranularitySeconds) {
        spdlog::warn("METRICS: {} intraday granularity is {}s, hourly change not measured",
                     symbol, intradayHistory.granularitySeconds);
        return m;
    }

    const auto& samples = intradayHistory.points;
    if (samples.size() >= kHourlyLookback && m.price > 0.0) {
        double hourAgo = samples[samples.size() - kHourlyLookback].close;
        if (hourAgo > 0.0) {
            m.hourlyChangeAbs = m.price - hourAgo;
            m.hourlyChangePct = m.hourlyChangeAbs / hourAgo * 100.0;
        }
    }
    return m;
}

}
