#pragma once
#include <cstddef>
#include <optional>
#include "services/MarketData.hpp"

namespace ShareMonitor {

struct DerivedMetrics {
    double price = 0.0;
    double openPrice = 0.0;
    double dailyChangeAbs = 0.0;
    double dailyChangePct = 0.0;
    double hourlyChangeAbs = 0.0;
    double hourlyChangePct = 0.0;

    bool isGain() const { return dailyChangeAbs >= 0.0; }
    bool isHourlyGain() const { return hourlyChangePct >= 0.0; }
};

// Samples between "now" and "an hour ago" in a one-minute series
constexpr std::size_t kHourlyLookback = 60;
constexpr int kHourlyGranularitySeconds = 60;

/**
 * Computes daily and hourly change for one symbol.
 *
 * When either scalar is missing, price and open fall back to the last and
 * first samples of the long history. Throws ProviderError when no usable
 * price exists or the open price is not positive.
 *
 * The hourly figures assume a one-minute short history. A short history
 * reporting any other granularity, fewer than kHourlyLookback samples or a
 * non-positive price yields zero hourly change.
 */
DerivedMetrics computeMetrics(const std::string& symbol,
                              const PriceHistory& history,
                              const PriceHistory& intradayHistory,
                              std::optional<double> price,
                              std::optional<double> openPrice);

}
