#include <cmath>
#include <iostream>
#include <optional>
#include "services/MarketDataProvider.hpp"
#include "services/MetricCalculator.hpp"

using namespace ShareMonitor;

namespace {

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

PriceHistory minuteHistory(std::size_t count, double start, double step) {
    PriceHistory h;
    h.granularitySeconds = 60;
    for (std::size_t i = 0; i < count; ++i) {
        h.points.push_back({static_cast<std::int64_t>(1700000000 + i * 60), start + step * i});
    }
    return h;
}

PriceHistory dailyHistory() {
    PriceHistory h;
    h.granularitySeconds = 86400;
    h.points = {{1700000000, 20.0}, {1700086400, 21.0}, {1700172800, 25.0}};
    return h;
}

}

int main() {
    {
        // Scalars present: daily change from price and open
        auto m = computeMetrics("AAA.AX", dailyHistory(), PriceHistory{}, 11.0, 10.0);
        if (!near(m.price, 11.0) || !near(m.openPrice, 10.0)) {
            std::cerr << "Expected scalar price/open to be used\n";
            return 1;
        }
        if (!near(m.dailyChangeAbs, 1.0) || !near(m.dailyChangePct, m.dailyChangeAbs / m.openPrice * 100.0)) {
            std::cerr << "Daily change mismatch: " << m.dailyChangeAbs << " / " << m.dailyChangePct << "\n";
            return 1;
        }
        if (!m.isGain()) {
            std::cerr << "Positive change should be a gain\n";
            return 1;
        }
    }

    {
        // Either scalar missing: last and first of the long history
        auto m = computeMetrics("AAA.AX", dailyHistory(), PriceHistory{}, 30.0, std::nullopt);
        if (!near(m.price, 25.0) || !near(m.openPrice, 20.0) || !near(m.dailyChangePct, 25.0)) {
            std::cerr << "Fallback to history failed: " << m.price << " " << m.openPrice << "\n";
            return 1;
        }
    }

    {
        bool threw = false;
        try {
            computeMetrics("EMPTY.AX", PriceHistory{}, PriceHistory{}, std::nullopt, std::nullopt);
        } catch (const ProviderError& e) {
            threw = std::string(e.what()) == "No usable price data found for EMPTY.AX.";
        }
        if (!threw) {
            std::cerr << "Expected ProviderError for missing price data\n";
            return 1;
        }
    }

    {
        bool threw = false;
        try {
            computeMetrics("ZERO.AX", dailyHistory(), PriceHistory{}, 5.0, 0.0);
        } catch (const ProviderError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Expected ProviderError for a zero open price\n";
            return 1;
        }
    }

    {
        // Fewer than 60 short samples: hourly fields exactly zero
        auto m = computeMetrics("AAA.AX", dailyHistory(), minuteHistory(59, 10.0, 0.01), 11.0, 10.0);
        if (m.hourlyChangeAbs != 0.0 || m.hourlyChangePct != 0.0) {
            std::cerr << "Expected zero hourly change below the lookback\n";
            return 1;
        }
    }

    {
        // 70 samples: reference is sample[-60], i.e. index 10
        auto intraday = minuteHistory(70, 10.0, 0.01);
        auto m = computeMetrics("AAA.AX", dailyHistory(), intraday, 11.0, 10.0);
        double ref = intraday.points[10].close;
        if (!near(m.hourlyChangeAbs, 11.0 - ref) || !near(m.hourlyChangePct, (11.0 - ref) / ref * 100.0)) {
            std::cerr << "Hourly change mismatch: " << m.hourlyChangeAbs << " / " << m.hourlyChangePct << "\n";
            return 1;
        }
    }

    {
        // Exactly 60 samples uses the first one
        auto intraday = minuteHistory(60, 8.0, 0.0);
        auto m = computeMetrics("AAA.AX", dailyHistory(), intraday, 10.0, 10.0);
        if (!near(m.hourlyChangeAbs, 2.0) || !near(m.hourlyChangePct, 25.0)) {
            std::cerr << "Expected hourly change against the first of 60 samples\n";
            return 1;
        }
    }

    {
        // Five-minute granularity is not an hour of minute samples
        auto intraday = minuteHistory(70, 10.0, 0.01);
        intraday.granularitySeconds = 300;
        auto m = computeMetrics("AAA.AX", dailyHistory(), intraday, 11.0, 10.0);
        if (m.hourlyChangeAbs != 0.0 || m.hourlyChangePct != 0.0) {
            std::cerr << "Expected zero hourly change for non-minute samples\n";
            return 1;
        }
    }

    {
        // Zero reference sample
        auto intraday = minuteHistory(70, 0.0, 0.0);
        auto m = computeMetrics("AAA.AX", dailyHistory(), intraday, 11.0, 10.0);
        if (m.hourlyChangeAbs != 0.0 || m.hourlyChangePct != 0.0) {
            std::cerr << "Expected zero hourly change for a zero reference\n";
            return 1;
        }
    }

    {
        auto m = computeMetrics("DOWN.AX", dailyHistory(), PriceHistory{}, 9.0, 10.0);
        if (m.isGain() || !near(m.dailyChangePct, -10.0)) {
            std::cerr << "Negative change should be a loss\n";
            return 1;
        }
    }

    std::cout << "metric_calculator_test passed\n";
    return 0;
}
