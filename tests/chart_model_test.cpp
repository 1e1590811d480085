#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include "ui/ChartModel.hpp"

using namespace ShareMonitor;

namespace {

// 2024-01-01 00:00:00 UTC; 10:00 in Brisbane, 11:00 in Sydney
const std::int64_t kNewYear = 1704067200;

ChartSeries makeSeries(const std::string& label, std::vector<PricePoint> points) {
    return ChartSeries{label, seriesColor(0), std::move(points)};
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

}

int main() {
    {
        std::vector<ChartSeries> series = {makeSeries("A", {{1000, 10.0}, {1500, 11.0}, {2000, 12.0}})};
        ChartLayout layout(series, PlotArea{0.0, 0.0, 1010.0, 100.0});
        if (!layout.valid() || !near(layout.timeMin(), 995.0) || !near(layout.timeMax(), 2005.0)) {
            std::cerr << "Time axis should be padded by half a percent: "
                      << layout.timeMin() << " .. " << layout.timeMax() << "\n";
            return 1;
        }
        if (!near(layout.priceMin(), 9.9) || !near(layout.priceMax(), 12.1)) {
            std::cerr << "Price axis padding wrong\n";
            return 1;
        }
        if (!near(layout.xFor(1500), 505.0) || !near(layout.yFor(layout.priceMax()), 0.0)) {
            std::cerr << "Projection wrong\n";
            return 1;
        }

        auto hit = findNearestPoint(series, layout, 510.0);
        if (!hit || hit->pointIndex != 1 || hit->point.close != 11.0) {
            std::cerr << "Expected the middle point within the threshold\n";
            return 1;
        }
        // Nearest sample is 250px away
        if (findNearestPoint(series, layout, layout.xFor(1250))) {
            std::cerr << "Points beyond 20px should not be hit\n";
            return 1;
        }
    }

    {
        // Closest series wins
        std::vector<ChartSeries> series = {
            makeSeries("A", {{1000, 10.0}, {2000, 12.0}}),
            makeSeries("B", {{1490, 50.0}})
        };
        ChartLayout layout(series, PlotArea{0.0, 0.0, 1010.0, 100.0});
        auto hit = findNearestPoint(series, layout, layout.xFor(1500));
        if (!hit || hit->seriesIndex != 1) {
            std::cerr << "Expected the hit on series B\n";
            return 1;
        }
    }

    {
        std::vector<ChartSeries> single = {makeSeries("A", {{1000, 5.0}})};
        ChartLayout layout(single, PlotArea{0.0, 0.0, 100.0, 100.0});
        if (!layout.valid() || !near(layout.timeMin(), 940.0) || !near(layout.timeMax(), 1060.0)
            || !(layout.priceMax() > layout.priceMin())) {
            std::cerr << "A single point should still give a usable layout\n";
            return 1;
        }

        std::vector<ChartSeries> empty = {makeSeries("A", {})};
        ChartLayout none(empty, PlotArea{0.0, 0.0, 100.0, 100.0});
        if (none.valid() || findNearestPoint(empty, none, 50.0)) {
            std::cerr << "Empty series should give an invalid layout and no hit\n";
            return 1;
        }
    }

    {
        auto ticks = timeTicks(kNewYear - 100, kNewYear + 5 * 3600 + 100, TimeRange::TwentyFourHours, "Australia/Brisbane");
        if (ticks.size() != 6 || ticks.front().label != "10:00" || ticks.back().label != "15:00") {
            std::cerr << "Expected hourly ticks 10:00..15:00, got " << ticks.size() << "\n";
            return 1;
        }
    }

    {
        auto ticks = timeTicks(kNewYear, kNewYear + 6 * 3600, TimeRange::SixHours, "Australia/Sydney");
        if (ticks.empty() || ticks.size() > static_cast<std::size_t>(kMaxTimeTicks)) {
            std::cerr << "Intraday tick count out of range: " << ticks.size() << "\n";
            return 1;
        }
        for (const auto& t : ticks) {
            if (t.label.size() != 5 || t.label[2] != ':') {
                std::cerr << "Intraday labels should be HH:MM, got " << t.label << "\n";
                return 1;
            }
        }
    }

    {
        auto ticks = timeTicks(kNewYear, kNewYear + 30 * 86400, TimeRange::ThirtyDays, "Australia/Sydney");
        if (ticks.empty() || ticks.size() > static_cast<std::size_t>(kMaxTimeTicks)) {
            std::cerr << "Daily tick count out of range: " << ticks.size() << "\n";
            return 1;
        }
        for (const auto& t : ticks) {
            if (t.label.size() != 10 || t.label[4] != '-' || t.label[7] != '-') {
                std::cerr << "Daily labels should be YYYY-MM-DD, got " << t.label << "\n";
                return 1;
            }
        }
    }

    {
        auto ticks = priceTicks(0.0, 10.0);
        if (ticks.size() != 6 || ticks.front().label != "0" || ticks.back().label != "10") {
            std::cerr << "Expected price ticks 0,2,..,10\n";
            return 1;
        }
    }

    if (timeAxisLabel(TimeRange::SixHours, "Australia/Perth") != "Time (Perth)" ||
        timeAxisLabel(TimeRange::ThirtyDays, "Australia/Sydney") != "Time/Date (Sydney)") {
        std::cerr << "Axis label wrong\n";
        return 1;
    }

    {
        DerivedMetrics m;
        m.price = 45.12;
        m.openPrice = 44.57;
        m.dailyChangeAbs = 0.55;
        m.dailyChangePct = 1.234;

        std::string recent = tooltipText("BHP.AX", PricePoint{kNewYear, 45.12}, m, "Australia/Sydney", kNewYear + 3600);
        const std::string expected =
            "BHP.AX\n"
            "Price: $45.12\n"
            "Time (Sydney): 2024-01-01 11:00:00\n"
            "\n"
            "Daily %: +1.23% ↑\n"
            "Daily $: $+0.55 ↑\n"
            "Hourly %: +0.00% ↑\n"
            "Hourly $: $+0.00 ↑";
        if (recent != expected) {
            std::cerr << "Unexpected tooltip:\n" << recent << "\n";
            return 1;
        }

        std::string old = tooltipText("BHP.AX", PricePoint{kNewYear - 10 * 86400, 40.0}, m, "Australia/Sydney", kNewYear);
        if (old.find("Time (Sydney): 2023-12-22\n") == std::string::npos) {
            std::cerr << "Older points should show the date only:\n" << old << "\n";
            return 1;
        }
    }

    std::cout << "chart_model_test passed\n";
    return 0;
}
