#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "services/MarketData.hpp"
#include "services/MetricCalculator.hpp"

namespace ShareMonitor {

struct ChartColor {
    double r;
    double g;
    double b;
};

// Line colours for the combined chart, cycled by series index
const ChartColor& seriesColor(std::size_t index);
const ChartColor& gainColor();
const ChartColor& lossColor();

struct ChartSeries {
    std::string label;
    ChartColor color;
    PriceSeries points;
};

// Pixel rectangle the data is drawn into
struct PlotArea {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool contains(double x, double y) const {
        return x >= left && x <= left + width && y >= top && y <= top + height;
    }
};

constexpr double kTimePaddingFraction = 0.005;
constexpr double kHoverThresholdPx = 20.0;
constexpr int kMinTimeTicks = 5;
constexpr int kMaxTimeTicks = 10;

// Maps (timestamp, price) onto a PlotArea. The time axis spans the plotted
// samples padded by half a percent of their span on each side.
class ChartLayout {
public:
    ChartLayout(const std::vector<ChartSeries>& series, const PlotArea& area);

    bool valid() const { return valid_; }
    const PlotArea& area() const { return area_; }

    double timeMin() const { return tMin_; }
    double timeMax() const { return tMax_; }
    double priceMin() const { return pMin_; }
    double priceMax() const { return pMax_; }

    double xFor(double timestamp) const;
    double yFor(double price) const;
    double timeAt(double x) const;

private:
    PlotArea area_;
    bool valid_ = false;
    double tMin_ = 0.0;
    double tMax_ = 1.0;
    double pMin_ = 0.0;
    double pMax_ = 1.0;
};

struct HoverHit {
    std::size_t seriesIndex;
    std::size_t pointIndex;
    PricePoint point;
    double x;
    double y;
};

// For each series the sample nearest in time to the pointer is projected to
// pixels; the series whose point is horizontally closest wins if it is
// within threshold pixels.
std::optional<HoverHit> findNearestPoint(const std::vector<ChartSeries>& series,
                                         const ChartLayout& layout,
                                         double pointerX,
                                         double threshold = kHoverThresholdPx);

// Per-chart hover record; cleared whenever the chart's data is replaced
struct HoverState {
    bool inside = false;
    std::optional<HoverHit> hit;

    void reset() {
        inside = false;
        hit.reset();
    }
};

struct AxisTick {
    double value;
    std::string label;
};

std::vector<AxisTick> timeTicks(double tMin, double tMax, TimeRange range, const std::string& timezone);
std::vector<AxisTick> priceTicks(double pMin, double pMax, int target = 6);

// "Time (Sydney)" for intraday ranges, "Time/Date (Sydney)" otherwise
std::string timeAxisLabel(TimeRange range, const std::string& timezone);

// Formats a unix timestamp in the given zone with a strftime-style pattern
std::string formatInZone(std::int64_t timestamp, const std::string& timezone, const char* pattern);

// Hover text: symbol, price, time in the display zone, then the daily and
// hourly change pairs. The time carries seconds when the point lies within
// the last 1.5 days of now.
std::string tooltipText(const std::string& symbol,
                        const PricePoint& point,
                        const DerivedMetrics& metrics,
                        const std::string& timezone,
                        std::int64_t now);

}
