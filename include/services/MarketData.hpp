#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ShareMonitor {

// Unix seconds (UTC) and closing price
struct PricePoint {
    std::int64_t timestamp;
    double close;
};

using PriceSeries = std::vector<PricePoint>;

struct PriceHistory {
    PriceSeries points;
    // Sample spacing reported by the provider, 0 when unknown
    int granularitySeconds = 0;

    bool empty() const { return points.empty(); }
};

// Scalar "current info" fields; either may be missing from a response
struct QuoteInfo {
    std::optional<double> price;
    std::optional<double> openPrice;
};

enum class TimeRange {
    SixMonths,
    ThirtyDays,
    SevenDays,
    TwentyFourHours,
    SixHours,
    TenMinutes
};

struct TimeRangeSpec {
    TimeRange range;
    const char* label;
    const char* period;
    const char* interval;
    bool intraday;
};

const std::vector<TimeRangeSpec>& timeRanges();
const TimeRangeSpec& timeRangeSpec(TimeRange range);
std::optional<TimeRange> timeRangeFromLabel(const std::string& label);

constexpr TimeRange kDefaultTimeRange = TimeRange::ThirtyDays;

// Short-resolution query used for the hourly metric
constexpr const char* kIntradayPeriod = "1d";
constexpr const char* kIntradayInterval = "1m";

const std::vector<std::string>& supportedTimezones();
const std::string& defaultTimezone();
bool isSupportedTimezone(const std::string& zone);
// "Australia/Sydney" -> "Sydney"
std::string timezoneCity(const std::string& zone);

// Trims, uppercases and appends the ASX suffix when no exchange marker is present.
// Returns an empty string for blank input.
std::string normalizeSymbol(const std::string& raw);

// Sorted, deduplicated, uppercased; blank entries dropped
std::vector<std::string> canonicalSymbolSet(const std::vector<std::string>& symbols);

}
