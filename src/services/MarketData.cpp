#include "services/MarketData.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ShareMonitor {

namespace {

const char* kExchangeSuffix = ".AX";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

}

const std::vector<TimeRangeSpec>& timeRanges() {
    // Weekly and daily bars for the long ranges keep the tick count manageable
    static const std::vector<TimeRangeSpec> ranges = {
        {TimeRange::SixMonths, "6 Months", "6mo", "1wk", false},
        {TimeRange::ThirtyDays, "30 Days", "30d", "1d", false},
        {TimeRange::SevenDays, "7 Days", "7d", "1h", false},
        {TimeRange::TwentyFourHours, "24 Hrs", "1d", "15m", true},
        {TimeRange::SixHours, "6 Hrs", "1d", "5m", true},
        {TimeRange::TenMinutes, "10 Mins", "1d", "1m", true},
    };
    return ranges;
}

const TimeRangeSpec& timeRangeSpec(TimeRange range) {
    for (const auto& spec : timeRanges()) {
        if (spec.range == range) return spec;
    }
    throw std::out_of_range("unknown time range");
}

std::optional<TimeRange> timeRangeFromLabel(const std::string& label) {
    for (const auto& spec : timeRanges()) {
        if (label == spec.label) return spec.range;
    }
    return std::nullopt;
}

const std::vector<std::string>& supportedTimezones() {
    static const std::vector<std::string> zones = {
        "Australia/Sydney", "Australia/Brisbane", "Australia/Perth"
    };
    return zones;
}

const std::string& defaultTimezone() {
    return supportedTimezones().front();
}

bool isSupportedTimezone(const std::string& zone) {
    const auto& zones = supportedTimezones();
    return std::find(zones.begin(), zones.end(), zone) != zones.end();
}

std::string timezoneCity(const std::string& zone) {
    size_t slash = zone.rfind('/');
    return slash == std::string::npos ? zone : zone.substr(slash + 1);
}

std::string normalizeSymbol(const std::string& raw) {
    std::string symbol = toUpper(trim(raw));
    if (symbol.empty()) return symbol;

    if (symbol.find('.') == std::string::npos) symbol += kExchangeSuffix;

    size_t start = symbol.find_first_not_of('.');
    if (start == std::string::npos) return "";
    size_t end = symbol.find_last_not_of('.');
    return symbol.substr(start, end - start + 1);
}

std::vector<std::string> canonicalSymbolSet(const std::vector<std::string>& symbols) {
    std::vector<std::string> result;
    result.reserve(symbols.size());
    for (const auto& s : symbols) {
        std::string cleaned = toUpper(trim(s));
        if (!cleaned.empty()) result.push_back(cleaned);
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

}
