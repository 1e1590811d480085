#include "ui/ChartModel.hpp"
#include "utils/Format.hpp"
#include <glib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <memory>

namespace ShareMonitor {

namespace {

struct TimeZoneDeleter {
    void operator()(GTimeZone* tz) const { if (tz) g_time_zone_unref(tz); }
};

struct DateTimeDeleter {
    void operator()(GDateTime* dt) const { if (dt) g_date_time_unref(dt); }
};

using TimeZonePtr = std::unique_ptr<GTimeZone, TimeZoneDeleter>;
using DateTimePtr = std::unique_ptr<GDateTime, DateTimeDeleter>;

TimeZonePtr openZone(const std::string& id) {
    GTimeZone* tz = g_time_zone_new_identifier(id.c_str());
    if (!tz) {
        spdlog::warn("Unknown time zone '{}', using UTC", id);
        tz = g_time_zone_new_utc();
    }
    return TimeZonePtr(tz);
}

DateTimePtr inZone(std::int64_t timestamp, GTimeZone* tz) {
    DateTimePtr utc(g_date_time_new_from_unix_utc(timestamp));
    if (!utc) return nullptr;
    return DateTimePtr(g_date_time_to_timezone(utc.get(), tz));
}

std::string formatDateTime(GDateTime* dt, const char* pattern) {
    if (!dt) return "";
    gchar* text = g_date_time_format(dt, pattern);
    std::string out = text ? text : "";
    g_free(text);
    return out;
}

DateTimePtr localMidnight(GDateTime* dt, GTimeZone* tz) {
    return DateTimePtr(g_date_time_new(tz,
                                       g_date_time_get_year(dt),
                                       g_date_time_get_month(dt),
                                       g_date_time_get_day_of_month(dt),
                                       0, 0, 0.0));
}

enum class StepUnit {
    Seconds,
    Days,
    Months
};

struct TickStep {
    StepUnit unit;
    int count;
    double approxSeconds;
};

const std::vector<TickStep>& subDaySteps() {
    static const std::vector<TickStep> steps = {
        {StepUnit::Seconds, 60, 60}, {StepUnit::Seconds, 120, 120},
        {StepUnit::Seconds, 300, 300}, {StepUnit::Seconds, 600, 600},
        {StepUnit::Seconds, 900, 900}, {StepUnit::Seconds, 1800, 1800},
        {StepUnit::Seconds, 3600, 3600}, {StepUnit::Seconds, 7200, 7200},
        {StepUnit::Seconds, 10800, 10800}, {StepUnit::Seconds, 21600, 21600},
        {StepUnit::Seconds, 43200, 43200}
    };
    return steps;
}

const std::vector<TickStep>& calendarSteps() {
    static const std::vector<TickStep> steps = {
        {StepUnit::Days, 1, 86400.0}, {StepUnit::Days, 2, 2 * 86400.0},
        {StepUnit::Days, 7, 7 * 86400.0}, {StepUnit::Days, 14, 14 * 86400.0},
        {StepUnit::Months, 1, 30 * 86400.0}, {StepUnit::Months, 3, 91 * 86400.0},
        {StepUnit::Months, 6, 182 * 86400.0}, {StepUnit::Months, 12, 365 * 86400.0}
    };
    return steps;
}

TickStep pickStep(double span, bool intraday) {
    std::vector<TickStep> candidates = subDaySteps();
    if (!intraday) {
        const auto& cal = calendarSteps();
        candidates.insert(candidates.end(), cal.begin(), cal.end());
    }
    for (const auto& step : candidates) {
        if (span / step.approxSeconds <= kMaxTimeTicks) return step;
    }
    return candidates.back();
}

const char* labelPattern(const TickStep& step, bool intraday) {
    if (intraday || step.unit == StepUnit::Seconds) return "%H:%M";
    if (step.unit == StepUnit::Days) return "%Y-%m-%d";
    return "%Y-%m";
}

std::vector<std::int64_t> tickTimes(const TickStep& step, double tMin, double tMax, GTimeZone* tz) {
    std::vector<std::int64_t> out;
    const auto first = static_cast<std::int64_t>(std::floor(tMin));
    DateTimePtr local = inZone(first, tz);
    if (!local) return out;
    DateTimePtr midnight = localMidnight(local.get(), tz);
    if (!midnight) return out;

    // Guards against a pathological range producing an endless loop
    const std::size_t limit = 1000;

    if (step.unit == StepUnit::Seconds) {
        const std::int64_t base = g_date_time_to_unix(midnight.get());
        std::int64_t t = base + ((first - base + step.count - 1) / step.count) * step.count;
        for (; t <= tMax && out.size() < limit; t += step.count) out.push_back(t);
        return out;
    }

    DateTimePtr cursor;
    if (step.unit == StepUnit::Days) {
        cursor = std::move(midnight);
    } else {
        int month = g_date_time_get_month(local.get());
        month -= (month - 1) % step.count;
        cursor.reset(g_date_time_new(tz, g_date_time_get_year(local.get()), month, 1, 0, 0, 0.0));
    }

    while (cursor && out.size() < limit) {
        const std::int64_t t = g_date_time_to_unix(cursor.get());
        if (t > tMax) break;
        if (t >= tMin) out.push_back(t);
        GDateTime* next = step.unit == StepUnit::Days
            ? g_date_time_add_days(cursor.get(), step.count)
            : g_date_time_add_months(cursor.get(), step.count);
        cursor.reset(next);
    }
    return out;
}

}

const ChartColor& seriesColor(std::size_t index) {
    static const std::vector<ChartColor> palette = {
        {0.12, 0.47, 0.71}, {1.00, 0.50, 0.05}, {0.17, 0.63, 0.17},
        {0.84, 0.15, 0.16}, {0.58, 0.40, 0.74}, {0.55, 0.34, 0.29},
        {0.89, 0.47, 0.76}, {0.50, 0.50, 0.50}, {0.74, 0.74, 0.13},
        {0.09, 0.75, 0.81}
    };
    return palette[index % palette.size()];
}

const ChartColor& gainColor() {
    static const ChartColor color{0.30, 0.69, 0.31};
    return color;
}

const ChartColor& lossColor() {
    static const ChartColor color{0.90, 0.22, 0.21};
    return color;
}

ChartLayout::ChartLayout(const std::vector<ChartSeries>& series, const PlotArea& area) : area_(area) {
    double tLo = std::numeric_limits<double>::max();
    double tHi = std::numeric_limits<double>::lowest();
    double pLo = std::numeric_limits<double>::max();
    double pHi = std::numeric_limits<double>::lowest();
    bool any = false;

    for (const auto& s : series) {
        for (const auto& p : s.points) {
            tLo = std::min(tLo, static_cast<double>(p.timestamp));
            tHi = std::max(tHi, static_cast<double>(p.timestamp));
            pLo = std::min(pLo, p.close);
            pHi = std::max(pHi, p.close);
            any = true;
        }
    }
    if (!any || area.width <= 0.0 || area.height <= 0.0) return;

    const double tPad = tHi > tLo ? (tHi - tLo) * kTimePaddingFraction : 60.0;
    tMin_ = tLo - tPad;
    tMax_ = tHi + tPad;

    const double pPad = pHi > pLo ? (pHi - pLo) * 0.05 : std::max(std::fabs(pHi) * 0.01, 0.01);
    pMin_ = pLo - pPad;
    pMax_ = pHi + pPad;

    valid_ = true;
}

double ChartLayout::xFor(double timestamp) const {
    return area_.left + (timestamp - tMin_) / (tMax_ - tMin_) * area_.width;
}

double ChartLayout::yFor(double price) const {
    return area_.top + area_.height - (price - pMin_) / (pMax_ - pMin_) * area_.height;
}

double ChartLayout::timeAt(double x) const {
    return tMin_ + (x - area_.left) / area_.width * (tMax_ - tMin_);
}

std::optional<HoverHit> findNearestPoint(const std::vector<ChartSeries>& series,
                                         const ChartLayout& layout,
                                         double pointerX,
                                         double threshold) {
    if (!layout.valid()) return std::nullopt;

    const double t = layout.timeAt(pointerX);
    std::optional<HoverHit> best;
    double bestDistance = std::numeric_limits<double>::infinity();

    for (std::size_t i = 0; i < series.size(); ++i) {
        const PriceSeries& pts = series[i].points;
        if (pts.empty()) continue;

        auto it = std::lower_bound(pts.begin(), pts.end(), t,
            [](const PricePoint& p, double value) { return static_cast<double>(p.timestamp) < value; });
        std::size_t idx = static_cast<std::size_t>(it - pts.begin());
        if (idx == pts.size()) {
            idx = pts.size() - 1;
        } else if (idx > 0) {
            const double before = t - static_cast<double>(pts[idx - 1].timestamp);
            const double after = static_cast<double>(pts[idx].timestamp) - t;
            if (before <= after) --idx;
        }

        const PricePoint& p = pts[idx];
        const double px = layout.xFor(static_cast<double>(p.timestamp));
        const double distance = std::fabs(px - pointerX);
        if (distance < bestDistance && distance < threshold) {
            bestDistance = distance;
            best = HoverHit{i, idx, p, px, layout.yFor(p.close)};
        }
    }
    return best;
}

std::vector<AxisTick> timeTicks(double tMin, double tMax, TimeRange range, const std::string& timezone) {
    std::vector<AxisTick> ticks;
    if (!(tMax > tMin)) return ticks;

    const TimeRangeSpec& spec = timeRangeSpec(range);
    TickStep step = range == TimeRange::TwentyFourHours
        ? TickStep{StepUnit::Seconds, 3600, 3600}
        : pickStep(tMax - tMin, spec.intraday);

    TimeZonePtr tz = openZone(timezone);
    const char* pattern = labelPattern(step, spec.intraday);
    for (std::int64_t t : tickTimes(step, tMin, tMax, tz.get())) {
        DateTimePtr local = inZone(t, tz.get());
        ticks.push_back(AxisTick{static_cast<double>(t), formatDateTime(local.get(), pattern)});
    }
    return ticks;
}

std::vector<AxisTick> priceTicks(double pMin, double pMax, int target) {
    std::vector<AxisTick> ticks;
    if (!(pMax > pMin) || target <= 0) return ticks;

    const double rough = (pMax - pMin) / target;
    const double magnitude = std::pow(10.0, std::floor(std::log10(rough)));
    const double norm = rough / magnitude;
    double nice = 10.0;
    if (norm < 1.5) nice = 1.0;
    else if (norm < 3.0) nice = 2.0;
    else if (norm < 7.0) nice = 5.0;
    const double step = nice * magnitude;

    const int decimals = step >= 1.0 ? 0 : std::min(4, static_cast<int>(std::ceil(-std::log10(step))));
    for (double v = std::ceil(pMin / step) * step; v <= pMax + step * 1e-9; v += step) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
        ticks.push_back(AxisTick{v, buf});
    }
    return ticks;
}

std::string timeAxisLabel(TimeRange range, const std::string& timezone) {
    const std::string city = timezoneCity(timezone);
    return timeRangeSpec(range).intraday ? "Time (" + city + ")" : "Time/Date (" + city + ")";
}

std::string formatInZone(std::int64_t timestamp, const std::string& timezone, const char* pattern) {
    TimeZonePtr tz = openZone(timezone);
    DateTimePtr local = inZone(timestamp, tz.get());
    return formatDateTime(local.get(), pattern);
}

std::string tooltipText(const std::string& symbol,
                        const PricePoint& point,
                        const DerivedMetrics& metrics,
                        const std::string& timezone,
                        std::int64_t now) {
    const std::int64_t recent = now - static_cast<std::int64_t>(1.5 * 86400);
    const char* pattern = point.timestamp > recent ? "%Y-%m-%d %H:%M:%S" : "%Y-%m-%d";

    std::string text = symbol + "\n";
    text += "Price: " + formatPrice(point.close) + "\n";
    text += "Time (" + timezoneCity(timezone) + "): " + formatInZone(point.timestamp, timezone, pattern) + "\n";
    text += "\n";
    text += "Daily %: " + formatChangePct(metrics.dailyChangePct) + "\n";
    text += "Daily $: " + formatChangeAbs(metrics.dailyChangeAbs, metrics.dailyChangePct) + "\n";
    text += "Hourly %: " + formatChangePct(metrics.hourlyChangePct) + "\n";
    text += "Hourly $: " + formatChangeAbs(metrics.hourlyChangeAbs, metrics.hourlyChangePct);
    return text;
}

}
