#include "app/SortState.hpp"
#include <algorithm>
#include <cctype>

namespace ShareMonitor {

namespace {

double numericKey(const MonitorRow& row, SortColumn column) {
    if (row.error) return 0.0;
    const DerivedMetrics& m = row.metrics;
    switch (column) {
        case SortColumn::Price: return m.price;
        case SortColumn::Open: return m.openPrice;
        case SortColumn::DailyPct: return m.dailyChangePct;
        case SortColumn::DailyAbs: return m.dailyChangeAbs;
        case SortColumn::HourlyPct: return m.hourlyChangePct;
        case SortColumn::HourlyAbs: return m.hourlyChangeAbs;
        default: return 0.0;
    }
}

std::string lowered(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool lessThan(const MonitorRow& a, const MonitorRow& b, SortColumn column) {
    switch (column) {
        case SortColumn::Symbol:
            return lowered(a.symbol) < lowered(b.symbol);
        case SortColumn::Visible:
            // Shown rows (check mark) before hidden ones
            return a.visible && !b.visible;
        default:
            return numericKey(a, column) < numericKey(b, column);
    }
}

}

const char* columnTitle(SortColumn column) {
    switch (column) {
        case SortColumn::Visible: return "CHART";
        case SortColumn::Symbol: return "SHARE";
        case SortColumn::Price: return "PRICE";
        case SortColumn::Open: return "OPEN";
        case SortColumn::DailyPct: return "DAILY %";
        case SortColumn::DailyAbs: return "DAILY $";
        case SortColumn::HourlyPct: return "HOURLY %";
        case SortColumn::HourlyAbs: return "HOURLY $";
    }
    return "";
}

const std::vector<SortColumn>& monitorColumns() {
    static const std::vector<SortColumn> columns = {
        SortColumn::Visible, SortColumn::Symbol, SortColumn::Price, SortColumn::Open,
        SortColumn::DailyPct, SortColumn::DailyAbs, SortColumn::HourlyPct, SortColumn::HourlyAbs
    };
    return columns;
}

void SortState::click(SortColumn column) {
    descending_ = (column == column_) ? !descending_ : false;
    column_ = column;
}

void SortState::apply(std::vector<MonitorRow>& rows) const {
    const SortColumn column = column_;
    if (descending_) {
        std::stable_sort(rows.begin(), rows.end(), [column](const MonitorRow& a, const MonitorRow& b) {
            return lessThan(b, a, column);
        });
    } else {
        std::stable_sort(rows.begin(), rows.end(), [column](const MonitorRow& a, const MonitorRow& b) {
            return lessThan(a, b, column);
        });
    }
}

}
