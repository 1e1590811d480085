#pragma once
#include <string>
#include <vector>
#include "services/MetricCalculator.hpp"

namespace ShareMonitor {

enum class SortColumn {
    Visible,
    Symbol,
    Price,
    Open,
    DailyPct,
    DailyAbs,
    HourlyPct,
    HourlyAbs
};

const char* columnTitle(SortColumn column);
const std::vector<SortColumn>& monitorColumns();

// One line of the aggregate table
struct MonitorRow {
    std::string symbol;
    bool visible = true;
    bool error = false;
    DerivedMetrics metrics;
};

// Column sort for the monitor table. Clicking the sorted column flips the
// direction, clicking any other column sorts it ascending.
class SortState {
public:
    void click(SortColumn column);

    SortColumn column() const { return column_; }
    bool descending() const { return descending_; }

    // Stable; errored rows compare as 0.0 in numeric columns
    void apply(std::vector<MonitorRow>& rows) const;

private:
    SortColumn column_ = SortColumn::Symbol;
    bool descending_ = false;
};

}
