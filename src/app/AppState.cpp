#include "app/AppState.hpp"
#include <algorithm>

namespace ShareMonitor {

bool AppState::isTracked(const std::string& symbol) const {
    return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

bool AppState::isVisible(const std::string& symbol) const {
    auto it = visibility.find(symbol);
    return it == visibility.end() || it->second;
}

const QuoteSnapshot* AppState::snapshot(const std::string& symbol) const {
    auto it = snapshots.find(symbol);
    return it == snapshots.end() ? nullptr : &it->second;
}

TimeRange AppState::displayedRange() const {
    for (const auto& entry : snapshots) {
        if (!entry.second.error) return entry.second.range;
    }
    return activeRange;
}

std::vector<MonitorRow> AppState::monitorRows() const {
    std::vector<MonitorRow> rows;
    rows.reserve(snapshots.size());
    // std::map iteration gives the alphabetical base order the sort is stable against
    for (const auto& entry : snapshots) {
        MonitorRow row;
        row.symbol = entry.first;
        row.visible = isVisible(entry.first);
        row.error = entry.second.error;
        if (!row.error) row.metrics = entry.second.metrics;
        rows.push_back(row);
    }
    sort.apply(rows);
    return rows;
}

}
