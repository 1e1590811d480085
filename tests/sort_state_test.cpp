#include <iostream>
#include <string>
#include <vector>
#include "app/SortState.hpp"

using namespace ShareMonitor;

namespace {

MonitorRow row(const std::string& symbol, double dailyPct, bool error = false, bool visible = true) {
    MonitorRow r;
    r.symbol = symbol;
    r.error = error;
    r.visible = visible;
    r.metrics.dailyChangePct = dailyPct;
    return r;
}

std::string order(const std::vector<MonitorRow>& rows) {
    std::string out;
    for (const auto& r : rows) {
        if (!out.empty()) out += ",";
        out += r.symbol;
    }
    return out;
}

}

int main() {
    {
        SortState sort;
        if (sort.column() != SortColumn::Symbol || sort.descending()) {
            std::cerr << "Default sort should be symbol ascending\n";
            return 1;
        }
        sort.click(SortColumn::DailyPct);
        if (sort.column() != SortColumn::DailyPct || sort.descending()) {
            std::cerr << "New column should sort ascending\n";
            return 1;
        }
        sort.click(SortColumn::DailyPct);
        if (!sort.descending()) {
            std::cerr << "Second click should flip direction\n";
            return 1;
        }
        sort.click(SortColumn::Price);
        if (sort.column() != SortColumn::Price || sort.descending()) {
            std::cerr << "Switching column should reset to ascending\n";
            return 1;
        }
    }

    {
        // Errored rows sort as 0.0 between losers and gainers
        std::vector<MonitorRow> rows = {
            row("CCC.AX", 2.5), row("AAA.AX", -1.0), row("ERR.AX", 99.0, true), row("BBB.AX", 0.5)
        };
        SortState sort;
        sort.click(SortColumn::DailyPct);
        sort.apply(rows);
        if (order(rows) != "AAA.AX,ERR.AX,BBB.AX,CCC.AX") {
            std::cerr << "Ascending daily % order wrong: " << order(rows) << "\n";
            return 1;
        }
        sort.click(SortColumn::DailyPct);
        sort.apply(rows);
        if (order(rows) != "CCC.AX,BBB.AX,ERR.AX,AAA.AX") {
            std::cerr << "Descending daily % order wrong: " << order(rows) << "\n";
            return 1;
        }
    }

    {
        std::vector<MonitorRow> rows = {row("pl8.AX", 0), row("BHP.AX", 0), row("Abc.AX", 0)};
        SortState sort;
        sort.apply(rows);
        if (order(rows) != "Abc.AX,BHP.AX,pl8.AX") {
            std::cerr << "Symbol sort should ignore case: " << order(rows) << "\n";
            return 1;
        }
    }

    {
        // Stable for equal keys
        std::vector<MonitorRow> rows = {row("B.AX", 1.0), row("A.AX", 1.0), row("C.AX", 1.0)};
        SortState sort;
        sort.click(SortColumn::DailyPct);
        sort.apply(rows);
        if (order(rows) != "B.AX,A.AX,C.AX") {
            std::cerr << "Equal keys should keep their order: " << order(rows) << "\n";
            return 1;
        }
    }

    {
        std::vector<MonitorRow> rows = {row("A.AX", 0, false, false), row("B.AX", 0, false, true)};
        SortState sort;
        sort.click(SortColumn::Visible);
        sort.apply(rows);
        if (order(rows) != "B.AX,A.AX") {
            std::cerr << "Visible rows should sort first: " << order(rows) << "\n";
            return 1;
        }
    }

    if (std::string(columnTitle(SortColumn::HourlyAbs)) != "HOURLY $" || monitorColumns().size() != 8) {
        std::cerr << "Unexpected column titles\n";
        return 1;
    }

    std::cout << "sort_state_test passed\n";
    return 0;
}
