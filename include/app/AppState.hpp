#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "app/SortState.hpp"
#include "services/StockService.hpp"
#include "utils/Config.hpp"

namespace ShareMonitor {

struct StatusMessage {
    enum class Level {
        Info,
        Busy,
        Success,
        Warning,
        Error
    };

    Level level = Level::Info;
    std::string text;
};

// Everything the interface shows. Owned by RefreshCoordinator and only
// touched on the main thread.
struct AppState {
    std::vector<std::string> symbols;
    std::map<std::string, bool> visibility;
    SnapshotBatch snapshots;
    Settings settings;
    TimeRange activeRange = kDefaultTimeRange;
    SortState sort;
    std::uint64_t lastAppliedGeneration = 0;

    bool isTracked(const std::string& symbol) const;
    bool isVisible(const std::string& symbol) const;
    const QuoteSnapshot* snapshot(const std::string& symbol) const;

    // Range the stored snapshots were fetched for; activeRange until a
    // successful snapshot exists
    TimeRange displayedRange() const;

    // Snapshot table in the current sort order
    std::vector<MonitorRow> monitorRows() const;
};

}
