#include "app/RefreshCoordinator.hpp"
#include "services/StockService.hpp"
#include "utils/Format.hpp"
#include "utils/WorkerPool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <exception>
#include <utility>

namespace ShareMonitor {

const char* toString(FetchReason reason) {
    switch (reason) {
        case FetchReason::Startup: return "startup";
        case FetchReason::Timer: return "timer";
        case FetchReason::Manual: return "manual";
        case FetchReason::RangeChanged: return "range change";
        case FetchReason::SettingsChanged: return "settings change";
        case FetchReason::SymbolAdded: return "symbol added";
        case FetchReason::SymbolRemoved: return "symbol removed";
        case FetchReason::TabChanged: return "tab change";
    }
    return "unknown";
}

RefreshCoordinator::RefreshCoordinator(Config& config,
                                       std::shared_ptr<StockService> service,
                                       std::shared_ptr<Dispatcher> dispatcher,
                                       std::size_t workers)
    : config_(config),
      service_(std::move(service)),
      dispatcher_(std::move(dispatcher)),
      pool_(std::make_unique<WorkerPool>(workers)),
      alive_(std::make_shared<bool>(true)) {}

RefreshCoordinator::~RefreshCoordinator() {
    shutdown();
}

void RefreshCoordinator::load() {
    state_.symbols = config_.loadStockSymbols();
    state_.settings = config_.loadSettings();
    state_.activeRange = state_.settings.timeRange;
    for (const auto& sym : state_.symbols) {
        state_.visibility.emplace(sym, true);
    }
    spdlog::info("Loaded {} symbols, range {}, timezone {}",
                 state_.symbols.size(),
                 timeRangeSpec(state_.activeRange).label,
                 state_.settings.timezone);
}

std::shared_future<SnapshotBatch> RefreshCoordinator::requestFetch(FetchReason reason) {
    std::promise<SnapshotBatch> empty;
    empty.set_value(SnapshotBatch{});

    if (shutDown_) {
        spdlog::debug("Fetch request ({}) ignored after shutdown", toString(reason));
        return empty.get_future().share();
    }

    if (state_.symbols.empty()) {
        publishStatus(StatusMessage::Level::Info, "No stocks to monitor.");
        notifyState();
        return empty.get_future().share();
    }

    const std::uint64_t generation = ++nextGeneration_;
    const std::vector<std::string> symbols = state_.symbols;
    const TimeRange range = state_.activeRange;

    spdlog::info("Fetching {} symbols ({}, {}) generation {}",
                 symbols.size(), toString(reason), timeRangeSpec(range).label, generation);

    ++inFlight_;
    publishStatus(StatusMessage::Level::Busy, "Fetching data...");

    // The task may outlive this object on a detached worker, so it holds its
    // own references and reaches back only through the dispatcher
    std::shared_ptr<StockService> service = service_;
    std::shared_ptr<Dispatcher> dispatcher = dispatcher_;
    std::weak_ptr<bool> token = alive_;

    try {
        auto future = pool_->submit([this, service, dispatcher, token, symbols, range, generation]() {
            try {
                SnapshotBatch batch = service->fetchAllStocks(symbols, range);
                dispatcher->post([this, token, generation, batch]() {
                    if (token.expired()) return;
                    applyBatch(generation, batch);
                });
                return batch;
            } catch (const std::exception& e) {
                std::string message = e.what();
                dispatcher->post([this, token, generation, message]() {
                    if (token.expired()) return;
                    failBatch(generation, message);
                });
                throw;
            }
        });
        return future.share();
    } catch (const std::runtime_error& e) {
        // Pool already stopped
        --inFlight_;
        spdlog::warn("Could not queue fetch: {}", e.what());
        return empty.get_future().share();
    }
}

void RefreshCoordinator::applyBatch(std::uint64_t generation, const SnapshotBatch& batch) {
    if (inFlight_ > 0) --inFlight_;

    if (generation <= state_.lastAppliedGeneration) {
        spdlog::warn("Discarding stale batch {} (last applied {})",
                     generation, state_.lastAppliedGeneration);
        if (onFetchFinished_) onFetchFinished_(true);
        return;
    }
    state_.lastAppliedGeneration = generation;

    std::size_t merged = 0;
    for (const auto& entry : batch) {
        // Removed while the fetch was running
        if (!state_.isTracked(entry.first)) continue;
        state_.snapshots[entry.first] = entry.second;
        state_.visibility.emplace(entry.first, true);
        ++merged;
    }
    spdlog::info("Applied batch {} ({} snapshots)", generation, merged);

    publishStatus(StatusMessage::Level::Success,
                  "Data loaded successfully | Last update: " + formatClock(std::time(nullptr)));

    if (onUpdate_) onUpdate_(state_.snapshots);
    if (onFetchFinished_) onFetchFinished_(true);
}

void RefreshCoordinator::failBatch(std::uint64_t generation, const std::string& reason) {
    if (inFlight_ > 0) --inFlight_;
    spdlog::error("Fetch batch {} failed: {}", generation, reason);

    // Newer data is already on screen
    if (generation <= state_.lastAppliedGeneration) {
        if (onFetchFinished_) onFetchFinished_(true);
        return;
    }
    publishStatus(StatusMessage::Level::Error, "Critical error during data process.");
    if (onFetchFinished_) onFetchFinished_(false);
}

AddResult RefreshCoordinator::addSymbol(const std::string& input) {
    const std::string symbol = normalizeSymbol(input);
    if (symbol.empty()) {
        publishStatus(StatusMessage::Level::Error, "Please enter a ticker symbol.");
        return AddResult::Empty;
    }
    if (state_.isTracked(symbol)) {
        publishStatus(StatusMessage::Level::Warning, symbol + " is already being monitored.");
        return AddResult::AlreadyTracked;
    }

    state_.symbols.push_back(symbol);
    state_.visibility[symbol] = true;
    spdlog::info("Added {}", symbol);
    persistSymbols();
    notifyState();
    requestFetch(FetchReason::SymbolAdded);
    return AddResult::Added;
}

bool RefreshCoordinator::removeSymbol(const std::string& symbol) {
    auto it = std::find(state_.symbols.begin(), state_.symbols.end(), symbol);
    if (it == state_.symbols.end()) return false;

    state_.symbols.erase(it);
    state_.snapshots.erase(symbol);
    state_.visibility.erase(symbol);
    spdlog::info("Removed {}", symbol);
    persistSymbols();

    publishStatus(StatusMessage::Level::Success, "Removed " + symbol + " successfully.");
    notifyState();
    if (!state_.symbols.empty()) requestFetch(FetchReason::SymbolRemoved);
    return true;
}

void RefreshCoordinator::toggleVisibility(const std::string& symbol) {
    if (!state_.isTracked(symbol)) return;
    state_.visibility[symbol] = !state_.isVisible(symbol);
    notifyState();
}

void RefreshCoordinator::sortBy(SortColumn column) {
    state_.sort.click(column);
    notifyState();
}

void RefreshCoordinator::setActiveRange(TimeRange range) {
    if (range == state_.activeRange) return;
    spdlog::info("Chart range changed to {}", timeRangeSpec(range).label);
    state_.activeRange = range;
    requestFetch(FetchReason::RangeChanged);
}

void RefreshCoordinator::applySettings(const Settings& settings) {
    const bool changed = settings != state_.settings;
    const bool rangeMoved = settings.timeRange != state_.activeRange;

    state_.settings = settings;
    state_.activeRange = settings.timeRange;
    if (!config_.saveSettings(settings)) {
        publishStatus(StatusMessage::Level::Warning, "Could not save settings.");
    }
    notifyState();

    if (!changed && !rangeMoved) {
        spdlog::debug("Settings saved unchanged");
        return;
    }
    spdlog::info("Settings applied: range {}, timezone {}",
                 timeRangeSpec(settings.timeRange).label, settings.timezone);
    requestFetch(FetchReason::SettingsChanged);
}

void RefreshCoordinator::startAutoRefresh(std::chrono::milliseconds interval) {
    if (shutDown_ || refreshTimer_ != 0) return;
    std::weak_ptr<bool> token = alive_;
    refreshTimer_ = dispatcher_->scheduleEvery(interval, [this, token]() {
        if (token.expired()) return;
        requestFetch(FetchReason::Timer);
    });
    spdlog::info("Auto-refresh every {}s", std::chrono::duration_cast<std::chrono::seconds>(interval).count());
}

void RefreshCoordinator::stopAutoRefresh() {
    if (refreshTimer_ == 0) return;
    dispatcher_->cancel(refreshTimer_);
    refreshTimer_ = 0;
}

void RefreshCoordinator::shutdown() {
    if (shutDown_) return;
    shutDown_ = true;
    spdlog::info("Shutting down refresh coordinator");

    stopAutoRefresh();
    alive_.reset();
    pool_->shutdown(false);
    persistSymbols();
}

void RefreshCoordinator::publishStatus(StatusMessage::Level level, const std::string& text) {
    if (onStatus_) onStatus_(StatusMessage{level, "Status: " + text});
}

void RefreshCoordinator::notifyState() {
    if (onState_) onState_();
}

void RefreshCoordinator::persistSymbols() {
    if (!config_.saveStockSymbols(state_.symbols)) {
        spdlog::warn("Symbol list was not saved to {}", config_.stocksPath());
    }
}

}
