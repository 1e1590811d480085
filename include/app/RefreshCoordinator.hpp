#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include "app/AppState.hpp"
#include "utils/Dispatcher.hpp"

namespace ShareMonitor {

class StockService;
class WorkerPool;

enum class FetchReason {
    Startup,
    Timer,
    Manual,
    RangeChanged,
    SettingsChanged,
    SymbolAdded,
    SymbolRemoved,
    TabChanged
};

const char* toString(FetchReason reason);

enum class AddResult {
    Added,
    AlreadyTracked,
    Empty
};

constexpr std::size_t kFetchWorkers = 5;
constexpr std::chrono::seconds kRefreshInterval{30};

/**
 * Owns the application state and decides when market data is fetched.
 *
 * Fetch batches run on a worker pool; their results come back through the
 * Dispatcher and are merged on the main thread only. Each request carries a
 * generation number and a batch older than the last one applied is dropped,
 * so a slow fetch can never overwrite newer data.
 *
 * All public methods must be called on the main thread.
 */
class RefreshCoordinator {
public:
    using UpdateCallback = std::function<void(const SnapshotBatch&)>;
    using StateCallback = std::function<void()>;
    using StatusCallback = std::function<void(const StatusMessage&)>;
    using FetchFinishedCallback = std::function<void(bool)>;

    RefreshCoordinator(Config& config,
                       std::shared_ptr<StockService> service,
                       std::shared_ptr<Dispatcher> dispatcher,
                       std::size_t workers = kFetchWorkers);
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    // Reads the persisted symbol list and settings
    void load();

    const AppState& state() const { return state_; }

    // Fired after a batch has been merged into the snapshot table
    void setUpdateCallback(UpdateCallback cb) { onUpdate_ = std::move(cb); }
    // Fired when symbols, visibility, sort order or settings change without new data
    void setStateCallback(StateCallback cb) { onState_ = std::move(cb); }
    void setStatusCallback(StatusCallback cb) { onStatus_ = std::move(cb); }
    // Fired once per completed request; false for a whole-batch failure
    void setFetchFinishedCallback(FetchFinishedCallback cb) { onFetchFinished_ = std::move(cb); }

    std::shared_future<SnapshotBatch> requestFetch(FetchReason reason);
    bool isFetching() const { return inFlight_ > 0; }

    AddResult addSymbol(const std::string& input);
    bool removeSymbol(const std::string& symbol);
    void toggleVisibility(const std::string& symbol);
    void sortBy(SortColumn column);

    void setActiveRange(TimeRange range);
    void applySettings(const Settings& settings);

    void startAutoRefresh(std::chrono::milliseconds interval = kRefreshInterval);
    void stopAutoRefresh();

    // Cancels queued work without waiting for running fetches and persists
    // the symbol list. Completions that arrive afterwards are ignored.
    void shutdown();

private:
    void applyBatch(std::uint64_t generation, const SnapshotBatch& batch);
    void failBatch(std::uint64_t generation, const std::string& reason);
    void publishStatus(StatusMessage::Level level, const std::string& text);
    void notifyState();
    void persistSymbols();

    Config& config_;
    std::shared_ptr<StockService> service_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<WorkerPool> pool_;

    AppState state_;
    std::uint64_t nextGeneration_ = 0;
    int inFlight_ = 0;
    Dispatcher::TimerId refreshTimer_ = 0;
    bool shutDown_ = false;

    // Completion messages hold a weak reference; resetting it disarms them
    std::shared_ptr<bool> alive_;

    UpdateCallback onUpdate_;
    StateCallback onState_;
    StatusCallback onStatus_;
    FetchFinishedCallback onFetchFinished_;
};

}
