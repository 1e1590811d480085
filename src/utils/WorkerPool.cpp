#include "utils/WorkerPool.hpp"

namespace ShareMonitor {

WorkerPool::WorkerPool(std::size_t threadCount) : state_(std::make_shared<State>()) {
    if (threadCount == 0) threadCount = 1;
    threads_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        threads_.emplace_back(workerLoop, state_);
    }
}

WorkerPool::~WorkerPool() {
    shutdown(true);
}

void WorkerPool::workerLoop(std::shared_ptr<State> state) {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state]() { return state->stopping || !state->queue.empty(); });
            if (state->stopping) return;
            job = std::move(state->queue.front());
            state->queue.pop_front();
        }
        // packaged_task stores any exception in the future
        job();
    }
}

void WorkerPool::shutdown(bool wait) {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        dropped.swap(state_->queue);
    }
    state_->cv.notify_all();
    // Destroying the packaged tasks outside the lock breaks their promises
    dropped.clear();

    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (wait) t.join();
        else t.detach();
    }
    threads_.clear();
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

}
