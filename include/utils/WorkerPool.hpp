#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace ShareMonitor {

// Fixed-size thread pool. Queue state is shared with the threads so that a
// non-waiting shutdown can detach them while a task is still running.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<typename std::invoke_result<F>::type> {
        using Result = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->stopping) throw std::runtime_error("WorkerPool is shut down");
            state_->queue.emplace_back([task]() { (*task)(); });
        }
        state_->cv.notify_one();
        return future;
    }

    // Drops queued tasks (their futures report broken_promise). With
    // wait == false running tasks are left to finish on detached threads.
    void shutdown(bool wait);

    std::size_t size() const { return threads_.size(); }
    std::size_t pending() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> queue;
        bool stopping = false;
    };

    static void workerLoop(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::vector<std::thread> threads_;
};

}
