#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include "utils/WorkerPool.hpp"

using namespace ShareMonitor;

int main() {
    {
        WorkerPool pool(3);
        if (pool.size() != 3) {
            std::cerr << "Expected 3 threads\n";
            return 1;
        }
        auto a = pool.submit([] { return 2 + 2; });
        auto b = pool.submit([] { return std::string("done"); });
        if (a.get() != 4 || b.get() != "done") {
            std::cerr << "Task results not delivered\n";
            return 1;
        }
    }

    {
        WorkerPool pool(1);
        auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
        bool threw = false;
        try {
            f.get();
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "boom";
        }
        if (!threw) {
            std::cerr << "Task exception should reach the future\n";
            return 1;
        }
    }

    {
        // One thread busy on a gate, a second task queued behind it
        WorkerPool pool(1);
        std::promise<void> gate;
        std::shared_future<void> gateFuture = gate.get_future().share();
        std::promise<void> entered;
        auto running = pool.submit([gateFuture, &entered] {
            entered.set_value();
            gateFuture.wait();
            return 1;
        });
        entered.get_future().wait();
        auto queued = pool.submit([] { return 2; });
        if (pool.pending() != 1) {
            std::cerr << "Expected one queued task, got " << pool.pending() << "\n";
            return 1;
        }

        pool.shutdown(false);

        bool broken = false;
        try {
            queued.get();
        } catch (const std::future_error& e) {
            broken = e.code() == std::future_errc::broken_promise;
        }
        if (!broken) {
            std::cerr << "Dropped task should report broken_promise\n";
            return 1;
        }

        gate.set_value();
        if (running.wait_for(std::chrono::seconds(5)) != std::future_status::ready || running.get() != 1) {
            std::cerr << "Running task should finish after a non-waiting shutdown\n";
            return 1;
        }

        bool rejected = false;
        try {
            pool.submit([] { return 3; });
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        if (!rejected) {
            std::cerr << "submit after shutdown should throw\n";
            return 1;
        }
    }

    std::cout << "worker_pool_test passed\n";
    return 0;
}
