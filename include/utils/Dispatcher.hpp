#pragma once
#include <chrono>
#include <functional>

namespace ShareMonitor {

// Message queue onto the thread that owns the interface. post() may be
// called from any thread; every task runs on the owning thread.
class Dispatcher {
public:
    using Task = std::function<void()>;
    using TimerId = unsigned int;

    virtual ~Dispatcher() = default;

    virtual void post(Task task) = 0;
    virtual TimerId scheduleEvery(std::chrono::milliseconds interval, Task task) = 0;
    virtual TimerId scheduleOnce(std::chrono::milliseconds delay, Task task) = 0;
    // Only valid for a repeating timer or a one-shot that has not fired yet
    virtual void cancel(TimerId id) = 0;
};

// Runs tasks on the default GLib main context
class GlibDispatcher : public Dispatcher {
public:
    void post(Task task) override;
    TimerId scheduleEvery(std::chrono::milliseconds interval, Task task) override;
    TimerId scheduleOnce(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;
};

}
