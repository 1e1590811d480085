#include "utils/Dispatcher.hpp"
#include <glib.h>
#include <spdlog/spdlog.h>
#include <exception>

namespace ShareMonitor {

namespace {

void runTask(Dispatcher::Task* task) {
    try {
        (*task)();
    } catch (const std::exception& e) {
        spdlog::error("DISPATCH: task failed on main loop: {}", e.what());
    }
}

gboolean runOnce(gpointer data) {
    runTask(static_cast<Dispatcher::Task*>(data));
    return G_SOURCE_REMOVE;
}

gboolean runRepeating(gpointer data) {
    runTask(static_cast<Dispatcher::Task*>(data));
    return G_SOURCE_CONTINUE;
}

void deleteTask(gpointer data) {
    delete static_cast<Dispatcher::Task*>(data);
}

guint toInterval(std::chrono::milliseconds ms) {
    return ms.count() < 0 ? 0u : static_cast<guint>(ms.count());
}

}

void GlibDispatcher::post(Task task) {
    g_idle_add_full(G_PRIORITY_DEFAULT_IDLE, runOnce, new Task(std::move(task)), deleteTask);
}

Dispatcher::TimerId GlibDispatcher::scheduleEvery(std::chrono::milliseconds interval, Task task) {
    return g_timeout_add_full(G_PRIORITY_DEFAULT, toInterval(interval), runRepeating,
                              new Task(std::move(task)), deleteTask);
}

Dispatcher::TimerId GlibDispatcher::scheduleOnce(std::chrono::milliseconds delay, Task task) {
    return g_timeout_add_full(G_PRIORITY_DEFAULT, toInterval(delay), runOnce,
                              new Task(std::move(task)), deleteTask);
}

void GlibDispatcher::cancel(TimerId id) {
    if (id > 0) g_source_remove(id);
}

}
