#include "mailbridge/shutdown_signal.hpp"

ShutdownSignal::ShutdownSignal() : requested(false) {
}

void ShutdownSignal::requestShutdown() {
    std::vector<std::function<void()>> toRun;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (requested) {
            return;
        }
        requested = true;
        toRun.swap(handlers);
    }
    cv.notify_all();

    for (auto & handler : toRun) {
        handler();
    }
}

bool ShutdownSignal::isShutdownRequested() const {
    return requested;
}

bool ShutdownSignal::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mtx);
    return !cv.wait_for(lock, duration, [this]() { return requested.load(); });
}

void ShutdownSignal::addShutdownHandler(std::function<void()> handler) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!requested) {
            handlers.push_back(handler);
            return;
        }
    }
    handler();
}
