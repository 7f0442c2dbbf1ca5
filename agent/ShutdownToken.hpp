// Cooperative stop request shared between the signal handler and the loop.
#pragma once
#include <atomic>

class ShutdownToken {
public:
    // Async-signal-safe: only a lock-free atomic store.
    void requestStop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }

private:
    std::atomic<bool> stop_{false};
};
